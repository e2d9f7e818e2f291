#include "metacal/image/kprofiles.hpp"
#include "metacal/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

#include <opencv2/core.hpp>

namespace metacal::image {

namespace {

constexpr double kDeconvolutionFloor = 1.0e-6;

// Gaussian transform below 1e-10 of its peak
const double kGaussianKCut = std::sqrt(2.0 * std::log(1.0e10));

double sinc_k(double x) {
    if (std::abs(x) < 1.0e-8) return 1.0 - x * x / 6.0;
    return std::sin(x) / x;
}

int wrap_index(int q, int n) {
    int r = q % n;
    return r < 0 ? r + n : r;
}

} // namespace

InterpolatedImage::InterpolatedImage(const Matrix2Dd& image, double scale,
                                     std::shared_ptr<const Lanczos> interpolant,
                                     int pad_factor)
    : rows_(static_cast<int>(image.rows())), cols_(static_cast<int>(image.cols())),
      scale_(scale), interpolant_(std::move(interpolant)) {
    if (rows_ < 1 || cols_ < 1) {
        throw ValidationError("interpolated image must be non-empty, got " + shape_of(image));
    }
    if (!(scale > 0.0)) {
        throw ValidationError("pixel scale must be > 0, got " + std::to_string(scale));
    }
    if (!interpolant_) {
        throw ValidationError("interpolated image requires an interpolant");
    }
    if (pad_factor < 1) pad_factor = 1;

    padded_rows_ = cv::getOptimalDFTSize(pad_factor * rows_);
    padded_cols_ = cv::getOptimalDFTSize(pad_factor * cols_);
    dk_row_ = 2.0 * CV_PI / (padded_rows_ * scale_);
    dk_col_ = 2.0 * CV_PI / (padded_cols_ * scale_);

    // Pixel index rows/2 maps to DFT index 0; the true center is half a
    // pixel below it for even sizes
    const int h1 = rows_ / 2;
    const int h2 = cols_ / 2;
    offset_row_ = h1 - 0.5 * (rows_ - 1);
    offset_col_ = h2 - 0.5 * (cols_ - 1);

    cv::Mat padded = cv::Mat::zeros(padded_rows_, padded_cols_, CV_64F);
    for (int i = 0; i < rows_; ++i) {
        for (int j = 0; j < cols_; ++j) {
            padded.at<double>(wrap_index(i - h1, padded_rows_),
                              wrap_index(j - h2, padded_cols_)) = image(i, j);
        }
    }

    cv::Mat F;
    cv::dft(padded, F, cv::DFT_COMPLEX_OUTPUT);

    spectrum_.resize(static_cast<size_t>(padded_rows_) * static_cast<size_t>(padded_cols_));
    for (int q1 = 0; q1 < padded_rows_; ++q1) {
        for (int q2 = 0; q2 < padded_cols_; ++q2) {
            const cv::Vec2d v = F.at<cv::Vec2d>(q1, q2);
            spectrum_[static_cast<size_t>(q1) * static_cast<size_t>(padded_cols_) +
                      static_cast<size_t>(q2)] = Complex(v[0], v[1]);
        }
    }
}

Complex InterpolatedImage::grid_value(int q1, int q2) const {
    const int r = wrap_index(q1, padded_rows_);
    const int c = wrap_index(q2, padded_cols_);
    return spectrum_[static_cast<size_t>(r) * static_cast<size_t>(padded_cols_) +
                     static_cast<size_t>(c)];
}

Complex InterpolatedImage::kvalue(double kx, double ky) const {
    const double wx = interpolant_->uval(kx * scale_);
    if (wx == 0.0) return Complex(0.0, 0.0);
    const double wy = interpolant_->uval(ky * scale_);
    if (wy == 0.0) return Complex(0.0, 0.0);

    const double fy = ky / dk_row_;
    const double fx = kx / dk_col_;
    const int iy = static_cast<int>(std::floor(fy));
    const int ix = static_cast<int>(std::floor(fx));

    double wrow[4];
    double wcol[4];
    for (int a = 0; a < 4; ++a) {
        wrow[a] = cubic_weight(fy - (iy + a - 1));
        wcol[a] = cubic_weight(fx - (ix + a - 1));
    }

    Complex sum(0.0, 0.0);
    for (int a = 0; a < 4; ++a) {
        if (wrow[a] == 0.0) continue;
        Complex row_sum(0.0, 0.0);
        for (int b = 0; b < 4; ++b) {
            if (wcol[b] == 0.0) continue;
            row_sum += wcol[b] * grid_value(iy + a - 1, ix + b - 1);
        }
        sum += wrow[a] * row_sum;
    }

    const double arg = -(kx * offset_col_ + ky * offset_row_) * scale_;
    return sum * Complex(std::cos(arg), std::sin(arg)) * (wx * wy);
}

double InterpolatedImage::max_k() const {
    // Square support in k; the radial bound covers its corners
    return std::sqrt(2.0) * interpolant_->umax() / scale_;
}

std::string InterpolatedImage::describe() const {
    std::ostringstream oss;
    oss << "InterpolatedImage(" << rows_ << "x" << cols_ << ", scale=" << scale_
        << ", lanczos=" << interpolant_->order() << ")";
    return oss.str();
}

PixelProfile::PixelProfile(double scale) : scale_(scale) {
    if (!(scale > 0.0)) {
        throw ValidationError("pixel scale must be > 0, got " + std::to_string(scale));
    }
}

Complex PixelProfile::kvalue(double kx, double ky) const {
    return Complex(sinc_k(0.5 * kx * scale_) * sinc_k(0.5 * ky * scale_), 0.0);
}

double PixelProfile::max_k() const {
    return std::numeric_limits<double>::infinity();
}

std::string PixelProfile::describe() const {
    std::ostringstream oss;
    oss << "Pixel(" << scale_ << ")";
    return oss.str();
}

GaussianProfile::GaussianProfile(double sigma, double flux) : sigma_(sigma), flux_(flux) {
    if (!(sigma > 0.0)) {
        throw ValidationError("gaussian sigma must be > 0, got " + std::to_string(sigma));
    }
}

Complex GaussianProfile::kvalue(double kx, double ky) const {
    const double ksq = kx * kx + ky * ky;
    return Complex(flux_ * std::exp(-0.5 * sigma_ * sigma_ * ksq), 0.0);
}

double GaussianProfile::max_k() const {
    return kGaussianKCut / sigma_;
}

std::string GaussianProfile::describe() const {
    std::ostringstream oss;
    oss << "Gaussian(sigma=" << sigma_ << ", flux=" << flux_ << ")";
    return oss.str();
}

Convolution::Convolution(ProfilePtr a, ProfilePtr b) : a_(std::move(a)), b_(std::move(b)) {
    if (!a_ || !b_) {
        throw ValidationError("cannot convolve a null profile");
    }
    max_k_ = std::min(a_->max_k(), b_->max_k());
}

Complex Convolution::kvalue(double kx, double ky) const {
    if (kx * kx + ky * ky > max_k_ * max_k_) return Complex(0.0, 0.0);
    const Complex va = a_->kvalue(kx, ky);
    if (va == Complex(0.0, 0.0)) return va;
    return va * b_->kvalue(kx, ky);
}

double Convolution::max_k() const {
    return max_k_;
}

std::string Convolution::describe() const {
    return "Convolve(" + a_->describe() + ", " + b_->describe() + ")";
}

Deconvolution::Deconvolution(ProfilePtr adaptee) : adaptee_(std::move(adaptee)) {
    if (!adaptee_) {
        throw ValidationError("cannot deconvolve a null profile");
    }
    const double peak = std::abs(adaptee_->kvalue(0.0, 0.0));
    if (!(peak > 0.0)) {
        throw NumericalError("cannot deconvolve a profile with zero flux: " + adaptee_->describe());
    }
    floor_ = kDeconvolutionFloor * peak;
}

Complex Deconvolution::kvalue(double kx, double ky) const {
    const double mk = adaptee_->max_k();
    if (kx * kx + ky * ky > mk * mk) return Complex(0.0, 0.0);
    const Complex v = adaptee_->kvalue(kx, ky);
    if (std::abs(v) <= floor_) return Complex(0.0, 0.0);
    return 1.0 / v;
}

double Deconvolution::max_k() const {
    return adaptee_->max_k();
}

std::string Deconvolution::describe() const {
    return "Deconvolve(" + adaptee_->describe() + ")";
}

AutoCorrelation::AutoCorrelation(ProfilePtr adaptee) : adaptee_(std::move(adaptee)) {
    if (!adaptee_) {
        throw ValidationError("cannot autocorrelate a null profile");
    }
}

Complex AutoCorrelation::kvalue(double kx, double ky) const {
    return Complex(std::norm(adaptee_->kvalue(kx, ky)), 0.0);
}

double AutoCorrelation::max_k() const {
    return adaptee_->max_k();
}

std::string AutoCorrelation::describe() const {
    return "AutoCorrelation(" + adaptee_->describe() + ")";
}

Transformation::Transformation(ProfilePtr adaptee, const Eigen::Matrix2d& jac, std::string label)
    : adaptee_(std::move(adaptee)), jac_(jac), label_(std::move(label)) {
    if (!adaptee_) {
        throw ValidationError("cannot transform a null profile");
    }
    Eigen::JacobiSVD<Eigen::Matrix2d> svd(jac_);
    const double smin = svd.singularValues()(1);
    if (!(smin > 0.0)) {
        throw NumericalError("singular transformation for " + label_);
    }
    max_k_ = adaptee_->max_k() / smin;
}

Complex Transformation::kvalue(double kx, double ky) const {
    const double ux = jac_(0, 0) * kx + jac_(1, 0) * ky;
    const double uy = jac_(0, 1) * kx + jac_(1, 1) * ky;
    return adaptee_->kvalue(ux, uy);
}

double Transformation::max_k() const {
    return max_k_;
}

std::string Transformation::describe() const {
    return label_ + "[" + adaptee_->describe() + "]";
}

Eigen::Matrix2d shear_matrix(const Shape& shear) {
    check_shear(shear);
    const double norm = 1.0 / std::sqrt(1.0 - shear.g1 * shear.g1 - shear.g2 * shear.g2);
    Eigen::Matrix2d m;
    m << 1.0 + shear.g1, shear.g2,
         shear.g2, 1.0 - shear.g1;
    return norm * m;
}

} // namespace metacal::image
