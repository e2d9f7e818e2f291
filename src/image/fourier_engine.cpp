#include "metacal/image/fourier_engine.hpp"
#include "metacal/core/errors.hpp"
#include "metacal/image/kprofiles.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include <opencv2/core.hpp>

namespace metacal::image {

namespace {

int wrap_index(int q, int n) {
    int r = q % n;
    return r < 0 ? r + n : r;
}

// Signed frequency index for DFT position q of an n-point transform
int signed_index(int q, int n) {
    return q <= n / 2 ? q : q - n;
}

void check_grid(int rows, int cols, double scale, const char* what) {
    if (rows < 1 || cols < 1) {
        throw ValidationError(std::string(what) + ": grid must be non-empty, got [" +
                              std::to_string(rows) + ", " + std::to_string(cols) + "]");
    }
    if (!(scale > 0.0)) {
        throw ValidationError(std::string(what) + ": pixel scale must be > 0, got " +
                              std::to_string(scale));
    }
}

cv::Mat to_complex_dft(const Matrix2Dd& image) {
    cv::Mat src(static_cast<int>(image.rows()), static_cast<int>(image.cols()), CV_64F,
                const_cast<double*>(image.data()));
    cv::Mat F;
    cv::dft(src, F, cv::DFT_COMPLEX_OUTPUT);
    return F;
}

Matrix2Dd real_inverse_dft(const cv::Mat& F) {
    cv::Mat out;
    cv::dft(F, out, cv::DFT_INVERSE | cv::DFT_SCALE | cv::DFT_COMPLEX_OUTPUT);
    Matrix2Dd result(out.rows, out.cols);
    for (int r = 0; r < out.rows; ++r) {
        for (int c = 0; c < out.cols; ++c) {
            result(r, c) = out.at<cv::Vec2d>(r, c)[0];
        }
    }
    return result;
}

} // namespace

FourierEngine::FourierEngine(const config::FourierConfig& fourier, const config::NoiseConfig& noise)
    : fourier_(fourier), noise_(noise) {
    if (fourier_.pad_factor < 1) {
        throw ConfigError("fourier.pad_factor must be >= 1");
    }
    if (fourier_.alias_fold < 0) {
        throw ConfigError("fourier.alias_fold must be >= 0");
    }
}

std::shared_ptr<const Lanczos> FourierEngine::lanczos(const config::InterpolantConfig& interp) const {
    const auto key = std::make_tuple(interp.order, interp.conserve_dc, interp.tolerance);
    std::lock_guard<std::mutex> lock(lanczos_mutex_);
    auto it = lanczos_cache_.find(key);
    if (it != lanczos_cache_.end()) {
        return it->second;
    }
    auto kernel = std::make_shared<const Lanczos>(interp.order, interp.conserve_dc, interp.tolerance);
    lanczos_cache_.emplace(key, kernel);
    return kernel;
}

ProfilePtr FourierEngine::interpolated_image(const Matrix2Dd& image, double scale,
                                             const config::InterpolantConfig& interp) const {
    return std::make_shared<const InterpolatedImage>(image, scale, lanczos(interp),
                                                     fourier_.pad_factor);
}

ProfilePtr FourierEngine::pixel(double scale) const {
    return std::make_shared<const PixelProfile>(scale);
}

ProfilePtr FourierEngine::deconvolve(const ProfilePtr& p) const {
    return std::make_shared<const Deconvolution>(p);
}

ProfilePtr FourierEngine::convolve(const ProfilePtr& a, const ProfilePtr& b) const {
    return std::make_shared<const Convolution>(a, b);
}

ProfilePtr FourierEngine::shear(const ProfilePtr& p, const Shape& shear) const {
    return std::make_shared<const Transformation>(p, shear_matrix(shear),
                                                  "Shear" + shear.to_string());
}

ProfilePtr FourierEngine::dilate(const ProfilePtr& p, double factor) const {
    if (!(factor > 0.0) || !std::isfinite(factor)) {
        throw ValidationError("dilation factor must be finite and > 0, got " + std::to_string(factor));
    }
    std::ostringstream label;
    label << "Dilate(" << factor << ")";
    return std::make_shared<const Transformation>(p, factor * Eigen::Matrix2d::Identity(),
                                                  label.str());
}

ProfilePtr FourierEngine::gaussian(double sigma, double flux) const {
    return std::make_shared<const GaussianProfile>(sigma, flux);
}

Complex FourierEngine::folded_kvalue(const Profile& p, double kx, double ky, double scale) const {
    const double period = 2.0 * CV_PI / scale;
    const double mk = p.max_k();
    const int fold = fourier_.alias_fold;

    Complex v(0.0, 0.0);
    for (int a = -fold; a <= fold; ++a) {
        const double kyy = ky + a * period;
        for (int b = -fold; b <= fold; ++b) {
            const double kxx = kx + b * period;
            if (kxx * kxx + kyy * kyy > mk * mk) continue;
            v += p.kvalue(kxx, kyy);
        }
    }
    return v;
}

Matrix2Dd FourierEngine::draw(const ProfilePtr& p, int rows, int cols, double scale) const {
    if (!p) {
        throw ValidationError("cannot draw a null profile");
    }
    check_grid(rows, cols, scale, "draw");

    const int np1 = cv::getOptimalDFTSize(fourier_.pad_factor * rows);
    const int np2 = cv::getOptimalDFTSize(fourier_.pad_factor * cols);
    const double dk1 = 2.0 * CV_PI / (np1 * scale);
    const double dk2 = 2.0 * CV_PI / (np2 * scale);
    const double period = 2.0 * CV_PI / scale;
    const int h1 = rows / 2;
    const int h2 = cols / 2;
    const double o1 = h1 - 0.5 * (rows - 1);
    const double o2 = h2 - 0.5 * (cols - 1);
    const double mk = p->max_k();
    const int fold = fourier_.alias_fold;

    cv::Mat F(np1, np2, CV_64FC2);
    for (int q1 = 0; q1 < np1; ++q1) {
        const double ky = signed_index(q1, np1) * dk1;
        for (int q2 = 0; q2 < np2; ++q2) {
            const double kx = signed_index(q2, np2) * dk2;

            // Each alias term carries its own centering phase
            Complex v(0.0, 0.0);
            for (int a = -fold; a <= fold; ++a) {
                const double kyy = ky + a * period;
                for (int b = -fold; b <= fold; ++b) {
                    const double kxx = kx + b * period;
                    if (kxx * kxx + kyy * kyy > mk * mk) continue;
                    const Complex val = p->kvalue(kxx, kyy);
                    if (val == Complex(0.0, 0.0)) continue;
                    const double arg = (kxx * o2 + kyy * o1) * scale;
                    v += val * Complex(std::cos(arg), std::sin(arg));
                }
            }
            F.at<cv::Vec2d>(q1, q2) = cv::Vec2d(v.real(), v.imag());
        }
    }

    const Matrix2Dd full = real_inverse_dft(F);
    Matrix2Dd out(rows, cols);
    for (int i = 0; i < rows; ++i) {
        for (int j = 0; j < cols; ++j) {
            out(i, j) = full(wrap_index(i - h1, np1), wrap_index(j - h2, np2));
        }
    }
    return out;
}

Matrix2Dd FourierEngine::gaussian_noise(int rows, int cols, double sigma, std::mt19937& rng) const {
    if (rows < 1 || cols < 1) {
        throw ValidationError("gaussian_noise: grid must be non-empty");
    }
    if (!(sigma >= 0.0) || !std::isfinite(sigma)) {
        throw ValidationError("gaussian_noise: sigma must be finite and >= 0, got " +
                              std::to_string(sigma));
    }
    Matrix2Dd out(rows, cols);
    if (sigma == 0.0) {
        out.setZero();
        return out;
    }
    std::normal_distribution<double> dist(0.0, sigma);
    for (Eigen::Index i = 0; i < out.size(); ++i) {
        out.data()[i] = dist(rng);
    }
    return out;
}

CorrelatedNoise FourierEngine::white_noise(double variance, double scale) const {
    if (!(variance >= 0.0) || !std::isfinite(variance)) {
        throw ValidationError("white_noise: variance must be finite and >= 0, got " +
                              std::to_string(variance));
    }
    Matrix2Dd cf(1, 1);
    cf(0, 0) = variance;
    return CorrelatedNoise{interpolated_image(cf, scale, config::InterpolantConfig())};
}

CorrelatedNoise FourierEngine::estimate_correlated_noise(const Matrix2Dd& image, double scale) const {
    const int n1 = static_cast<int>(image.rows());
    const int n2 = static_cast<int>(image.cols());
    check_grid(n1, n2, scale, "estimate_correlated_noise");

    const Matrix2Dd centered = image.array() - image.mean();
    cv::Mat F = to_complex_dft(centered);

    // Periodogram, then its inverse transform is the periodic correlation function
    const double norm = 1.0 / (static_cast<double>(n1) * static_cast<double>(n2));
    for (int r = 0; r < F.rows; ++r) {
        for (int c = 0; c < F.cols; ++c) {
            cv::Vec2d& v = F.at<cv::Vec2d>(r, c);
            v = cv::Vec2d((v[0] * v[0] + v[1] * v[1]) * norm, 0.0);
        }
    }
    const Matrix2Dd periodic = real_inverse_dft(F);

    const int half = std::max(1, noise_.max_correlation_size / 2);
    const int r1 = std::min((n1 - 1) / 2, half);
    const int r2 = std::min((n2 - 1) / 2, half);
    Matrix2Dd cf(2 * r1 + 1, 2 * r2 + 1);
    for (int a = -r1; a <= r1; ++a) {
        for (int b = -r2; b <= r2; ++b) {
            cf(r1 + a, r2 + b) = periodic(wrap_index(a, n1), wrap_index(b, n2));
        }
    }
    return CorrelatedNoise{interpolated_image(cf, scale, config::InterpolantConfig())};
}

CorrelatedNoise FourierEngine::convolve_noise(const CorrelatedNoise& noise, const ProfilePtr& p) const {
    return CorrelatedNoise{convolve(noise.correlation, std::make_shared<const AutoCorrelation>(p))};
}

CorrelatedNoise FourierEngine::shear_noise(const CorrelatedNoise& noise, const Shape& g) const {
    return CorrelatedNoise{shear(noise.correlation, g)};
}

Matrix2Dd FourierEngine::noise_power_spectrum(const CorrelatedNoise& noise, int rows, int cols,
                                              double scale) const {
    if (!noise.correlation) {
        throw ValidationError("noise model has no correlation function");
    }
    check_grid(rows, cols, scale, "noise_power_spectrum");

    const double dk1 = 2.0 * CV_PI / (rows * scale);
    const double dk2 = 2.0 * CV_PI / (cols * scale);
    Matrix2Dd ps(rows, cols);
    for (int q1 = 0; q1 < rows; ++q1) {
        const double ky = signed_index(q1, rows) * dk1;
        for (int q2 = 0; q2 < cols; ++q2) {
            const double kx = signed_index(q2, cols) * dk2;
            ps(q1, q2) = std::max(0.0, folded_kvalue(*noise.correlation, kx, ky, scale).real());
        }
    }
    return ps;
}

Matrix2Dd FourierEngine::correlated_field(const Matrix2Dd& power, std::mt19937& rng) const {
    const Matrix2Dd white = gaussian_noise(static_cast<int>(power.rows()),
                                           static_cast<int>(power.cols()), 1.0, rng);
    cv::Mat F = to_complex_dft(white);
    for (int r = 0; r < F.rows; ++r) {
        for (int c = 0; c < F.cols; ++c) {
            F.at<cv::Vec2d>(r, c) *= std::sqrt(std::max(0.0, power(r, c)));
        }
    }
    return real_inverse_dft(F);
}

double FourierEngine::whiten(Matrix2Dd& image, const CorrelatedNoise& noise, double scale,
                             std::mt19937& rng) const {
    const Matrix2Dd ps = noise_power_spectrum(noise, static_cast<int>(image.rows()),
                                              static_cast<int>(image.cols()), scale);
    const double target = ps.maxCoeff();
    const Matrix2Dd add = (target - ps.array()).matrix();
    image += correlated_field(add, rng);
    return target;
}

double FourierEngine::symmetrize(Matrix2Dd& image, const CorrelatedNoise& noise, double scale,
                                 int order, std::mt19937& rng) const {
    if (order < 4 || (order % 2) != 0) {
        throw ValidationError("symmetrization order must be even and >= 4, got " +
                              std::to_string(order));
    }
    if (!noise.correlation) {
        throw ValidationError("noise model has no correlation function");
    }
    const int rows = static_cast<int>(image.rows());
    const int cols = static_cast<int>(image.cols());
    check_grid(rows, cols, scale, "symmetrize");

    const double dk1 = 2.0 * CV_PI / (rows * scale);
    const double dk2 = 2.0 * CV_PI / (cols * scale);
    Matrix2Dd add(rows, cols);
    double target_sum = 0.0;
    for (int q1 = 0; q1 < rows; ++q1) {
        const double ky = signed_index(q1, rows) * dk1;
        for (int q2 = 0; q2 < cols; ++q2) {
            const double kx = signed_index(q2, cols) * dk2;
            const double p0 = std::max(0.0, folded_kvalue(*noise.correlation, kx, ky, scale).real());
            double target = p0;
            for (int m = 1; m < order; ++m) {
                const double theta = 2.0 * CV_PI * m / order;
                const double c = std::cos(theta);
                const double s = std::sin(theta);
                const double pr = folded_kvalue(*noise.correlation, c * kx - s * ky,
                                                s * kx + c * ky, scale).real();
                target = std::max(target, pr);
            }
            add(q1, q2) = target - p0;
            target_sum += target;
        }
    }
    image += correlated_field(add, rng);
    return target_sum / (static_cast<double>(rows) * static_cast<double>(cols));
}

} // namespace metacal::image
