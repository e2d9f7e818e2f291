#include "metacal/image/interpolant.hpp"
#include "metacal/core/errors.hpp"

#include <algorithm>
#include <cmath>

namespace metacal::image {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr int kSamplesPerPixel = 64;
constexpr double kTableExtent = 6.0 * kPi;
constexpr int kTableSize = 1536;

double sinc(double x) {
    if (std::abs(x) < 1.0e-12) return 1.0;
    const double px = kPi * x;
    return std::sin(px) / px;
}

} // namespace

Lanczos::Lanczos(int order, bool conserve_dc, double tolerance)
    : order_(order), conserve_dc_(conserve_dc),
      du_(kTableExtent / kTableSize), umax_(0.0) {
    if (order < 1) {
        throw ValidationError("Lanczos order must be >= 1, got " + std::to_string(order));
    }
    if (!(tolerance > 0.0)) {
        throw ValidationError("Lanczos tolerance must be > 0");
    }

    // Kernel samples on [0, order] for Simpson integration
    const int nx = kSamplesPerPixel * order_;
    const double h = 1.0 / kSamplesPerPixel;
    std::vector<double> kx(static_cast<size_t>(nx) + 1);
    for (int i = 0; i <= nx; ++i) {
        kx[static_cast<size_t>(i)] = xval(i * h);
    }

    utab_.resize(static_cast<size_t>(kTableSize) + 1);
    for (int iu = 0; iu <= kTableSize; ++iu) {
        const double u = iu * du_;
        double sum = 0.0;
        for (int i = 0; i <= nx; ++i) {
            const double w = (i == 0 || i == nx) ? 1.0 : ((i % 2) ? 4.0 : 2.0);
            sum += w * kx[static_cast<size_t>(i)] * std::cos(u * i * h);
        }
        // Even kernel: integral over [-n, n] is twice the half-range
        utab_[static_cast<size_t>(iu)] = 2.0 * sum * h / 3.0;
    }

    for (int iu = kTableSize; iu >= 0; --iu) {
        if (std::abs(utab_[static_cast<size_t>(iu)]) > tolerance) {
            umax_ = std::min(kTableExtent, (iu + 1) * du_);
            break;
        }
    }
}

double Lanczos::raw(double x) const {
    const double ax = std::abs(x);
    if (ax >= order_) return 0.0;
    return sinc(ax) * sinc(ax / order_);
}

double Lanczos::xval(double x) const {
    const double r = raw(x);
    if (!conserve_dc_ || r == 0.0) return r;

    // Periodic normalization so integer-shift weights sum to one
    const double base = std::floor(x);
    double s = 0.0;
    for (int j = -order_ - 1; j <= order_ + 1; ++j) {
        s += raw(x - (base + j));
    }
    return r / s;
}

double Lanczos::uval(double u) const {
    const double au = std::abs(u);
    if (au >= umax_) return 0.0;
    const double pos = au / du_;
    const auto i0 = static_cast<size_t>(pos);
    if (i0 + 1 >= utab_.size()) return utab_.back();
    const double t = pos - static_cast<double>(i0);
    return (1.0 - t) * utab_[i0] + t * utab_[i0 + 1];
}

double cubic_weight(double t) {
    const double at = std::abs(t);
    if (at <= 1.0) {
        return (1.5 * at - 2.5) * at * at + 1.0;
    }
    if (at < 2.0) {
        return ((-0.5 * at + 2.5) * at - 4.0) * at + 2.0;
    }
    return 0.0;
}

} // namespace metacal::image
