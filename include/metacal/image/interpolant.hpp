#pragma once

#include <vector>

namespace metacal::image {

// Lanczos x-interpolant with a numerically tabulated Fourier transform.
class Lanczos {
public:
    Lanczos(int order, bool conserve_dc, double tolerance);

    int order() const { return order_; }

    // Kernel value at an offset in pixels
    double xval(double x) const;

    // Transform at angular frequency u (radians per pixel), zero past umax()
    double uval(double u) const;

    double umax() const { return umax_; }

private:
    double raw(double x) const;

    int order_;
    bool conserve_dc_;
    double du_;
    double umax_;
    std::vector<double> utab_;
};

// Keys cubic convolution weight (a = -0.5)
double cubic_weight(double t);

} // namespace metacal::image
