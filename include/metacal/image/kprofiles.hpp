#pragma once

#include "metacal/core/types.hpp"
#include "metacal/image/interpolant.hpp"
#include "metacal/image/profile.hpp"

#include <vector>

namespace metacal::image {

// Image sampled on a pixel grid, interpolated with a Lanczos kernel.
// The profile origin sits at the true image center ((rows-1)/2, (cols-1)/2).
class InterpolatedImage : public Profile {
public:
    InterpolatedImage(const Matrix2Dd& image, double scale,
                      std::shared_ptr<const Lanczos> interpolant, int pad_factor);

    Complex kvalue(double kx, double ky) const override;
    double max_k() const override;
    std::string describe() const override;

    int rows() const { return rows_; }
    int cols() const { return cols_; }

private:
    Complex grid_value(int q1, int q2) const;

    int rows_;
    int cols_;
    int padded_rows_;
    int padded_cols_;
    double scale_;
    double dk_row_;
    double dk_col_;
    double offset_row_;
    double offset_col_;
    std::shared_ptr<const Lanczos> interpolant_;
    std::vector<Complex> spectrum_;
};

// Unit-flux square pixel response
class PixelProfile : public Profile {
public:
    explicit PixelProfile(double scale);

    Complex kvalue(double kx, double ky) const override;
    double max_k() const override;
    std::string describe() const override;

private:
    double scale_;
};

class GaussianProfile : public Profile {
public:
    GaussianProfile(double sigma, double flux);

    Complex kvalue(double kx, double ky) const override;
    double max_k() const override;
    std::string describe() const override;

private:
    double sigma_;
    double flux_;
};

class Convolution : public Profile {
public:
    Convolution(ProfilePtr a, ProfilePtr b);

    Complex kvalue(double kx, double ky) const override;
    double max_k() const override;
    std::string describe() const override;

private:
    ProfilePtr a_;
    ProfilePtr b_;
    double max_k_;
};

// 1/f(k) inside the adaptee's support and above a relative floor, else zero
class Deconvolution : public Profile {
public:
    explicit Deconvolution(ProfilePtr adaptee);

    Complex kvalue(double kx, double ky) const override;
    double max_k() const override;
    std::string describe() const override;

private:
    ProfilePtr adaptee_;
    double floor_;
};

// |f(k)|^2, the transform of f convolved with its mirror image
class AutoCorrelation : public Profile {
public:
    explicit AutoCorrelation(ProfilePtr adaptee);

    Complex kvalue(double kx, double ky) const override;
    double max_k() const override;
    std::string describe() const override;

private:
    ProfilePtr adaptee_;
};

// Linear map x' = A x with flux preserved: f'(k) = f(A^T k)
class Transformation : public Profile {
public:
    Transformation(ProfilePtr adaptee, const Eigen::Matrix2d& jac, std::string label);

    Complex kvalue(double kx, double ky) const override;
    double max_k() const override;
    std::string describe() const override;

private:
    ProfilePtr adaptee_;
    Eigen::Matrix2d jac_;
    double max_k_;
    std::string label_;
};

// Matrix of a reduced shear acting on (x, y) = (col, row) offsets
Eigen::Matrix2d shear_matrix(const Shape& shear);

} // namespace metacal::image
