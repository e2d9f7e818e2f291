#include "metacal/observation/jacobian.hpp"
#include "metacal/core/errors.hpp"

#include <cmath>

namespace metacal {

Jacobian::Jacobian(double row0, double col0,
                   double dudrow, double dudcol, double dvdrow, double dvdcol)
    : row0_(row0), col0_(col0),
      dudrow_(dudrow), dudcol_(dudcol), dvdrow_(dvdrow), dvdcol_(dvdcol) {
    if (!std::isfinite(row0) || !std::isfinite(col0) ||
        !std::isfinite(dudrow) || !std::isfinite(dudcol) ||
        !std::isfinite(dvdrow) || !std::isfinite(dvdcol)) {
        throw ValidationError("jacobian entries must be finite");
    }
    if (det() == 0.0) {
        throw ValidationError("jacobian is singular: [[" + std::to_string(dudrow) + ", " +
                              std::to_string(dudcol) + "], [" + std::to_string(dvdrow) + ", " +
                              std::to_string(dvdcol) + "]]");
    }
}

Jacobian Jacobian::unit(double row0, double col0) {
    return Jacobian(row0, col0, 1.0, 0.0, 0.0, 1.0);
}

Jacobian Jacobian::diagonal(double row0, double col0, double scale) {
    return Jacobian(row0, col0, scale, 0.0, 0.0, scale);
}

Jacobian Jacobian::centered(int rows, int cols, double scale) {
    return diagonal(0.5 * (rows - 1), 0.5 * (cols - 1), scale);
}

double Jacobian::det() const {
    return dudrow_ * dvdcol_ - dudcol_ * dvdrow_;
}

double Jacobian::scale() const {
    return std::sqrt(std::abs(det()));
}

double Jacobian::max_linear_scale() const {
    Eigen::JacobiSVD<Eigen::Matrix2d> svd(matrix());
    return svd.singularValues()(0);
}

Eigen::Matrix2d Jacobian::matrix() const {
    Eigen::Matrix2d m;
    m << dudrow_, dudcol_,
         dvdrow_, dvdcol_;
    return m;
}

std::pair<double, double> Jacobian::uv_of(double row, double col) const {
    const double dr = row - row0_;
    const double dc = col - col0_;
    return {dudrow_ * dr + dudcol_ * dc, dvdrow_ * dr + dvdcol_ * dc};
}

std::pair<double, double> Jacobian::rowcol_of(double u, double v) const {
    const double idet = 1.0 / det();
    const double dr = idet * (dvdcol_ * u - dudcol_ * v);
    const double dc = idet * (-dvdrow_ * u + dudrow_ * v);
    return {row0_ + dr, col0_ + dc};
}

bool Jacobian::operator==(const Jacobian& other) const {
    return row0_ == other.row0_ && col0_ == other.col0_ &&
           dudrow_ == other.dudrow_ && dudcol_ == other.dudcol_ &&
           dvdrow_ == other.dvdrow_ && dvdcol_ == other.dvdcol_;
}

} // namespace metacal
