#pragma once

#include "metacal/core/types.hpp"

#include <utility>

namespace metacal {

// Linear map from pixel offsets (row, col) about (row0, col0) to sky (u, v):
//   u = dudrow*(row-row0) + dudcol*(col-col0)
//   v = dvdrow*(row-row0) + dvdcol*(col-col0)
class Jacobian {
public:
    Jacobian(double row0, double col0,
             double dudrow, double dudcol, double dvdrow, double dvdcol);

    static Jacobian unit(double row0, double col0);
    static Jacobian diagonal(double row0, double col0, double scale);
    // Unit jacobian centered on the true center of an image
    static Jacobian centered(int rows, int cols, double scale = 1.0);

    double row0() const { return row0_; }
    double col0() const { return col0_; }
    double dudrow() const { return dudrow_; }
    double dudcol() const { return dudcol_; }
    double dvdrow() const { return dvdrow_; }
    double dvdcol() const { return dvdcol_; }

    double det() const;
    double scale() const;
    double max_linear_scale() const;
    Eigen::Matrix2d matrix() const;

    // (u, v) of a pixel position
    std::pair<double, double> uv_of(double row, double col) const;
    // (row, col) of a sky position
    std::pair<double, double> rowcol_of(double u, double v) const;

    bool operator==(const Jacobian& other) const;

private:
    double row0_;
    double col0_;
    double dudrow_;
    double dudcol_;
    double dvdrow_;
    double dvdcol_;
};

} // namespace metacal
