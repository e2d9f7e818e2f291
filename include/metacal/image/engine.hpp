#pragma once

#include "metacal/config/configuration.hpp"
#include "metacal/core/types.hpp"
#include "metacal/image/profile.hpp"

#include <random>

namespace metacal::image {

// Continuous-profile operations the metacal pipeline needs from an
// image-manipulation library. Implementations must be usable through a
// const reference; random draws go through the caller's generator.
class ImageEngine {
public:
    virtual ~ImageEngine() = default;

    virtual ProfilePtr interpolated_image(const Matrix2Dd& image, double scale,
                                          const config::InterpolantConfig& interp) const = 0;
    virtual ProfilePtr pixel(double scale) const = 0;
    virtual ProfilePtr gaussian(double sigma, double flux) const = 0;
    virtual ProfilePtr deconvolve(const ProfilePtr& p) const = 0;
    virtual ProfilePtr convolve(const ProfilePtr& a, const ProfilePtr& b) const = 0;
    virtual ProfilePtr shear(const ProfilePtr& p, const Shape& shear) const = 0;
    virtual ProfilePtr dilate(const ProfilePtr& p, double factor) const = 0;

    // Surface brightness times pixel area at pixel centers, no pixel
    // response added; profile origin at ((rows-1)/2, (cols-1)/2)
    virtual Matrix2Dd draw(const ProfilePtr& p, int rows, int cols, double scale) const = 0;

    virtual Matrix2Dd gaussian_noise(int rows, int cols, double sigma, std::mt19937& rng) const = 0;
    virtual CorrelatedNoise white_noise(double variance, double scale) const = 0;
    virtual CorrelatedNoise estimate_correlated_noise(const Matrix2Dd& image, double scale) const = 0;
    virtual CorrelatedNoise convolve_noise(const CorrelatedNoise& noise, const ProfilePtr& p) const = 0;
    virtual CorrelatedNoise shear_noise(const CorrelatedNoise& noise, const Shape& shear) const = 0;

    // Both add noise to image in place and return the resulting total variance
    virtual double whiten(Matrix2Dd& image, const CorrelatedNoise& noise, double scale,
                          std::mt19937& rng) const = 0;
    virtual double symmetrize(Matrix2Dd& image, const CorrelatedNoise& noise, double scale,
                              int order, std::mt19937& rng) const = 0;
};

} // namespace metacal::image
