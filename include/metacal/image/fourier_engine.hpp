#pragma once

#include "metacal/image/engine.hpp"
#include "metacal/image/interpolant.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <tuple>

namespace metacal::image {

// k-space implementation of ImageEngine on top of cv::dft
class FourierEngine : public ImageEngine {
public:
    explicit FourierEngine(const config::FourierConfig& fourier = config::FourierConfig(),
                           const config::NoiseConfig& noise = config::NoiseConfig());

    ProfilePtr interpolated_image(const Matrix2Dd& image, double scale,
                                  const config::InterpolantConfig& interp) const override;
    ProfilePtr pixel(double scale) const override;
    ProfilePtr gaussian(double sigma, double flux) const override;
    ProfilePtr deconvolve(const ProfilePtr& p) const override;
    ProfilePtr convolve(const ProfilePtr& a, const ProfilePtr& b) const override;
    ProfilePtr shear(const ProfilePtr& p, const Shape& shear) const override;
    ProfilePtr dilate(const ProfilePtr& p, double factor) const override;

    Matrix2Dd draw(const ProfilePtr& p, int rows, int cols, double scale) const override;

    Matrix2Dd gaussian_noise(int rows, int cols, double sigma, std::mt19937& rng) const override;
    CorrelatedNoise white_noise(double variance, double scale) const override;
    CorrelatedNoise estimate_correlated_noise(const Matrix2Dd& image, double scale) const override;
    CorrelatedNoise convolve_noise(const CorrelatedNoise& noise, const ProfilePtr& p) const override;
    CorrelatedNoise shear_noise(const CorrelatedNoise& noise, const Shape& shear) const override;

    double whiten(Matrix2Dd& image, const CorrelatedNoise& noise, double scale,
                  std::mt19937& rng) const override;
    double symmetrize(Matrix2Dd& image, const CorrelatedNoise& noise, double scale,
                      int order, std::mt19937& rng) const override;

    // Discrete power spectrum of the noise on a rows x cols grid, DFT order
    Matrix2Dd noise_power_spectrum(const CorrelatedNoise& noise, int rows, int cols,
                                   double scale) const;

private:
    std::shared_ptr<const Lanczos> lanczos(const config::InterpolantConfig& interp) const;
    Complex folded_kvalue(const Profile& p, double kx, double ky, double scale) const;
    Matrix2Dd correlated_field(const Matrix2Dd& power, std::mt19937& rng) const;

    config::FourierConfig fourier_;
    config::NoiseConfig noise_;

    mutable std::mutex lanczos_mutex_;
    mutable std::map<std::tuple<int, bool, double>, std::shared_ptr<const Lanczos>> lanczos_cache_;
};

} // namespace metacal::image
