#pragma once

#include "metacal/config/configuration.hpp"
#include "metacal/core/types.hpp"
#include "metacal/image/engine.hpp"
#include "metacal/observation/observation.hpp"
#include "metacal/pipeline/symmetrization_cache.hpp"

#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace metacal::pipeline {

struct TargetPsf {
    Matrix2Dd image;            // drawn on the input PSF image grid
    image::ProfilePtr model;    // un-drawn, used to reconvolve the galaxy
    double dilation = 1.0;
};

struct TargetImage {
    Matrix2Dd image;
    std::optional<double> whitened_variance;
    std::optional<double> symmetrized_variance;
};

// Dilation applied to the pixel-free PSF for a given shear
double dilation_for(const Shape& shear);

// Produces artificially sheared versions of an observation: the galaxy is
// deconvolved by its PSF, sheared, and reconvolved by a slightly dilated PSF.
// The configuration is validated on construction.
class Metacal {
public:
    Metacal(const Observation& obs,
            std::shared_ptr<const image::ImageEngine> engine,
            const config::Config& cfg = config::Config(),
            std::shared_ptr<SymmetrizationCache> cache = nullptr);

    Observation get_obs_galshear(const Shape& shear);
    // (sheared, unsheared) drawn with the same target PSF
    std::pair<Observation, Observation> get_obs_galshear_with_unsheared(const Shape& shear);
    Observation get_obs_psfshear(const Shape& shear);
    Observation get_obs_dilated_only(const Shape& shear);

    // Standard set keyed by type name: noshear, 1p, 1m, 2p, 2m, 1p_psf, ...
    std::map<std::string, Observation> get_all(double step, const std::vector<std::string>& types);
    std::map<std::string, Observation> get_all();

    TargetPsf get_target_psf(const Shape& shear, TargetPsfMode mode) const;
    TargetImage get_target_image(const image::ProfilePtr& psf_model,
                                 const std::optional<Shape>& shear);

    double pixel_scale() const { return pixel_scale_; }
    // 1/median(weight); only set when whitening or symmetrizing
    std::optional<double> noise_variance() const { return med_var_; }
    const std::shared_ptr<SymmetrizationCache>& cache() const { return cache_; }

private:
    void symmetrize_noise(SymmetrizeType type, TargetImage& target,
                          const image::ProfilePtr& psf_target, const Shape& shear);
    Observation make_obs(const TargetImage& image, const Matrix2Dd& psf_image) const;

    Observation obs_;
    std::shared_ptr<const image::ImageEngine> engine_;
    config::MetacalConfig mcfg_;
    config::InterpolantConfig interp_;
    config::NoiseConfig noise_;
    bool verbose_cache_;
    std::shared_ptr<SymmetrizationCache> cache_;

    double pixel_scale_;
    image::ProfilePtr pixel_;
    image::ProfilePtr psf_int_;
    image::ProfilePtr psf_int_nopix_;
    image::ProfilePtr psf_int_inv_;
    image::ProfilePtr image_int_;
    image::ProfilePtr image_int_nopsf_;

    std::optional<double> med_var_;
    double med_err_ = 0.0;

    std::mt19937 rng_;
    std::mt19937 noise_rng_;
    std::mt19937 sym_rng_;
    std::uint32_t noise_seed_ = 0;
};

} // namespace metacal::pipeline
