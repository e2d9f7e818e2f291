#include "metacal/pipeline/metacal.hpp"
#include "metacal/core/errors.hpp"
#include "metacal/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace metacal::pipeline {

namespace {

enum class ObsKind {
    NoShear,
    GalShear,
    PsfShear
};

struct TypeRequest {
    ObsKind kind;
    Shape shear;
};

TypeRequest parse_type(const std::string& name, double step) {
    if (name == "noshear") return {ObsKind::NoShear, Shape(step, 0.0)};

    std::string base = name;
    ObsKind kind = ObsKind::GalShear;
    const std::string psf_suffix = "_psf";
    if (base.size() > psf_suffix.size() &&
        base.compare(base.size() - psf_suffix.size(), psf_suffix.size(), psf_suffix) == 0) {
        kind = ObsKind::PsfShear;
        base = base.substr(0, base.size() - psf_suffix.size());
    }

    if (base == "1p") return {kind, Shape(step, 0.0)};
    if (base == "1m") return {kind, Shape(-step, 0.0)};
    if (base == "2p") return {kind, Shape(0.0, step)};
    if (base == "2m") return {kind, Shape(0.0, -step)};
    throw ConfigError("unknown metacal type '" + name + "'");
}

std::uint32_t seed_or_random(std::uint32_t seed) {
    if (seed != 0) return seed;
    std::random_device rd;
    return rd();
}

} // namespace

double dilation_for(const Shape& shear) {
    return 1.0 + 2.0 * std::max(std::abs(shear.g1), std::abs(shear.g2));
}

Metacal::Metacal(const Observation& obs,
                 std::shared_ptr<const image::ImageEngine> engine,
                 const config::Config& cfg,
                 std::shared_ptr<SymmetrizationCache> cache)
    : obs_(obs), engine_(std::move(engine)),
      mcfg_(cfg.metacal), interp_(cfg.interpolant), noise_(cfg.noise),
      verbose_cache_(cfg.cache.verbose), cache_(std::move(cache)),
      rng_(seed_or_random(cfg.metacal.seed)) {
    cfg.validate();
    if (!obs_.has_psf()) {
        throw ConfigError("observation must have a psf observation set");
    }
    if (!engine_) {
        throw ConfigError("metacal requires an image engine");
    }
    if (!cache_) {
        cache_ = std::make_shared<SymmetrizationCache>(cfg.cache.capacity);
    }

    pixel_scale_ = obs_.jacobian().max_linear_scale();
    pixel_ = engine_->pixel(pixel_scale_);

    psf_int_ = engine_->interpolated_image(obs_.psf().image(), pixel_scale_, interp_);
    psf_int_nopix_ = engine_->convolve(psf_int_, engine_->deconvolve(pixel_));
    psf_int_inv_ = engine_->deconvolve(psf_int_);

    image_int_ = engine_->interpolated_image(obs_.image(), pixel_scale_, interp_);

    if (mcfg_.whiten || mcfg_.symmetrize) {
        const double med_wt = core::compute_median(obs_.weight());
        if (!(med_wt > 0.0)) {
            throw ValidationError("median weight must be > 0 for noise handling, got " +
                                  std::to_string(med_wt));
        }
        med_var_ = 1.0 / med_wt;
        med_err_ = std::sqrt(*med_var_);
    }

    noise_rng_.seed(rng_());
    sym_rng_.seed(rng_());
    if (mcfg_.whiten && mcfg_.same_seed) {
        std::uniform_int_distribution<std::uint32_t> dist(0, (1u << 30) - 2);
        noise_seed_ = dist(rng_);
    }

    image_int_nopsf_ = engine_->convolve(image_int_, psf_int_inv_);
}

TargetPsf Metacal::get_target_psf(const Shape& shear, TargetPsfMode mode) const {
    check_shear(shear);

    TargetPsf target;
    target.dilation = dilation_for(shear);

    image::ProfilePtr grown = engine_->dilate(psf_int_nopix_, target.dilation);
    grown = engine_->convolve(grown, pixel_);

    switch (mode) {
        case TargetPsfMode::GalShear:
            break;
        case TargetPsfMode::PsfShear:
            // Shear the pixelized version
            grown = engine_->shear(grown, shear);
            break;
    }

    const Matrix2Dd& psf_image = obs_.psf().image();
    target.image = engine_->draw(grown, static_cast<int>(psf_image.rows()),
                                 static_cast<int>(psf_image.cols()), pixel_scale_);
    target.model = grown;
    return target;
}

TargetImage Metacal::get_target_image(const image::ProfilePtr& psf_model,
                                      const std::optional<Shape>& shear) {
    if (!psf_model) {
        throw ValidationError("target image requires a psf model");
    }

    image::ProfilePtr nopsf = image_int_nopsf_;
    if (shear) {
        check_shear(*shear);
        nopsf = engine_->shear(image_int_nopsf_, *shear);
    }
    const image::ProfilePtr conv = engine_->convolve(nopsf, psf_model);

    TargetImage target;
    target.image = engine_->draw(conv, obs_.rows(), obs_.cols(), pixel_scale_);

    if (mcfg_.whiten) {
        image::CorrelatedNoise cn = engine_->white_noise(*med_var_, pixel_scale_);
        cn = engine_->convolve_noise(cn, psf_int_inv_);
        if (shear) {
            cn = engine_->shear_noise(cn, *shear);
        }
        cn = engine_->convolve_noise(cn, psf_model);

        if (mcfg_.same_seed) {
            noise_rng_.seed(noise_seed_);
        }
        target.whitened_variance = engine_->whiten(target.image, cn, pixel_scale_, noise_rng_);
    }
    return target;
}

void Metacal::symmetrize_noise(SymmetrizeType type, TargetImage& target,
                               const image::ProfilePtr& psf_target, const Shape& shear) {
    const auto key = SymmetrizationKey::make(type, static_cast<int>(target.image.rows()),
                                             static_cast<int>(target.image.cols()), shear);
    if (auto cached = cache_->find(key)) {
        target.image += cached->diff;
        target.symmetrized_variance = cached->variance;
        return;
    }

    if (verbose_cache_) {
        std::cerr << "[SYMCACHE] miss " << symmetrize_type_to_string(type) << " "
                  << key.to_string() << std::endl;
    }

    const Matrix2Dd patch = engine_->gaussian_noise(noise_.patch_size, noise_.patch_size,
                                                    med_err_, sym_rng_);
    image::CorrelatedNoise cn = engine_->estimate_correlated_noise(patch, pixel_scale_);
    cn = engine_->convolve_noise(cn, psf_int_inv_);
    cn = engine_->shear_noise(cn, shear);
    cn = engine_->convolve_noise(cn, psf_target);

    SymmetrizedField field;
    Matrix2Dd symmetrized = target.image;
    field.variance = engine_->symmetrize(symmetrized, cn, pixel_scale_,
                                         noise_.symmetrize_order, sym_rng_);
    field.diff = symmetrized - target.image;

    target.image = std::move(symmetrized);
    target.symmetrized_variance = field.variance;
    cache_->insert(key, std::move(field));
}

Observation Metacal::make_obs(const TargetImage& image, const Matrix2Dd& psf_image) const {
    Observation psf_obs(psf_image, std::nullopt, obs_.jacobian());

    Observation newobs(image.image, obs_.weight(), obs_.jacobian());
    newobs.set_psf(std::move(psf_obs));
    if (obs_.has_bmask()) newobs.set_bmask(obs_.bmask());
    if (obs_.has_ormask()) newobs.set_ormask(obs_.ormask());
    if (image.whitened_variance) {
        newobs.update_meta(json{{"whitened_variance", *image.whitened_variance}});
    }
    if (image.symmetrized_variance) {
        newobs.update_meta(json{{"symmetrized_variance", *image.symmetrized_variance}});
    }
    return newobs;
}

Observation Metacal::get_obs_galshear(const Shape& shear) {
    const TargetPsf psf = get_target_psf(shear, TargetPsfMode::GalShear);
    TargetImage sheared = get_target_image(psf.model, shear);
    if (mcfg_.symmetrize) {
        symmetrize_noise(SymmetrizeType::Gal, sheared, psf.model, shear);
    }
    return make_obs(sheared, psf.image);
}

std::pair<Observation, Observation> Metacal::get_obs_galshear_with_unsheared(const Shape& shear) {
    const TargetPsf psf = get_target_psf(shear, TargetPsfMode::GalShear);

    TargetImage sheared = get_target_image(psf.model, shear);
    if (mcfg_.symmetrize) {
        symmetrize_noise(SymmetrizeType::Gal, sheared, psf.model, shear);
    }

    TargetImage unsheared = get_target_image(psf.model, std::nullopt);
    if (mcfg_.symmetrize) {
        symmetrize_noise(SymmetrizeType::Gal, unsheared, psf.model, Shape(0.0, 0.0));
    }

    return {make_obs(sheared, psf.image), make_obs(unsheared, psf.image)};
}

Observation Metacal::get_obs_psfshear(const Shape& shear) {
    const TargetPsf psf = get_target_psf(shear, TargetPsfMode::PsfShear);
    TargetImage conv = get_target_image(psf.model, std::nullopt);
    if (mcfg_.symmetrize) {
        symmetrize_noise(SymmetrizeType::Psf, conv, psf.model, shear);
    }
    return make_obs(conv, psf.image);
}

Observation Metacal::get_obs_dilated_only(const Shape& shear) {
    const TargetPsf psf = get_target_psf(shear, TargetPsfMode::GalShear);
    TargetImage unsheared = get_target_image(psf.model, std::nullopt);
    if (mcfg_.symmetrize) {
        symmetrize_noise(SymmetrizeType::Gal, unsheared, psf.model, Shape(0.0, 0.0));
    }
    return make_obs(unsheared, psf.image);
}

std::map<std::string, Observation> Metacal::get_all(double step,
                                                    const std::vector<std::string>& types) {
    if (!(step > 0.0 && step < 1.0)) {
        throw ValidationError("metacal step must be in (0, 1), got " + std::to_string(step));
    }

    // Parse everything before drawing anything
    std::vector<std::pair<std::string, TypeRequest>> requests;
    requests.reserve(types.size());
    for (const auto& name : types) {
        requests.emplace_back(name, parse_type(name, step));
    }

    std::map<std::string, Observation> out;
    for (const auto& [name, req] : requests) {
        switch (req.kind) {
            case ObsKind::NoShear:
                out.emplace(name, get_obs_dilated_only(req.shear));
                break;
            case ObsKind::GalShear:
                out.emplace(name, get_obs_galshear(req.shear));
                break;
            case ObsKind::PsfShear:
                out.emplace(name, get_obs_psfshear(req.shear));
                break;
        }
    }
    return out;
}

std::map<std::string, Observation> Metacal::get_all() {
    return get_all(mcfg_.step, mcfg_.types);
}

} // namespace metacal::pipeline
