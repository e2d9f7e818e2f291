#pragma once

#include "metacal/config/configuration.hpp"
#include "metacal/image/engine.hpp"
#include "metacal/observation/observation.hpp"

#include <random>

namespace metacal::pipeline {

// Gaussian galaxy convolved with a Gaussian PSF, both drawn with the pixel
// response. Adds noise and sets a matching weight when noise_sigma > 0.
Observation make_sim_observation(const config::SimulationConfig& sim,
                                 const image::ImageEngine& engine,
                                 std::mt19937& rng);

// Noise-free reference for a metacal output: the galaxy sheared by `shear`
// before the PSF, with the PSF dilated the way the pipeline dilates it.
Observation make_sheared_reference(const config::SimulationConfig& sim,
                                   const image::ImageEngine& engine,
                                   const Shape& shear);

// Ellipticity (e1, e2) from second moments under a round Gaussian weight
// of width weight_sigma (sky units) centered on the jacobian center
Shape weighted_ellipticity(const Observation& obs, double weight_sigma);

} // namespace metacal::pipeline
