#include "metacal/pipeline/simulation.hpp"
#include "metacal/pipeline/metacal.hpp"
#include "metacal/core/errors.hpp"

#include <cmath>

namespace metacal::pipeline {

namespace {

image::ProfilePtr sim_galaxy(const config::SimulationConfig& sim, const image::ImageEngine& engine) {
    image::ProfilePtr gal = engine.gaussian(sim.gal_sigma, sim.gal_flux);
    return engine.shear(gal, Shape(sim.gal_g1, sim.gal_g2));
}

image::ProfilePtr sim_psf(const config::SimulationConfig& sim, const image::ImageEngine& engine,
                          double dilation) {
    image::ProfilePtr psf = engine.gaussian(sim.psf_sigma * dilation, 1.0);
    return engine.shear(psf, Shape(sim.psf_g1, sim.psf_g2));
}

Observation draw_pair(const config::SimulationConfig& sim, const image::ImageEngine& engine,
                      const image::ProfilePtr& gal, const image::ProfilePtr& psf) {
    const image::ProfilePtr pixel = engine.pixel(sim.scale);

    Matrix2Dd psf_image = engine.draw(engine.convolve(psf, pixel), sim.rows, sim.cols, sim.scale);
    Matrix2Dd image = engine.draw(engine.convolve(engine.convolve(gal, psf), pixel),
                                  sim.rows, sim.cols, sim.scale);

    const Jacobian jac = Jacobian::centered(sim.rows, sim.cols, sim.scale);
    Observation obs(std::move(image), std::nullopt, jac);
    obs.set_psf(Observation(std::move(psf_image), std::nullopt, jac));
    return obs;
}

} // namespace

Observation make_sim_observation(const config::SimulationConfig& sim,
                                 const image::ImageEngine& engine,
                                 std::mt19937& rng) {
    Observation obs = draw_pair(sim, engine, sim_galaxy(sim, engine), sim_psf(sim, engine, 1.0));

    if (sim.noise_sigma > 0.0) {
        const Matrix2Dd noise = engine.gaussian_noise(sim.rows, sim.cols, sim.noise_sigma, rng);
        obs.set_image(obs.image() + noise);
        obs.set_weight(Matrix2Dd::Constant(sim.rows, sim.cols,
                                           1.0 / (sim.noise_sigma * sim.noise_sigma)));
    }
    obs.update_meta(json{{"sim_gal_g1", sim.gal_g1}, {"sim_gal_g2", sim.gal_g2}});
    return obs;
}

Observation make_sheared_reference(const config::SimulationConfig& sim,
                                   const image::ImageEngine& engine,
                                   const Shape& shear) {
    const image::ProfilePtr gal = engine.shear(sim_galaxy(sim, engine), shear);
    return draw_pair(sim, engine, gal, sim_psf(sim, engine, dilation_for(shear)));
}

Shape weighted_ellipticity(const Observation& obs, double weight_sigma) {
    if (!(weight_sigma > 0.0)) {
        throw ValidationError("weight sigma must be > 0, got " + std::to_string(weight_sigma));
    }
    const Jacobian& jac = obs.jacobian();
    const double inv2s2 = 0.5 / (weight_sigma * weight_sigma);

    double m_uu = 0.0;
    double m_vv = 0.0;
    double m_uv = 0.0;
    for (int r = 0; r < obs.rows(); ++r) {
        for (int c = 0; c < obs.cols(); ++c) {
            const auto [u, v] = jac.uv_of(r, c);
            const double w = std::exp(-(u * u + v * v) * inv2s2) * obs.image()(r, c);
            m_uu += w * u * u;
            m_vv += w * v * v;
            m_uv += w * u * v;
        }
    }

    const double t = m_uu + m_vv;
    if (!(t > 0.0)) {
        throw NumericalError("weighted moments are not positive, T=" + std::to_string(t));
    }
    // u runs along rows, v along columns; e1 > 0 means elongated along columns (x)
    return Shape((m_vv - m_uu) / t, 2.0 * m_uv / t);
}

} // namespace metacal::pipeline
