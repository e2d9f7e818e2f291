#include "metacal/core/errors.hpp"
#include "metacal/image/fourier_engine.hpp"
#include "metacal/pipeline/metacal.hpp"
#include "metacal/pipeline/simulation.hpp"

#include <memory>
#include <random>
#include <string>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace metacal;
using metacal::image::FourierEngine;
using metacal::image::ProfilePtr;

namespace {

// Logs the profile operations the pipeline asks for, then defers to the real engine
class RecordingEngine : public FourierEngine {
public:
    mutable std::vector<std::string> calls;

    ProfilePtr deconvolve(const ProfilePtr& p) const override {
        calls.push_back("deconvolve");
        return FourierEngine::deconvolve(p);
    }
    ProfilePtr convolve(const ProfilePtr& a, const ProfilePtr& b) const override {
        calls.push_back("convolve");
        return FourierEngine::convolve(a, b);
    }
    ProfilePtr shear(const ProfilePtr& p, const Shape& s) const override {
        calls.push_back("shear");
        return FourierEngine::shear(p, s);
    }
    ProfilePtr dilate(const ProfilePtr& p, double factor) const override {
        calls.push_back("dilate");
        return FourierEngine::dilate(p, factor);
    }
    Matrix2Dd draw(const ProfilePtr& p, int rows, int cols, double scale) const override {
        calls.push_back("draw");
        return FourierEngine::draw(p, rows, cols, scale);
    }
    double whiten(Matrix2Dd& image, const image::CorrelatedNoise& noise, double scale,
                  std::mt19937& rng) const override {
        calls.push_back("whiten");
        return FourierEngine::whiten(image, noise, scale, rng);
    }
};

config::SimulationConfig small_sim() {
    config::SimulationConfig sim;
    sim.rows = 40;
    sim.cols = 40;
    sim.scale = 0.263;
    sim.gal_sigma = 0.5;
    sim.psf_sigma = 0.45;
    sim.gal_g1 = 0.1;
    sim.gal_g2 = -0.05;
    return sim;
}

Observation sim_obs(const image::ImageEngine& engine, const config::SimulationConfig& sim) {
    std::mt19937 rng(3);
    return pipeline::make_sim_observation(sim, engine, rng);
}

config::Config fast_config() {
    config::Config cfg;
    cfg.metacal.seed = 1234;
    cfg.noise.patch_size = 64;
    cfg.noise.max_correlation_size = 33;
    return cfg;
}

} // namespace

TEST_CASE("dilation_for_shear") {
    REQUIRE(pipeline::dilation_for(Shape(0.0, 0.0)) == 1.0);
    REQUIRE(pipeline::dilation_for(Shape(0.01, -0.03)) == Catch::Approx(1.06));
}

TEST_CASE("metacal_requires_psf") {
    auto engine = std::make_shared<const FourierEngine>();
    Observation obs(Matrix2Dd::Zero(16, 16));
    REQUIRE_THROWS_AS(pipeline::Metacal(obs, engine), ConfigError);
}

TEST_CASE("metacal_noise_handling_requires_positive_median_weight") {
    auto engine = std::make_shared<const FourierEngine>();
    Observation obs = sim_obs(*engine, small_sim());
    obs.set_weight(Matrix2Dd::Zero(obs.rows(), obs.cols()));

    config::Config cfg = fast_config();
    cfg.metacal.whiten = true;
    REQUIRE_THROWS_AS(pipeline::Metacal(obs, engine, cfg), ValidationError);

    // Without noise handling the weight is never inspected
    REQUIRE_NOTHROW(pipeline::Metacal(obs, engine, fast_config()));
}

TEST_CASE("galshear_operation_order") {
    auto engine = std::make_shared<RecordingEngine>();
    const Observation obs = sim_obs(*engine, small_sim());
    pipeline::Metacal mcal(obs, engine, fast_config());

    engine->calls.clear();
    mcal.get_obs_galshear(Shape(0.01, 0.0));
    REQUIRE(engine->calls ==
            std::vector<std::string>{"dilate", "convolve", "draw", "shear", "convolve", "draw"});

    engine->calls.clear();
    mcal.get_obs_psfshear(Shape(0.01, 0.0));
    REQUIRE(engine->calls ==
            std::vector<std::string>{"dilate", "convolve", "shear", "draw", "convolve", "draw"});
}

TEST_CASE("whitening_runs_after_reconvolution") {
    auto engine = std::make_shared<RecordingEngine>();
    config::SimulationConfig sim = small_sim();
    sim.noise_sigma = 0.01;
    sim.seed = 5;
    const Observation obs = sim_obs(*engine, sim);

    config::Config cfg = fast_config();
    cfg.metacal.whiten = true;
    pipeline::Metacal mcal(obs, engine, cfg);
    REQUIRE(mcal.noise_variance().has_value());
    REQUIRE(*mcal.noise_variance() == Catch::Approx(1e-4));

    engine->calls.clear();
    const Observation out = mcal.get_obs_galshear(Shape(0.0, 0.01));
    REQUIRE(engine->calls.back() == "whiten");
    REQUIRE(out.meta().contains("whitened_variance"));
    REQUIRE(out.meta()["whitened_variance"].get<double>() > 0.0);
}

TEST_CASE("same_seed_repeats_whitening_noise") {
    auto engine = std::make_shared<const FourierEngine>();
    config::SimulationConfig sim = small_sim();
    sim.noise_sigma = 0.01;
    const Observation obs = sim_obs(*engine, sim);

    config::Config cfg = fast_config();
    cfg.metacal.whiten = true;
    cfg.metacal.same_seed = true;
    pipeline::Metacal mcal(obs, engine, cfg);

    const Observation a = mcal.get_obs_dilated_only(Shape(0.01, 0.0));
    const Observation b = mcal.get_obs_dilated_only(Shape(0.01, 0.0));
    REQUIRE(a.image() == b.image());
}

TEST_CASE("zero_shear_keeps_psf_size") {
    auto engine = std::make_shared<const FourierEngine>();
    const Observation obs = sim_obs(*engine, small_sim());
    pipeline::Metacal mcal(obs, engine, fast_config());

    const pipeline::TargetPsf psf = mcal.get_target_psf(Shape(0.0, 0.0), TargetPsfMode::GalShear);
    REQUIRE(psf.dilation == 1.0);
    REQUIRE((psf.image - obs.psf().image()).cwiseAbs().maxCoeff() <
            2e-3 * obs.psf().image().maxCoeff());
}

TEST_CASE("sheared_output_matches_reference_rendering") {
    auto engine = std::make_shared<const FourierEngine>();
    const config::SimulationConfig sim = small_sim();
    const Observation obs = sim_obs(*engine, sim);
    pipeline::Metacal mcal(obs, engine, fast_config());

    for (const Shape& shear : {Shape(0.01, 0.0), Shape(0.0, -0.01), Shape(0.05, 0.02)}) {
        const Observation out = mcal.get_obs_galshear(shear);
        const Observation ref = pipeline::make_sheared_reference(sim, *engine, shear);
        const double peak = ref.image().maxCoeff();
        REQUIRE((out.image() - ref.image()).cwiseAbs().maxCoeff() < 0.02 * peak);
        REQUIRE((out.psf().image() - ref.psf().image()).cwiseAbs().maxCoeff() <
                0.02 * ref.psf().image().maxCoeff());
    }
}

TEST_CASE("outputs_carry_input_metadata") {
    auto engine = std::make_shared<const FourierEngine>();
    Observation obs = sim_obs(*engine, small_sim());
    obs.set_bmask(Matrix2Di::Ones(obs.rows(), obs.cols()));
    pipeline::Metacal mcal(obs, engine, fast_config());

    const auto [sheared, unsheared] = mcal.get_obs_galshear_with_unsheared(Shape(0.01, 0.0));
    for (const Observation* o : {&sheared, &unsheared}) {
        REQUIRE(o->jacobian() == obs.jacobian());
        REQUIRE(o->weight() == obs.weight());
        REQUIRE(o->has_bmask());
        REQUIRE_FALSE(o->has_ormask());
        REQUIRE(o->psf().jacobian() == obs.jacobian());
        REQUIRE_FALSE(o->meta().contains("whitened_variance"));
    }
    REQUIRE(sheared.psf().image() == unsheared.psf().image());
}

TEST_CASE("symmetrized_dilated_output_is_cached") {
    auto engine = std::make_shared<const FourierEngine>();
    config::SimulationConfig sim = small_sim();
    sim.noise_sigma = 0.01;
    const Observation obs = sim_obs(*engine, sim);

    config::Config cfg = fast_config();
    cfg.metacal.symmetrize = true;
    auto cache = std::make_shared<pipeline::SymmetrizationCache>();
    pipeline::Metacal mcal(obs, engine, cfg, cache);

    const Observation first = mcal.get_obs_dilated_only(Shape(0.01, 0.0));
    REQUIRE(cache->size() == 1);
    REQUIRE(cache->misses() == 1);

    const Observation second = mcal.get_obs_dilated_only(Shape(0.01, 0.0));
    REQUIRE(cache->hits() == 1);
    REQUIRE(first.image() == second.image());

    // A second pipeline sharing the cache reuses the field
    pipeline::Metacal other(obs, engine, cfg, cache);
    const Observation third = other.get_obs_dilated_only(Shape(0.01, 0.0));
    REQUIRE(cache->hits() == 2);
    REQUIRE(third.image() == first.image());
}

TEST_CASE("symmetrization_keys_follow_shear_branch") {
    auto engine = std::make_shared<const FourierEngine>();
    config::SimulationConfig sim = small_sim();
    sim.noise_sigma = 0.01;
    const Observation obs = sim_obs(*engine, sim);

    config::Config cfg = fast_config();
    cfg.metacal.symmetrize = true;
    auto cache = std::make_shared<pipeline::SymmetrizationCache>();
    pipeline::Metacal mcal(obs, engine, cfg, cache);

    const int rows = obs.rows();
    const int cols = obs.cols();
    const Shape shear(0.01, 0.0);
    const auto psf_key = pipeline::SymmetrizationKey::make(SymmetrizeType::Psf, rows, cols, shear);
    const auto gal_key = pipeline::SymmetrizationKey::make(SymmetrizeType::Gal, rows, cols, shear);
    const auto zero_key =
        pipeline::SymmetrizationKey::make(SymmetrizeType::Gal, rows, cols, Shape(0.0, 0.0));

    const Observation psf_sheared = mcal.get_obs_psfshear(shear);
    REQUIRE(cache->size() == 1);
    REQUIRE(cache->find(psf_key).has_value());
    REQUIRE_FALSE(cache->find(gal_key).has_value());
    REQUIRE(psf_sheared.meta().contains("symmetrized_variance"));
    REQUIRE(psf_sheared.meta().at("symmetrized_variance").get<double>() > 0.0);

    cache->clear();
    const auto [sheared, unsheared] = mcal.get_obs_galshear_with_unsheared(shear);
    REQUIRE(cache->size() == 2);
    REQUIRE(cache->find(gal_key).has_value());
    REQUIRE(cache->find(zero_key).has_value());
    REQUIRE_FALSE(cache->find(psf_key).has_value());

    // A cache hit reports the same variance as the miss that stored it
    const double stored = cache->find(zero_key)->variance;
    const Observation dilated = mcal.get_obs_dilated_only(shear);
    REQUIRE(unsheared.meta().at("symmetrized_variance").get<double>() == stored);
    REQUIRE(dilated.meta().at("symmetrized_variance").get<double>() == stored);
}

TEST_CASE("invalid_config_fails_at_construction") {
    auto engine = std::make_shared<const FourierEngine>();
    const Observation obs = sim_obs(*engine, small_sim());

    config::Config odd_order = fast_config();
    odd_order.metacal.symmetrize = true;
    odd_order.noise.symmetrize_order = 3;
    REQUIRE_THROWS_AS(pipeline::Metacal(obs, engine, odd_order), ConfigError);

    config::Config no_patch = fast_config();
    no_patch.noise.patch_size = 0;
    REQUIRE_THROWS_AS(pipeline::Metacal(obs, engine, no_patch), ConfigError);

    config::Config bad_step = fast_config();
    bad_step.metacal.step = 1.5;
    REQUIRE_THROWS_AS(pipeline::Metacal(obs, engine, bad_step), ConfigError);
}

TEST_CASE("get_all_builds_requested_types") {
    auto engine = std::make_shared<const FourierEngine>();
    const Observation obs = sim_obs(*engine, small_sim());
    pipeline::Metacal mcal(obs, engine, fast_config());

    const auto all = mcal.get_all();
    REQUIRE(all.size() == 5);
    for (const char* name : {"noshear", "1p", "1m", "2p", "2m"}) {
        REQUIRE(all.count(name) == 1);
    }

    const auto psf_types = mcal.get_all(0.02, {"1p_psf", "2m_psf"});
    REQUIRE(psf_types.size() == 2);
    REQUIRE(psf_types.count("1p_psf") == 1);

    REQUIRE_THROWS_AS(mcal.get_all(0.01, {"noshear", "3p"}), ConfigError);
    REQUIRE_THROWS_AS(mcal.get_all(0.0, {"noshear"}), ValidationError);
}

TEST_CASE("metacal_response_is_near_unity") {
    auto engine = std::make_shared<const FourierEngine>();
    const config::SimulationConfig sim = small_sim();
    const Observation obs = sim_obs(*engine, sim);
    pipeline::Metacal mcal(obs, engine, fast_config());

    const double step = 0.01;
    const auto all = mcal.get_all(step, {"1p", "1m", "2p", "2m"});
    const double wsig = 0.7;
    const double r11 = (pipeline::weighted_ellipticity(all.at("1p"), wsig).g1 -
                        pipeline::weighted_ellipticity(all.at("1m"), wsig).g1) / (2.0 * step);
    const double r22 = (pipeline::weighted_ellipticity(all.at("2p"), wsig).g2 -
                        pipeline::weighted_ellipticity(all.at("2m"), wsig).g2) / (2.0 * step);

    // Weighted ellipticities of a resolved galaxy respond with R of order one
    REQUIRE(r11 > 0.2);
    REQUIRE(r11 < 2.0);
    REQUIRE(r22 > 0.2);
    REQUIRE(r22 < 2.0);
}
