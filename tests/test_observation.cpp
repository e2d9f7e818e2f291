#include "metacal/core/errors.hpp"
#include "metacal/observation/jacobian.hpp"
#include "metacal/observation/observation.hpp"

#include <cmath>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace metacal;

TEST_CASE("observation_defaults") {
    Observation obs(Matrix2Dd::Constant(5, 7, 2.0));

    REQUIRE(obs.rows() == 5);
    REQUIRE(obs.cols() == 7);
    REQUIRE(obs.weight().rows() == 5);
    REQUIRE(obs.weight().minCoeff() == 1.0);
    REQUIRE(obs.jacobian().row0() == Catch::Approx(2.0));
    REQUIRE(obs.jacobian().col0() == Catch::Approx(3.0));
    REQUIRE_FALSE(obs.has_psf());
    REQUIRE_FALSE(obs.has_bmask());
    REQUIRE(obs.meta().is_object());
}

TEST_CASE("observation_rejects_mismatched_shapes") {
    Observation obs(Matrix2Dd::Zero(4, 4));

    REQUIRE_THROWS_AS(obs.set_weight(Matrix2Dd::Ones(4, 5)), ValidationError);
    REQUIRE_THROWS_AS(obs.set_bmask(Matrix2Di::Zero(3, 4)), ValidationError);
    REQUIRE_THROWS_AS(obs.set_noise(Matrix2Dd::Zero(5, 4)), ValidationError);
    REQUIRE_THROWS_AS(obs.set_image(Matrix2Dd::Zero(4, 3)), ValidationError);
    REQUIRE_THROWS_AS(Observation(Matrix2Dd::Zero(3, 3), Matrix2Dd::Ones(2, 2)), ValidationError);

    obs.set_bmask(Matrix2Di::Zero(4, 4));
    REQUIRE(obs.has_bmask());
    obs.clear_bmask();
    REQUIRE_THROWS_AS(obs.bmask(), ValidationError);
}

TEST_CASE("observation_psf_cannot_nest") {
    Observation psf(Matrix2Dd::Ones(3, 3));
    Observation obs(Matrix2Dd::Ones(5, 5));
    REQUIRE_THROWS_AS(obs.psf(), ValidationError);

    obs.set_psf(psf);
    REQUIRE(obs.has_psf());
    REQUIRE(obs.psf().rows() == 3);

    Observation nested(Matrix2Dd::Ones(3, 3));
    nested.set_psf(Observation(Matrix2Dd::Ones(3, 3)));
    REQUIRE_THROWS_AS(obs.set_psf(nested), ValidationError);
}

TEST_CASE("observation_s2n") {
    Matrix2Dd image = Matrix2Dd::Constant(2, 2, 3.0);
    Matrix2Dd weight(2, 2);
    weight << 4.0, 4.0,
              4.0, 0.0;
    Observation obs(image, weight);

    const S2NSums sums = obs.s2n_sums();
    REQUIRE(sums.npix == 3);
    REQUIRE(sums.isum == Catch::Approx(9.0));
    REQUIRE(sums.vsum == Catch::Approx(0.75));
    REQUIRE(obs.s2n() == Catch::Approx(9.0 / std::sqrt(0.75)));

    obs.set_weight(Matrix2Dd::Zero(2, 2));
    REQUIRE(obs.s2n() == kS2NUnset);
}

TEST_CASE("observation_meta_must_be_object") {
    Observation obs(Matrix2Dd::Zero(3, 3));
    obs.update_meta(json{{"id", 7}});
    obs.update_meta(json{{"flag", true}});
    REQUIRE(obs.meta()["id"] == 7);
    REQUIRE(obs.meta()["flag"] == true);
    REQUIRE_THROWS_AS(obs.set_meta(json::array({1, 2})), ValidationError);
}

TEST_CASE("obs_lists_sum_s2n") {
    ObsList band;
    band.push_back(Observation(Matrix2Dd::Constant(2, 2, 1.0)));
    band.push_back(Observation(Matrix2Dd::Constant(2, 2, 2.0)));
    REQUIRE(band.size() == 2);
    REQUIRE(band.s2n_sums().npix == 8);
    REQUIRE(band.s2n() == Catch::Approx(12.0 / std::sqrt(8.0)));
    REQUIRE_THROWS_AS(band[2], ValidationError);

    const MultiBandObsList mb = get_mb_obs(band);
    REQUIRE(mb.size() == 1);
    REQUIRE(mb[0].size() == 2);
    REQUIRE(mb.s2n() == Catch::Approx(band.s2n()));

    const MultiBandObsList single = get_mb_obs(Observation(Matrix2Dd::Ones(3, 3)));
    REQUIRE(single.size() == 1);
    REQUIRE(single[0].size() == 1);
}

TEST_CASE("jacobian_maps_and_inverts") {
    const Jacobian jac(10.0, 12.0, 0.1, 0.02, -0.01, 0.2);
    const auto [u, v] = jac.uv_of(13.0, 9.0);
    REQUIRE(u == Catch::Approx(0.1 * 3.0 + 0.02 * -3.0));
    REQUIRE(v == Catch::Approx(-0.01 * 3.0 + 0.2 * -3.0));

    const auto [row, col] = jac.rowcol_of(u, v);
    REQUIRE(row == Catch::Approx(13.0));
    REQUIRE(col == Catch::Approx(9.0));

    REQUIRE(Jacobian::diagonal(0, 0, 0.263).scale() == Catch::Approx(0.263));
    REQUIRE_THROWS_AS(Jacobian(0, 0, 1.0, 2.0, 2.0, 4.0), ValidationError);
}
