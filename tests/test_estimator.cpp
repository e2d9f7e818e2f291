#include "metacal/core/errors.hpp"
#include "metacal/estimator/shear_estimator.hpp"

#include <cmath>
#include <random>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace metacal;
using namespace metacal::estimator;

namespace {

ResponseArray identity_responses(long n) {
    return ResponseArray(static_cast<size_t>(n), Eigen::Matrix2d::Identity());
}

ShapeArray jackknife_shapes() {
    ShapeArray g(4, 2);
    g << 1.0, 2.0,
         2.0, 1.0,
         3.0, 0.0,
         4.0, -1.0;
    return g;
}

} // namespace

TEST_CASE("mean_shear_constant_ensemble") {
    ShapeArray g(100, 2);
    g.col(0).setConstant(0.01);
    g.col(1).setZero();
    const MeanShearResult res = get_mean_shear(g, ShapeArray::Zero(100, 2), identity_responses(100),
                                               ShapeArray::Zero(100, 2));

    REQUIRE(res.shear(0) == Catch::Approx(0.01));
    REQUIRE(res.shear(1) == Catch::Approx(0.0).margin(1e-15));
    REQUIRE(res.shear_err(0) == Catch::Approx(0.0).margin(1e-12));
    REQUIRE(res.ng == 100);
    REQUIRE(res.nR == 100);
}

TEST_CASE("mean_shear_applies_response_and_psf_correction") {
    ShapeArray g(2, 2);
    g << 0.03, 0.01,
         0.01, -0.01;
    ShapeArray gpsf(2, 2);
    gpsf << 0.02, 0.0,
            0.02, 0.0;
    ShapeArray Rpsf(3, 2);
    Rpsf << 0.5, 0.0,
            0.5, 0.0,
            0.5, 0.0;
    const ResponseArray R(3, 2.0 * Eigen::Matrix2d::Identity());

    const MeanShearResult res = get_mean_shear(g, gpsf, R, Rpsf);
    // mean g = (0.02, 0), psf correction = 0.02 * 0.5
    REQUIRE(res.psf_corr(0) == Catch::Approx(0.01));
    REQUIRE(res.shear(0) == Catch::Approx(0.005));
    REQUIRE(res.shear(1) == Catch::Approx(0.0).margin(1e-15));
    REQUIRE(res.nR == 3);
}

TEST_CASE("jackknife_closed_form") {
    const JackknifeResult res = jackknife_shear(jackknife_shapes(), identity_responses(4));

    REQUIRE(res.shear(0) == Catch::Approx(2.5));
    REQUIRE(res.shear(1) == Catch::Approx(0.5));
    REQUIRE(res.shear_cov(0, 0) == Catch::Approx(5.0 / 12.0));
    REQUIRE(res.shear_cov(1, 1) == Catch::Approx(5.0 / 12.0));
    REQUIRE(res.shear_cov(0, 1) == Catch::Approx(-5.0 / 12.0));
    REQUIRE(res.shear_cov(1, 0) == Catch::Approx(-5.0 / 12.0));
    REQUIRE(res.shears.rows() == 4);
    REQUIRE(res.shears(0, 0) == Catch::Approx(3.0));
    REQUIRE_FALSE(res.Rpsf_sum.has_value());
}

TEST_CASE("jackknife_psf_correction_shifts_shear") {
    ShapeArray Rpsf(4, 2);
    Rpsf.setConstant(0.25);
    const JackknifeResult res = jackknife_shear(jackknife_shapes(), identity_responses(4), Rpsf);
    REQUIRE(res.Rpsf_sum.has_value());
    REQUIRE(res.shear(0) == Catch::Approx(2.25));
    REQUIRE(res.shear(1) == Catch::Approx(0.25));
}

TEST_CASE("jackknife_chunks_and_remainder") {
    ShapeArray g(5, 2);
    g << 1.0, 0.0,
         2.0, 0.0,
         3.0, 0.0,
         4.0, 0.0,
         5.0, 0.0;

    REQUIRE_THROWS_AS(jackknife_shear(g, identity_responses(5), std::nullopt, 2), ValidationError);

    const JackknifeResult res = jackknife_shear(g, identity_responses(5), std::nullopt, 2,
                                                RemainderPolicy::Truncate);
    REQUIRE(res.shears.rows() == 2);
    REQUIRE(res.nuse == 5);
    REQUIRE(res.shear(0) == Catch::Approx(3.0));
    REQUIRE(res.shear_cov(0, 0) >= 0.0);
    REQUIRE(res.shear_cov(1, 1) >= 0.0);

    REQUIRE_THROWS_AS(jackknife_shear(g, identity_responses(5), std::nullopt, 0), ValidationError);
    REQUIRE_THROWS_AS(jackknife_shear(g, identity_responses(5), std::nullopt, 6), ValidationError);
}

TEST_CASE("jackknife_singular_response_throws") {
    const ResponseArray R(4, Eigen::Matrix2d::Zero());
    REQUIRE_THROWS_AS(jackknife_shear(jackknife_shapes(), R), SingularMatrixError);

    const ShapeArray g = ShapeArray::Ones(3, 2);
    REQUIRE_THROWS_AS(get_mean_shear(g, ShapeArray::Zero(3, 2), ResponseArray(3, Eigen::Matrix2d::Zero()),
                                     ShapeArray::Zero(3, 2)),
                      SingularMatrixError);
}

TEST_CASE("jackknife_length_mismatch_throws") {
    REQUIRE_THROWS_AS(jackknife_shear(jackknife_shapes(), identity_responses(3)), ValidationError);
}

TEST_CASE("jackknife_remainder_counts_partial_chunk") {
    REQUIRE(jackknife_remainder(12, 4) == 0);
    REQUIRE(jackknife_remainder(14, 4) == 2);
    REQUIRE(jackknife_remainder(3, 1) == 0);
    REQUIRE_THROWS_AS(jackknife_remainder(10, 0), ValidationError);
}

TEST_CASE("weighted_jackknife_unit_weights_match_unweighted") {
    const ShapeArray g = jackknife_shapes();
    const ResponseArray R = identity_responses(4);

    const JackknifeResult plain = jackknife_shear(g, R);
    const WeightedJackknifeResult unit = jackknife_shear_weighted(g, R);
    REQUIRE(unit.shear.isApprox(plain.shear));
    REQUIRE(unit.shear_cov.isApprox(plain.shear_cov));
    REQUIRE(unit.wsum == Catch::Approx(4.0));

    VectorXd w(4);
    w << 1.0, 2.0, 0.5, 1.5;
    const WeightedJackknifeResult a = jackknife_shear_weighted(g, R, w);
    const WeightedJackknifeResult b = jackknife_shear_weighted(g, R, VectorXd(3.0 * w));
    REQUIRE(b.shear.isApprox(a.shear));
    REQUIRE(b.shear_cov.isApprox(a.shear_cov));
}

TEST_CASE("bootstrap_agrees_with_naive_error") {
    std::mt19937 data_rng(2024);
    std::normal_distribution<double> shape_noise(0.0, 0.2);

    const long n = 2000;
    ShapeArray g(n, 2);
    for (long i = 0; i < n; ++i) {
        g(i, 0) = 0.02 + shape_noise(data_rng);
        g(i, 1) = -0.01 + shape_noise(data_rng);
    }
    const ResponseArray R(static_cast<size_t>(n), 0.8 * Eigen::Matrix2d::Identity());

    std::mt19937 rng(11);
    const BootstrapResult res = bootstrap_shear(g, ShapeArray::Zero(n, 2), R, ShapeArray::Zero(n, 2),
                                                400, rng);

    const MeanShearResult naive = get_mean_shear(g, ShapeArray::Zero(n, 2), R, ShapeArray::Zero(n, 2));
    REQUIRE(res.shear.isApprox(naive.shear));
    REQUIRE(std::abs(res.shear_mean(0) - naive.shear(0)) < 0.5 * naive.shear_err(0));
    REQUIRE(res.shear_err(0) == Catch::Approx(naive.shear_err(0)).epsilon(0.15));
    REQUIRE(res.shear_err(1) == Catch::Approx(naive.shear_err(1)).epsilon(0.15));
    REQUIRE(res.shears.rows() == 400);

    REQUIRE_THROWS_AS(bootstrap_shear(g, ShapeArray::Zero(n, 2), R, ShapeArray::Zero(n, 2), 1, rng),
                      ValidationError);
}

TEST_CASE("bootstrap_resamples_shapes_and_responses_separately") {
    std::mt19937 data_rng(77);
    std::normal_distribution<double> shape_noise(0.0, 0.05);
    std::uniform_real_distribution<double> r_diag(0.5, 1.1);

    const long ng = 300;
    const long nR = 50;
    ShapeArray g(ng, 2);
    ShapeArray gpsf(ng, 2);
    for (long i = 0; i < ng; ++i) {
        g(i, 0) = 0.2 + shape_noise(data_rng);
        g(i, 1) = -0.1 + shape_noise(data_rng);
        gpsf(i, 0) = 0.01;
        gpsf(i, 1) = -0.02;
    }

    ResponseArray R_varying(static_cast<size_t>(nR));
    ShapeArray Rpsf(nR, 2);
    for (long i = 0; i < nR; ++i) {
        Eigen::Matrix2d r = Eigen::Matrix2d::Zero();
        r(0, 0) = r_diag(data_rng);
        r(1, 1) = r_diag(data_rng);
        R_varying[static_cast<size_t>(i)] = r;
        Rpsf(i, 0) = 0.3;
        Rpsf(i, 1) = 0.2;
    }
    const ResponseArray R_constant(static_cast<size_t>(nR), 0.8 * Eigen::Matrix2d::Identity());

    std::mt19937 rng_varying(5);
    const BootstrapResult varying = bootstrap_shear(g, gpsf, R_varying, Rpsf, 300, rng_varying);
    std::mt19937 rng_constant(5);
    const BootstrapResult constant = bootstrap_shear(g, gpsf, R_constant, Rpsf, 300, rng_constant);

    const MeanShearResult mean = get_mean_shear(g, gpsf, R_varying, Rpsf);
    REQUIRE(varying.shear.isApprox(mean.shear));
    REQUIRE(varying.ng == ng);
    REQUIRE(varying.nR == nR);
    REQUIRE(varying.psf_corr.isApprox(mean.psf_corr));
    REQUIRE(varying.shears.rows() == 300);
    REQUIRE(varying.shears.allFinite());

    // Response scatter adds to the error on top of shape noise
    REQUIRE(varying.shear_err(0) > constant.shear_err(0));
    REQUIRE(varying.shear_err(1) > constant.shear_err(1));
}

TEST_CASE("finite_difference_response_columns") {
    ShapeArray p1(1, 2), m1(1, 2), p2(1, 2), m2(1, 2);
    p1 << 0.012, 0.001;
    m1 << -0.008, -0.001;
    p2 << 0.002, 0.011;
    m2 << 0.002, -0.009;

    const ResponseArray R = finite_difference_response(p1, m1, p2, m2, 0.01);
    REQUIRE(R.size() == 1);
    REQUIRE(R[0](0, 0) == Catch::Approx(1.0));
    REQUIRE(R[0](1, 0) == Catch::Approx(0.1));
    REQUIRE(R[0](0, 1) == Catch::Approx(0.0).margin(1e-12));
    REQUIRE(R[0](1, 1) == Catch::Approx(1.0));

    REQUIRE_THROWS_AS(finite_difference_response(p1, m1, p2, m2, 0.0), ValidationError);
}

TEST_CASE("estimator_results_serialize") {
    const JackknifeResult res = jackknife_shear(jackknife_shapes(), identity_responses(4));
    const json j = to_json(res);
    REQUIRE(j["shear"][0].get<double>() == Catch::Approx(2.5));
    REQUIRE(j["shear_cov"].size() == 2);
    REQUIRE(j["shears"].size() == 4);
}
