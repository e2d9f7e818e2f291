#include "metacal/core/errors.hpp"
#include "metacal/image/fourier_engine.hpp"
#include "metacal/image/interpolant.hpp"

#include <cmath>
#include <random>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace metacal;
using metacal::image::FourierEngine;

namespace {

struct Moments {
    double e1;
    double e2;
    double t;
};

// Unweighted second moments about the centroid; x runs along columns
Moments moments(const Matrix2Dd& im) {
    double sum = 0.0, sx = 0.0, sy = 0.0;
    for (int r = 0; r < im.rows(); ++r) {
        for (int c = 0; c < im.cols(); ++c) {
            sum += im(r, c);
            sx += im(r, c) * c;
            sy += im(r, c) * r;
        }
    }
    const double xc = sx / sum;
    const double yc = sy / sum;
    double ixx = 0.0, iyy = 0.0, ixy = 0.0;
    for (int r = 0; r < im.rows(); ++r) {
        for (int c = 0; c < im.cols(); ++c) {
            const double dx = c - xc;
            const double dy = r - yc;
            ixx += im(r, c) * dx * dx;
            iyy += im(r, c) * dy * dy;
            ixy += im(r, c) * dx * dy;
        }
    }
    const double t = ixx + iyy;
    return {(ixx - iyy) / t, 2.0 * ixy / t, t / sum};
}

double variance(const Matrix2Dd& m) {
    return (m.array() - m.mean()).square().mean();
}

} // namespace

TEST_CASE("lanczos_kernel_properties") {
    const image::Lanczos lz(5, true, 1e-4);
    REQUIRE(lz.xval(0.0) == Catch::Approx(1.0));
    REQUIRE(lz.xval(1.0) == Catch::Approx(0.0).margin(1e-12));
    REQUIRE(lz.xval(5.5) == 0.0);
    REQUIRE(lz.uval(0.0) == Catch::Approx(1.0).epsilon(1e-3));
    REQUIRE(lz.umax() > 0.5);

    REQUIRE(image::cubic_weight(0.0) == Catch::Approx(1.0));
    REQUIRE(image::cubic_weight(1.0) == Catch::Approx(0.0).margin(1e-12));
    REQUIRE(image::cubic_weight(2.5) == 0.0);
}

TEST_CASE("gaussian_draw_conserves_flux") {
    FourierEngine engine;
    const Matrix2Dd im = engine.draw(engine.gaussian(2.0, 10.0), 48, 48, 1.0);
    REQUIRE(im.sum() == Catch::Approx(10.0).epsilon(1e-4));

    const Matrix2Dd pix = engine.draw(engine.convolve(engine.gaussian(2.0, 10.0), engine.pixel(1.0)),
                                      48, 48, 1.0);
    REQUIRE(pix.sum() == Catch::Approx(10.0).epsilon(1e-4));
}

TEST_CASE("draw_centers_profile_on_grid") {
    FourierEngine engine;
    const Matrix2Dd odd = engine.draw(engine.gaussian(1.5, 1.0), 21, 21, 1.0);
    Eigen::Index r = 0, c = 0;
    odd.maxCoeff(&r, &c);
    REQUIRE(r == 10);
    REQUIRE(c == 10);

    const Matrix2Dd even = engine.draw(engine.gaussian(1.5, 1.0), 20, 20, 1.0);
    REQUIRE(even(9, 9) == Catch::Approx(even(10, 10)).epsilon(1e-8));
    REQUIRE(even(9, 10) == Catch::Approx(even(10, 9)).epsilon(1e-8));
}

TEST_CASE("interpolated_image_round_trip") {
    FourierEngine engine;
    const Matrix2Dd im = engine.draw(engine.gaussian(2.5, 1.0), 48, 48, 1.0);
    const auto interp = engine.interpolated_image(im, 1.0, config::InterpolantConfig());

    REQUIRE(interp->flux() == Catch::Approx(im.sum()).epsilon(1e-5));

    const Matrix2Dd back = engine.draw(interp, 48, 48, 1.0);
    const double peak = im.maxCoeff();
    REQUIRE((back - im).cwiseAbs().maxCoeff() < 2e-3 * peak);
}

TEST_CASE("gaussian_shear_matches_analytic_ellipticity") {
    FourierEngine engine;
    const double g = 0.2;

    const Matrix2Dd im1 = engine.draw(engine.shear(engine.gaussian(3.0, 1.0), Shape(g, 0.0)),
                                      64, 64, 1.0);
    const Moments m1 = moments(im1);
    REQUIRE(m1.e1 == Catch::Approx(2.0 * g / (1.0 + g * g)).margin(1e-3));
    REQUIRE(m1.e2 == Catch::Approx(0.0).margin(1e-4));

    const Matrix2Dd im2 = engine.draw(engine.shear(engine.gaussian(3.0, 1.0), Shape(0.0, g)),
                                      64, 64, 1.0);
    const Moments m2 = moments(im2);
    REQUIRE(m2.e1 == Catch::Approx(0.0).margin(1e-4));
    REQUIRE(m2.e2 == Catch::Approx(2.0 * g / (1.0 + g * g)).margin(1e-3));

    // Shear preserves area, so the flux is unchanged
    REQUIRE(im1.sum() == Catch::Approx(1.0).epsilon(1e-4));
}

TEST_CASE("dilation_scales_size") {
    FourierEngine engine;
    const Matrix2Dd base = engine.draw(engine.gaussian(2.0, 1.0), 64, 64, 1.0);
    const Matrix2Dd big = engine.draw(engine.dilate(engine.gaussian(2.0, 1.0), 1.5), 64, 64, 1.0);
    REQUIRE(moments(big).t == Catch::Approx(2.25 * moments(base).t).epsilon(1e-3));
    REQUIRE(big.sum() == Catch::Approx(1.0).epsilon(1e-4));
    REQUIRE_THROWS_AS(engine.dilate(engine.gaussian(2.0, 1.0), 0.0), ValidationError);
}

TEST_CASE("gaussian_convolution_adds_variances") {
    FourierEngine engine;
    const Matrix2Dd conv = engine.draw(engine.convolve(engine.gaussian(1.5, 1.0),
                                                       engine.gaussian(2.0, 1.0)),
                                       48, 48, 1.0);
    const Matrix2Dd direct = engine.draw(engine.gaussian(2.5, 1.0), 48, 48, 1.0);
    REQUIRE((conv - direct).cwiseAbs().maxCoeff() < 1e-4 * direct.maxCoeff());
}

TEST_CASE("deconvolution_undoes_convolution") {
    FourierEngine engine;
    const auto psf = engine.gaussian(1.0, 1.0);
    const auto gal = engine.gaussian(2.5, 1.0);
    const auto round_trip = engine.convolve(engine.convolve(gal, psf), engine.deconvolve(psf));

    const Matrix2Dd a = engine.draw(round_trip, 48, 48, 1.0);
    const Matrix2Dd b = engine.draw(gal, 48, 48, 1.0);
    REQUIRE((a - b).cwiseAbs().maxCoeff() < 1e-4 * b.maxCoeff());
}

TEST_CASE("estimated_white_noise_power_spectrum") {
    FourierEngine engine;
    std::mt19937 rng(12345);
    const double sigma = 1.5;
    const Matrix2Dd field = engine.gaussian_noise(256, 256, sigma, rng);
    REQUIRE(variance(field) == Catch::Approx(sigma * sigma).epsilon(0.02));

    const auto cn = engine.estimate_correlated_noise(field, 1.0);
    const Matrix2Dd ps = engine.noise_power_spectrum(cn, 64, 64, 1.0);
    REQUIRE(ps.mean() == Catch::Approx(sigma * sigma).epsilon(0.05));
    REQUIRE(ps.minCoeff() >= 0.0);
}

TEST_CASE("whitening_fills_power_spectrum_to_max") {
    FourierEngine engine;
    std::mt19937 rng(99);

    auto cn = engine.white_noise(1.0, 1.0);
    cn = engine.convolve_noise(cn, engine.gaussian(1.0, 1.0));

    const Matrix2Dd ps = engine.noise_power_spectrum(cn, 128, 128, 1.0);
    Matrix2Dd image = Matrix2Dd::Zero(128, 128);
    const double target = engine.whiten(image, cn, 1.0, rng);

    REQUIRE(target == Catch::Approx(ps.maxCoeff()));
    REQUIRE(target == Catch::Approx(1.0).epsilon(0.02));
    REQUIRE(variance(image) == Catch::Approx(target - ps.mean()).epsilon(0.05));
}

TEST_CASE("symmetrizing_white_noise_adds_little") {
    FourierEngine engine;
    std::mt19937 rng(7);

    const auto cn = engine.white_noise(1.0, 1.0);
    Matrix2Dd image = Matrix2Dd::Zero(64, 64);
    const double level = engine.symmetrize(image, cn, 1.0, 4, rng);

    REQUIRE(level == Catch::Approx(1.0).epsilon(0.05));
    REQUIRE(variance(image) < 0.05);

    REQUIRE_THROWS_AS(engine.symmetrize(image, cn, 1.0, 3, rng), ValidationError);
}

TEST_CASE("symmetrizing_sheared_noise_rounds_spectrum") {
    FourierEngine engine;
    std::mt19937 rng(21);

    auto cn = engine.convolve_noise(engine.white_noise(1.0, 1.0), engine.gaussian(1.5, 1.0));
    cn = engine.shear_noise(cn, Shape(0.3, 0.0));

    Matrix2Dd image = Matrix2Dd::Zero(64, 64);
    const double level = engine.symmetrize(image, cn, 1.0, 4, rng);
    const Matrix2Dd ps = engine.noise_power_spectrum(cn, 64, 64, 1.0);

    REQUIRE(level >= ps.mean());
    REQUIRE(variance(image) == Catch::Approx(level - ps.mean()).epsilon(0.1));
}

TEST_CASE("engine_rejects_bad_grids") {
    FourierEngine engine;
    std::mt19937 rng(1);
    REQUIRE_THROWS_AS(engine.draw(engine.gaussian(1.0, 1.0), 0, 5, 1.0), ValidationError);
    REQUIRE_THROWS_AS(engine.draw(engine.gaussian(1.0, 1.0), 5, 5, -1.0), ValidationError);
    REQUIRE_THROWS_AS(engine.gaussian_noise(4, 4, -1.0, rng), ValidationError);
    REQUIRE_THROWS_AS(engine.gaussian(0.0, 1.0), ValidationError);
}
