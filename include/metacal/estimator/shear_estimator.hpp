#pragma once

#include "metacal/core/types.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <random>

namespace metacal::estimator {

using json = nlohmann::json;

struct MeanShearResult {
    Eigen::Vector2d shear = Eigen::Vector2d::Zero();
    Eigen::Vector2d shear_err = Eigen::Vector2d::Zero();  // naive, from std(g)
    Eigen::Vector2d g_mean = Eigen::Vector2d::Zero();
    Eigen::Matrix2d R = Eigen::Matrix2d::Zero();          // mean response
    Eigen::Vector2d Rpsf = Eigen::Vector2d::Zero();       // mean psf response
    Eigen::Vector2d psf_corr = Eigen::Vector2d::Zero();
    Eigen::Vector2d g_sum = Eigen::Vector2d::Zero();
    Eigen::Matrix2d R_sum = Eigen::Matrix2d::Zero();
    Eigen::Vector2d Rpsf_sum = Eigen::Vector2d::Zero();
    Eigen::Vector2d psf_corr_sum = Eigen::Vector2d::Zero();
    long ng = 0;
    long nR = 0;
};

struct JackknifeResult {
    Eigen::Vector2d shear = Eigen::Vector2d::Zero();
    Eigen::Matrix2d shear_cov = Eigen::Matrix2d::Zero();
    Eigen::Vector2d g_sum = Eigen::Vector2d::Zero();      // psf-corrected when Rpsf is given
    Eigen::Matrix2d R_sum = Eigen::Matrix2d::Zero();
    Eigen::Matrix2d R_sum_inv = Eigen::Matrix2d::Zero();
    std::optional<Eigen::Vector2d> Rpsf_sum;
    long nuse = 0;
    ShapeArray shears;                                    // one leave-out estimate per chunk
};

struct WeightedJackknifeResult {
    Eigen::Vector2d shear = Eigen::Vector2d::Zero();
    Eigen::Matrix2d shear_cov = Eigen::Matrix2d::Zero();
    Eigen::Vector2d g_sum = Eigen::Vector2d::Zero();
    Eigen::Matrix2d gsens_sum = Eigen::Matrix2d::Zero();
    Eigen::Matrix2d gsens_sum_inv = Eigen::Matrix2d::Zero();
    ShapeArray shears;
    VectorXd weights;
    double wsum = 0.0;
    long nuse = 0;
};

struct BootstrapResult : MeanShearResult {
    Eigen::Vector2d shear_mean = Eigen::Vector2d::Zero();
    Eigen::Matrix2d shear_cov = Eigen::Matrix2d::Zero();
    ShapeArray shears;
};

MeanShearResult get_mean_shear(const ShapeArray& g, const ShapeArray& gpsf,
                               const ResponseArray& R, const ShapeArray& Rpsf);

// Objects past the last full chunk of chunksize
long jackknife_remainder(Eigen::Index ntot, int chunksize);

JackknifeResult jackknife_shear(const ShapeArray& g, const ResponseArray& R,
                                const std::optional<ShapeArray>& Rpsf = std::nullopt,
                                int chunksize = 1,
                                RemainderPolicy remainder = RemainderPolicy::Require);

WeightedJackknifeResult jackknife_shear_weighted(const ShapeArray& g, const ResponseArray& gsens,
                                                 const std::optional<VectorXd>& weights = std::nullopt,
                                                 int chunksize = 1,
                                                 RemainderPolicy remainder = RemainderPolicy::Require);

// Shapes and responses are resampled with independent index draws
BootstrapResult bootstrap_shear(const ShapeArray& g, const ShapeArray& gpsf,
                                const ResponseArray& R, const ShapeArray& Rpsf,
                                int nboot, std::mt19937& rng, bool verbose = false);

// R[i] column j = (g_jp - g_jm) / (2 step)
ResponseArray finite_difference_response(const ShapeArray& g_1p, const ShapeArray& g_1m,
                                         const ShapeArray& g_2p, const ShapeArray& g_2m,
                                         double step);

json to_json(const MeanShearResult& res);
json to_json(const JackknifeResult& res);
json to_json(const WeightedJackknifeResult& res);
json to_json(const BootstrapResult& res);

} // namespace metacal::estimator
