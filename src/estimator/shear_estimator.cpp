#include "metacal/estimator/shear_estimator.hpp"
#include "metacal/core/errors.hpp"

#include <cmath>
#include <iostream>
#include <sstream>

namespace metacal::estimator {

namespace {

std::string format_matrix(const Eigen::Matrix2d& m) {
    std::ostringstream oss;
    oss << "[[" << m(0, 0) << ", " << m(0, 1) << "], [" << m(1, 0) << ", " << m(1, 1) << "]]";
    return oss.str();
}

Eigen::Matrix2d invert_or_throw(const Eigen::Matrix2d& m, const std::string& context) {
    if (!m.allFinite()) {
        throw NumericalError(context + ": non-finite matrix " + format_matrix(m));
    }
    Eigen::FullPivLU<Eigen::Matrix2d> lu(m);
    if (!lu.isInvertible()) {
        throw SingularMatrixError(context + ": " + format_matrix(m));
    }
    return lu.inverse();
}

Eigen::Matrix2d sum_of(const ResponseArray& R, Eigen::Index beg, Eigen::Index end) {
    Eigen::Matrix2d s = Eigen::Matrix2d::Zero();
    for (Eigen::Index i = beg; i < end; ++i) {
        s += R[static_cast<size_t>(i)];
    }
    return s;
}

void check_length(Eigen::Index expected, Eigen::Index got, const char* what, const char* ref) {
    if (expected != got) {
        throw ValidationError(std::string(what) + " has " + std::to_string(got) +
                              " entries but " + ref + " has " + std::to_string(expected));
    }
}

long chunk_count(Eigen::Index ntot, int chunksize, RemainderPolicy remainder) {
    if (chunksize < 1) {
        throw ValidationError("chunksize must be >= 1, got " + std::to_string(chunksize));
    }
    const long nchunks = static_cast<long>(ntot) / chunksize;
    if (nchunks < 1) {
        throw ValidationError("need at least one chunk: " + std::to_string(ntot) +
                              " objects with chunksize " + std::to_string(chunksize));
    }
    const long rem = jackknife_remainder(ntot, chunksize);
    if (rem != 0) {
        switch (remainder) {
            case RemainderPolicy::Require:
                throw ValidationError(std::to_string(ntot) + " objects is not a multiple of chunksize " +
                                      std::to_string(chunksize));
            case RemainderPolicy::Truncate:
                std::cerr << "[JACKKNIFE] warning: last " << rem
                          << " objects form a partial chunk and are not left out" << std::endl;
                break;
        }
    }
    return nchunks;
}

Eigen::Matrix2d leaveout_cov(const Eigen::Vector2d& shear, const ShapeArray& shears) {
    const double n = static_cast<double>(shears.rows());
    const double fac = (n - 1.0) / n;
    Eigen::Matrix2d cov = Eigen::Matrix2d::Zero();
    for (Eigen::Index i = 0; i < shears.rows(); ++i) {
        const Eigen::Vector2d d = shear - shears.row(i).transpose();
        cov += d * d.transpose();
    }
    return fac * cov;
}

json vec_json(const Eigen::Vector2d& v) {
    return json::array({v(0), v(1)});
}

json mat_json(const Eigen::Matrix2d& m) {
    return json::array({json::array({m(0, 0), m(0, 1)}), json::array({m(1, 0), m(1, 1)})});
}

json shapes_json(const ShapeArray& a) {
    json out = json::array();
    for (Eigen::Index i = 0; i < a.rows(); ++i) {
        out.push_back(json::array({a(i, 0), a(i, 1)}));
    }
    return out;
}

} // namespace

long jackknife_remainder(Eigen::Index ntot, int chunksize) {
    if (chunksize < 1) {
        throw ValidationError("chunksize must be >= 1, got " + std::to_string(chunksize));
    }
    return static_cast<long>(ntot) % chunksize;
}

MeanShearResult get_mean_shear(const ShapeArray& g, const ShapeArray& gpsf,
                               const ResponseArray& R, const ShapeArray& Rpsf) {
    const Eigen::Index ng = g.rows();
    const auto nR = static_cast<Eigen::Index>(R.size());
    if (ng < 1 || nR < 1) {
        throw ValidationError("mean shear needs non-empty g and R, got " + std::to_string(ng) +
                              " and " + std::to_string(nR));
    }
    check_length(ng, gpsf.rows(), "gpsf", "g");
    check_length(nR, Rpsf.rows(), "Rpsf", "R");

    MeanShearResult res;
    res.ng = static_cast<long>(ng);
    res.nR = static_cast<long>(nR);

    res.g_sum = g.colwise().sum().transpose();
    res.g_mean = res.g_sum / static_cast<double>(ng);

    Eigen::Vector2d g_std;
    for (int c = 0; c < 2; ++c) {
        const double var = (g.col(c).array() - res.g_mean(c)).square().mean();
        g_std(c) = std::sqrt(var);
    }
    const Eigen::Vector2d g_err = g_std / std::sqrt(static_cast<double>(ng));

    res.R_sum = sum_of(R, 0, nR);
    res.R = res.R_sum / static_cast<double>(nR);

    res.Rpsf_sum = Rpsf.colwise().sum().transpose();
    res.Rpsf = res.Rpsf_sum / static_cast<double>(nR);

    res.psf_corr_sum = gpsf.colwise().sum().transpose().cwiseProduct(res.Rpsf);
    res.psf_corr = res.psf_corr_sum / static_cast<double>(ng);

    const Eigen::Matrix2d Rinv = invert_or_throw(res.R, "mean response");
    res.shear = Rinv * (res.g_mean - res.psf_corr);
    res.shear_err = Rinv * g_err;
    return res;
}

JackknifeResult jackknife_shear(const ShapeArray& g, const ResponseArray& R,
                                const std::optional<ShapeArray>& Rpsf,
                                int chunksize, RemainderPolicy remainder) {
    const Eigen::Index ntot = g.rows();
    if (ntot < 1) {
        throw ValidationError("jackknife needs a non-empty ensemble");
    }
    check_length(ntot, static_cast<Eigen::Index>(R.size()), "R", "g");
    if (Rpsf) {
        check_length(ntot, Rpsf->rows(), "Rpsf", "g");
    }
    const long nchunks = chunk_count(ntot, chunksize, remainder);

    JackknifeResult res;
    res.nuse = static_cast<long>(ntot);
    res.g_sum = g.colwise().sum().transpose();
    res.R_sum = sum_of(R, 0, ntot);
    if (Rpsf) {
        res.Rpsf_sum = Rpsf->colwise().sum().transpose();
        res.g_sum -= *res.Rpsf_sum;
    }

    res.R_sum_inv = invert_or_throw(res.R_sum, "summed response");
    res.shear = res.R_sum_inv * res.g_sum;

    res.shears.resize(nchunks, 2);
    for (long i = 0; i < nchunks; ++i) {
        const Eigen::Index beg = i * chunksize;
        const Eigen::Index end = (i + 1) * chunksize;

        Eigen::Vector2d tg_sum = g.middleRows(beg, end - beg).colwise().sum().transpose();
        const Eigen::Matrix2d tR_sum = sum_of(R, beg, end);
        if (Rpsf) {
            tg_sum -= Rpsf->middleRows(beg, end - beg).colwise().sum().transpose();
        }

        const Eigen::Matrix2d j_R_inv = invert_or_throw(
            res.R_sum - tR_sum, "leave-out response for chunk " + std::to_string(i));
        res.shears.row(i) = (j_R_inv * (res.g_sum - tg_sum)).transpose();
    }

    res.shear_cov = leaveout_cov(res.shear, res.shears);
    return res;
}

WeightedJackknifeResult jackknife_shear_weighted(const ShapeArray& g, const ResponseArray& gsens,
                                                 const std::optional<VectorXd>& weights,
                                                 int chunksize, RemainderPolicy remainder) {
    const Eigen::Index ntot = g.rows();
    if (ntot < 1) {
        throw ValidationError("weighted jackknife needs a non-empty ensemble");
    }
    check_length(ntot, static_cast<Eigen::Index>(gsens.size()), "gsens", "g");
    if (weights) {
        check_length(ntot, weights->size(), "weights", "g");
    }
    const long nchunks = chunk_count(ntot, chunksize, remainder);

    WeightedJackknifeResult res;
    res.nuse = static_cast<long>(ntot);
    res.weights = weights ? *weights : VectorXd::Ones(ntot);
    res.wsum = res.weights.sum();

    auto weighted_sums = [&](Eigen::Index beg, Eigen::Index end,
                             Eigen::Vector2d& gs, Eigen::Matrix2d& ss) {
        gs.setZero();
        ss.setZero();
        for (Eigen::Index i = beg; i < end; ++i) {
            const double w = res.weights(i);
            gs += w * g.row(i).transpose();
            ss += w * gsens[static_cast<size_t>(i)];
        }
    };

    weighted_sums(0, ntot, res.g_sum, res.gsens_sum);
    res.gsens_sum_inv = invert_or_throw(res.gsens_sum, "summed weighted sensitivity");
    res.shear = res.gsens_sum_inv * res.g_sum;

    res.shears.resize(nchunks, 2);
    for (long i = 0; i < nchunks; ++i) {
        const Eigen::Index beg = i * chunksize;
        const Eigen::Index end = (i + 1) * chunksize;

        Eigen::Vector2d tg_sum;
        Eigen::Matrix2d tsens_sum;
        weighted_sums(beg, end, tg_sum, tsens_sum);

        const Eigen::Matrix2d j_inv = invert_or_throw(
            res.gsens_sum - tsens_sum, "leave-out sensitivity for chunk " + std::to_string(i));
        res.shears.row(i) = (j_inv * (res.g_sum - tg_sum)).transpose();
    }

    res.shear_cov = leaveout_cov(res.shear, res.shears);
    return res;
}

BootstrapResult bootstrap_shear(const ShapeArray& g, const ShapeArray& gpsf,
                                const ResponseArray& R, const ShapeArray& Rpsf,
                                int nboot, std::mt19937& rng, bool verbose) {
    if (nboot < 2) {
        throw ValidationError("nboot must be >= 2, got " + std::to_string(nboot));
    }

    BootstrapResult res;
    static_cast<MeanShearResult&>(res) = get_mean_shear(g, gpsf, R, Rpsf);
    if (verbose) {
        std::cerr << "[BOOTSTRAP] shear: " << res.shear.transpose()
                  << " naive err: " << res.shear_err.transpose() << std::endl;
    }

    const Eigen::Index ng = g.rows();
    const auto nR = static_cast<Eigen::Index>(R.size());

    ShapeArray g_scratch(ng, 2);
    ShapeArray gpsf_scratch(ng, 2);
    ResponseArray R_scratch(static_cast<size_t>(nR));
    ShapeArray Rpsf_scratch(nR, 2);

    std::uniform_int_distribution<Eigen::Index> g_index(0, ng - 1);
    std::uniform_int_distribution<Eigen::Index> R_index(0, nR - 1);

    res.shears.resize(nboot, 2);
    for (int b = 0; b < nboot; ++b) {
        for (Eigen::Index i = 0; i < ng; ++i) {
            const Eigen::Index k = g_index(rng);
            g_scratch.row(i) = g.row(k);
            gpsf_scratch.row(i) = gpsf.row(k);
        }
        for (Eigen::Index i = 0; i < nR; ++i) {
            const Eigen::Index k = R_index(rng);
            R_scratch[static_cast<size_t>(i)] = R[static_cast<size_t>(k)];
            Rpsf_scratch.row(i) = Rpsf.row(k);
        }

        const MeanShearResult tres = get_mean_shear(g_scratch, gpsf_scratch, R_scratch, Rpsf_scratch);
        res.shears.row(b) = tres.shear.transpose();

        if (verbose && (b + 1) % 100 == 0) {
            std::cerr << "[BOOTSTRAP] " << (b + 1) << "/" << nboot << std::endl;
        }
    }

    res.shear_mean = res.shears.colwise().mean().transpose();

    Eigen::Matrix2d cov = Eigen::Matrix2d::Zero();
    for (int b = 0; b < nboot; ++b) {
        const Eigen::Vector2d d = res.shear - res.shears.row(b).transpose();
        cov += d * d.transpose();
    }
    res.shear_cov = cov / (nboot - 1.0);
    res.shear_err = res.shear_cov.diagonal().cwiseSqrt();
    return res;
}

ResponseArray finite_difference_response(const ShapeArray& g_1p, const ShapeArray& g_1m,
                                         const ShapeArray& g_2p, const ShapeArray& g_2m,
                                         double step) {
    if (!(step > 0.0)) {
        throw ValidationError("finite difference step must be > 0, got " + std::to_string(step));
    }
    const Eigen::Index n = g_1p.rows();
    check_length(n, g_1m.rows(), "g_1m", "g_1p");
    check_length(n, g_2p.rows(), "g_2p", "g_1p");
    check_length(n, g_2m.rows(), "g_2m", "g_1p");

    ResponseArray R(static_cast<size_t>(n));
    const double fac = 1.0 / (2.0 * step);
    for (Eigen::Index i = 0; i < n; ++i) {
        Eigen::Matrix2d& r = R[static_cast<size_t>(i)];
        r.col(0) = fac * (g_1p.row(i) - g_1m.row(i)).transpose();
        r.col(1) = fac * (g_2p.row(i) - g_2m.row(i)).transpose();
    }
    return R;
}

json to_json(const MeanShearResult& res) {
    return {
        {"shear", vec_json(res.shear)},
        {"shear_err", vec_json(res.shear_err)},
        {"g_mean", vec_json(res.g_mean)},
        {"R", mat_json(res.R)},
        {"Rpsf", vec_json(res.Rpsf)},
        {"psf_corr", vec_json(res.psf_corr)},
        {"g_sum", vec_json(res.g_sum)},
        {"R_sum", mat_json(res.R_sum)},
        {"Rpsf_sum", vec_json(res.Rpsf_sum)},
        {"psf_corr_sum", vec_json(res.psf_corr_sum)},
        {"ng", res.ng},
        {"nR", res.nR}
    };
}

json to_json(const JackknifeResult& res) {
    json out = {
        {"shear", vec_json(res.shear)},
        {"shear_cov", mat_json(res.shear_cov)},
        {"g_sum", vec_json(res.g_sum)},
        {"R_sum", mat_json(res.R_sum)},
        {"R_sum_inv", mat_json(res.R_sum_inv)},
        {"nuse", res.nuse},
        {"shears", shapes_json(res.shears)}
    };
    if (res.Rpsf_sum) {
        out["Rpsf_sum"] = vec_json(*res.Rpsf_sum);
    }
    return out;
}

json to_json(const WeightedJackknifeResult& res) {
    return {
        {"shear", vec_json(res.shear)},
        {"shear_cov", mat_json(res.shear_cov)},
        {"g_sum", vec_json(res.g_sum)},
        {"gsens_sum", mat_json(res.gsens_sum)},
        {"gsens_sum_inv", mat_json(res.gsens_sum_inv)},
        {"wsum", res.wsum},
        {"nuse", res.nuse},
        {"shears", shapes_json(res.shears)}
    };
}

json to_json(const BootstrapResult& res) {
    json out = to_json(static_cast<const MeanShearResult&>(res));
    out["shear_mean"] = vec_json(res.shear_mean);
    out["shear_cov"] = mat_json(res.shear_cov);
    out["shears"] = shapes_json(res.shears);
    return out;
}

} // namespace metacal::estimator
