#include "metacal/io/ensemble_io.hpp"
#include "metacal/core/errors.hpp"
#include "metacal/core/utils.hpp"

namespace metacal::io {

namespace {

double number_at(const json& v, const std::string& where) {
    if (!v.is_number()) {
        throw ValidationError(where + ": expected a number, got " + std::string(v.type_name()));
    }
    return v.get<double>();
}

ShapeArray parse_pairs(const json& arr, const std::string& name) {
    if (!arr.is_array()) {
        throw ValidationError("ensemble field '" + name + "' must be an array of [x, y] pairs");
    }
    ShapeArray out(static_cast<Eigen::Index>(arr.size()), 2);
    for (size_t i = 0; i < arr.size(); ++i) {
        const json& row = arr[i];
        if (!row.is_array() || row.size() != 2) {
            throw ValidationError("ensemble field '" + name + "' entry " + std::to_string(i) +
                                  " must have shape [2]");
        }
        const std::string where = name + "[" + std::to_string(i) + "]";
        out(static_cast<Eigen::Index>(i), 0) = number_at(row[0], where);
        out(static_cast<Eigen::Index>(i), 1) = number_at(row[1], where);
    }
    return out;
}

ResponseArray parse_matrices(const json& arr, const std::string& name) {
    if (!arr.is_array()) {
        throw ValidationError("ensemble field '" + name + "' must be an array of 2x2 matrices");
    }
    ResponseArray out(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        const json& m = arr[i];
        if (!m.is_array() || m.size() != 2 || !m[0].is_array() || m[0].size() != 2 ||
            !m[1].is_array() || m[1].size() != 2) {
            throw ValidationError("ensemble field '" + name + "' entry " + std::to_string(i) +
                                  " must have shape [2, 2]");
        }
        const std::string where = name + "[" + std::to_string(i) + "]";
        for (int r = 0; r < 2; ++r) {
            for (int c = 0; c < 2; ++c) {
                out[i](r, c) = number_at(m[static_cast<size_t>(r)][static_cast<size_t>(c)], where);
            }
        }
    }
    return out;
}

json pairs_json(const ShapeArray& a) {
    json out = json::array();
    for (Eigen::Index i = 0; i < a.rows(); ++i) {
        out.push_back(json::array({a(i, 0), a(i, 1)}));
    }
    return out;
}

} // namespace

Ensemble parse_ensemble(const json& doc) {
    if (!doc.is_object()) {
        throw ValidationError("ensemble document must be a JSON object");
    }
    if (!doc.contains("g")) {
        throw ValidationError("ensemble is missing field 'g'");
    }

    Ensemble e;
    e.g = parse_pairs(doc["g"], "g");

    if (doc.contains("R")) {
        e.R = parse_matrices(doc["R"], "R");
    } else if (doc.contains("gsens")) {
        e.R = parse_matrices(doc["gsens"], "gsens");
    } else {
        throw ValidationError("ensemble is missing field 'R'");
    }

    if (doc.contains("gpsf")) {
        e.gpsf = parse_pairs(doc["gpsf"], "gpsf");
        if (e.gpsf->rows() != e.g.rows()) {
            throw ValidationError("gpsf has " + std::to_string(e.gpsf->rows()) +
                                  " entries but g has " + std::to_string(e.g.rows()));
        }
    }
    if (doc.contains("Rpsf")) {
        e.Rpsf = parse_pairs(doc["Rpsf"], "Rpsf");
        if (e.Rpsf->rows() != static_cast<Eigen::Index>(e.R.size())) {
            throw ValidationError("Rpsf has " + std::to_string(e.Rpsf->rows()) +
                                  " entries but R has " + std::to_string(e.R.size()));
        }
    }
    if (doc.contains("weights")) {
        const json& w = doc["weights"];
        if (!w.is_array() || w.size() != static_cast<size_t>(e.g.rows())) {
            throw ValidationError("weights must be an array with one entry per object");
        }
        VectorXd weights(static_cast<Eigen::Index>(w.size()));
        for (size_t i = 0; i < w.size(); ++i) {
            weights(static_cast<Eigen::Index>(i)) = number_at(w[i], "weights[" + std::to_string(i) + "]");
        }
        e.weights = weights;
    }
    return e;
}

Ensemble read_ensemble_json(const fs::path& path) {
    const std::string text = core::read_text(path);
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& ex) {
        throw IOError("Cannot parse ensemble " + path.string() + ": " + ex.what());
    }
    return parse_ensemble(doc);
}

json ensemble_to_json(const Ensemble& ensemble) {
    json doc;
    doc["g"] = pairs_json(ensemble.g);

    json R = json::array();
    for (const auto& m : ensemble.R) {
        R.push_back(json::array({json::array({m(0, 0), m(0, 1)}), json::array({m(1, 0), m(1, 1)})}));
    }
    doc["R"] = R;

    if (ensemble.gpsf) doc["gpsf"] = pairs_json(*ensemble.gpsf);
    if (ensemble.Rpsf) doc["Rpsf"] = pairs_json(*ensemble.Rpsf);
    if (ensemble.weights) {
        json w = json::array();
        for (Eigen::Index i = 0; i < ensemble.weights->size(); ++i) {
            w.push_back((*ensemble.weights)(i));
        }
        doc["weights"] = w;
    }
    return doc;
}

void write_ensemble_json(const fs::path& path, const Ensemble& ensemble) {
    core::write_text(path, ensemble_to_json(ensemble).dump(2) + "\n");
}

} // namespace metacal::io
