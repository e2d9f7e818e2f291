#pragma once

#include "metacal/core/types.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>

namespace metacal::io {

namespace fs = std::filesystem;
using json = nlohmann::json;

// Per-object measurements fed to the shear estimators.
// R may have a different length than g (deep-field responses).
struct Ensemble {
    ShapeArray g;
    std::optional<ShapeArray> gpsf;
    ResponseArray R;
    std::optional<ShapeArray> Rpsf;
    std::optional<VectorXd> weights;
};

// {"g": [[g1, g2], ...], "R": [[[r11, r12], [r21, r22]], ...], optional
// "gpsf", "Rpsf", "weights"}; "gsens" is accepted in place of "R".
Ensemble parse_ensemble(const json& doc);
Ensemble read_ensemble_json(const fs::path& path);

json ensemble_to_json(const Ensemble& ensemble);
void write_ensemble_json(const fs::path& path, const Ensemble& ensemble);

} // namespace metacal::io
