#include "metacal/core/types.hpp"
#include "metacal/core/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace metacal {

namespace {

std::string normalize_tag(const std::string& s) {
    std::string norm = s;
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    norm.erase(norm.begin(),
               std::find_if(norm.begin(), norm.end(), not_space));
    norm.erase(std::find_if(norm.rbegin(), norm.rend(), not_space).base(),
               norm.end());
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return norm;
}

} // namespace

double Shape::g() const {
    return std::sqrt(g1 * g1 + g2 * g2);
}

std::string Shape::to_string() const {
    std::ostringstream oss;
    oss << "(" << g1 << ", " << g2 << ")";
    return oss.str();
}

void check_shear(const Shape& shear) {
    if (!std::isfinite(shear.g1) || !std::isfinite(shear.g2)) {
        throw ValidationError("shear must be finite, got " + shear.to_string());
    }
    if (shear.g() >= 1.0) {
        throw ValidationError("shear magnitude must be < 1, got " + shear.to_string());
    }
}

std::string target_psf_mode_to_string(TargetPsfMode mode) {
    switch (mode) {
        case TargetPsfMode::GalShear: return "gal_shear";
        case TargetPsfMode::PsfShear: return "psf_shear";
    }
    throw ConfigError("unknown target psf mode");
}

TargetPsfMode string_to_target_psf_mode(const std::string& s) {
    const std::string norm = normalize_tag(s);
    if (norm == "gal_shear") return TargetPsfMode::GalShear;
    if (norm == "psf_shear") return TargetPsfMode::PsfShear;
    throw ConfigError("unknown target psf mode '" + s + "', expected gal_shear or psf_shear");
}

std::string symmetrize_type_to_string(SymmetrizeType type) {
    switch (type) {
        case SymmetrizeType::Gal: return "gal";
        case SymmetrizeType::Psf: return "psf";
    }
    throw ConfigError("unknown symmetrize type");
}

SymmetrizeType string_to_symmetrize_type(const std::string& s) {
    const std::string norm = normalize_tag(s);
    if (norm == "gal") return SymmetrizeType::Gal;
    if (norm == "psf") return SymmetrizeType::Psf;
    throw ConfigError("unknown symmetrize type '" + s + "', expected gal or psf");
}

std::string estimator_method_to_string(EstimatorMethod method) {
    switch (method) {
        case EstimatorMethod::Mean: return "mean";
        case EstimatorMethod::Jackknife: return "jackknife";
        case EstimatorMethod::JackknifeWeighted: return "jackknife_weighted";
        case EstimatorMethod::Bootstrap: return "bootstrap";
    }
    throw ConfigError("unknown estimator method");
}

EstimatorMethod string_to_estimator_method(const std::string& s) {
    const std::string norm = normalize_tag(s);
    if (norm == "mean") return EstimatorMethod::Mean;
    if (norm == "jackknife") return EstimatorMethod::Jackknife;
    if (norm == "jackknife_weighted") return EstimatorMethod::JackknifeWeighted;
    if (norm == "bootstrap") return EstimatorMethod::Bootstrap;
    throw ConfigError("unknown estimator method '" + s +
                      "', expected mean, jackknife, jackknife_weighted or bootstrap");
}

std::string remainder_policy_to_string(RemainderPolicy policy) {
    switch (policy) {
        case RemainderPolicy::Require: return "require";
        case RemainderPolicy::Truncate: return "truncate";
    }
    throw ConfigError("unknown remainder policy");
}

RemainderPolicy string_to_remainder_policy(const std::string& s) {
    const std::string norm = normalize_tag(s);
    if (norm == "require") return RemainderPolicy::Require;
    if (norm == "truncate") return RemainderPolicy::Truncate;
    throw ConfigError("unknown remainder policy '" + s + "', expected require or truncate");
}

std::string shape_of(const Matrix2Dd& m) {
    return "[" + std::to_string(m.rows()) + ", " + std::to_string(m.cols()) + "]";
}

std::string shape_of(const Matrix2Di& m) {
    return "[" + std::to_string(m.rows()) + ", " + std::to_string(m.cols()) + "]";
}

} // namespace metacal
