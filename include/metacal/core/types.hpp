#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <string>
#include <vector>

namespace metacal {

// Matrix types (NumPy equivalents)
using Matrix2Dd = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Matrix2Di = Eigen::Matrix<std::int32_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using VectorXd = Eigen::VectorXd;

// Per-object ensembles: [N,2] shapes and [N,2,2] responses
using ShapeArray = Eigen::Matrix<double, Eigen::Dynamic, 2, Eigen::RowMajor>;
using ResponseArray = std::vector<Eigen::Matrix2d>;

// Reduced shear / ellipticity pair
struct Shape {
    double g1 = 0.0;
    double g2 = 0.0;

    Shape() = default;
    Shape(double g1_, double g2_) : g1(g1_), g2(g2_) {}

    double g() const;
    std::string to_string() const;

    bool operator==(const Shape& other) const { return g1 == other.g1 && g2 == other.g2; }
    bool operator!=(const Shape& other) const { return !(*this == other); }
};

// Throws ValidationError unless the shape is finite with |g| < 1.
void check_shear(const Shape& shear);

// Target PSF flavour: dilated only, or dilated and sheared
enum class TargetPsfMode {
    GalShear,
    PsfShear
};

// Which branch a symmetrization key belongs to
enum class SymmetrizeType {
    Gal,
    Psf
};

enum class EstimatorMethod {
    Mean,
    Jackknife,
    JackknifeWeighted,
    Bootstrap
};

// Handling of a trailing partial jackknife chunk
enum class RemainderPolicy {
    Require,   // ensemble size must be a multiple of the chunk size
    Truncate   // drop the partial chunk from the leave-out loop
};

std::string target_psf_mode_to_string(TargetPsfMode mode);
TargetPsfMode string_to_target_psf_mode(const std::string& s);

std::string symmetrize_type_to_string(SymmetrizeType type);
SymmetrizeType string_to_symmetrize_type(const std::string& s);

std::string estimator_method_to_string(EstimatorMethod method);
EstimatorMethod string_to_estimator_method(const std::string& s);

std::string remainder_policy_to_string(RemainderPolicy policy);
RemainderPolicy string_to_remainder_policy(const std::string& s);

std::string shape_of(const Matrix2Dd& m);
std::string shape_of(const Matrix2Di& m);

// CLI run phases
enum class Phase {
    LOAD_CONFIG = 0,
    LOAD_INPUT = 1,
    METACAL = 2,
    ESTIMATE = 3,
    WRITE_OUTPUT = 4,
    DONE = 5
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::LOAD_CONFIG: return "LOAD_CONFIG";
        case Phase::LOAD_INPUT: return "LOAD_INPUT";
        case Phase::METACAL: return "METACAL";
        case Phase::ESTIMATE: return "ESTIMATE";
        case Phase::WRITE_OUTPUT: return "WRITE_OUTPUT";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace metacal
