#pragma once

#include <complex>
#include <memory>
#include <string>

namespace metacal::image {

using Complex = std::complex<double>;

// Immutable continuous surface-brightness model, evaluated in k-space.
// Convention: f(k) = integral f(x) exp(-i k.x) d^2x, so kvalue(0, 0) is the flux.
class Profile {
public:
    virtual ~Profile() = default;

    virtual Complex kvalue(double kx, double ky) const = 0;

    // Radius beyond which kvalue is treated as zero; may be infinite.
    virtual double max_k() const = 0;

    virtual std::string describe() const = 0;

    double flux() const { return kvalue(0.0, 0.0).real(); }
};

using ProfilePtr = std::shared_ptr<const Profile>;

// Correlated noise model: the correlation function as a profile
struct CorrelatedNoise {
    ProfilePtr correlation;
};

} // namespace metacal::image
