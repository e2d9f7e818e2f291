#pragma once

#include "metacal/core/types.hpp"
#include "metacal/observation/jacobian.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <vector>

namespace metacal {

using json = nlohmann::json;

struct S2NSums {
    double isum = 0.0;
    double vsum = 0.0;
    long npix = 0;
};

// Value returned by s2n() when no pixel carries positive weight
constexpr double kS2NUnset = -9999.0;

double s2n_from_sums(const S2NSums& sums);

// An image with its weight map, jacobian and optional companions.
// Every array setter checks that the shape matches the image.
class Observation {
public:
    explicit Observation(Matrix2Dd image,
                         std::optional<Matrix2Dd> weight = std::nullopt,
                         std::optional<Jacobian> jacobian = std::nullopt);

    int rows() const { return static_cast<int>(image_.rows()); }
    int cols() const { return static_cast<int>(image_.cols()); }

    const Matrix2Dd& image() const { return image_; }
    void set_image(Matrix2Dd image);

    // Uniform weight of 1.0 when nullopt
    const Matrix2Dd& weight() const { return weight_; }
    void set_weight(std::optional<Matrix2Dd> weight);

    // Unit jacobian on the image center when nullopt
    const Jacobian& jacobian() const { return jacobian_; }
    void set_jacobian(std::optional<Jacobian> jacobian);

    bool has_psf() const { return static_cast<bool>(psf_); }
    const Observation& psf() const;
    void set_psf(Observation psf);
    void clear_psf();

    bool has_bmask() const { return bmask_.has_value(); }
    const Matrix2Di& bmask() const;
    void set_bmask(Matrix2Di bmask);
    void clear_bmask();

    bool has_ormask() const { return ormask_.has_value(); }
    const Matrix2Di& ormask() const;
    void set_ormask(Matrix2Di ormask);
    void clear_ormask();

    bool has_noise() const { return noise_.has_value(); }
    const Matrix2Dd& noise() const;
    void set_noise(Matrix2Dd noise);
    void clear_noise();

    const json& meta() const { return meta_; }
    void set_meta(json meta);
    void update_meta(const json& meta);

    S2NSums s2n_sums() const;
    double s2n() const;

private:
    template <typename M>
    void check_same_shape(const M& other, const char* what) const;

    Matrix2Dd image_;
    Matrix2Dd weight_;
    Jacobian jacobian_;
    std::shared_ptr<const Observation> psf_;
    std::optional<Matrix2Di> bmask_;
    std::optional<Matrix2Di> ormask_;
    std::optional<Matrix2Dd> noise_;
    json meta_ = json::object();
};

class ObsList {
public:
    explicit ObsList(json meta = json::object());

    void push_back(Observation obs);
    std::size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }
    const Observation& operator[](std::size_t i) const;
    Observation& operator[](std::size_t i);

    std::vector<Observation>::const_iterator begin() const { return items_.begin(); }
    std::vector<Observation>::const_iterator end() const { return items_.end(); }

    const json& meta() const { return meta_; }
    void set_meta(json meta);
    void update_meta(const json& meta);

    S2NSums s2n_sums() const;
    double s2n() const;

private:
    std::vector<Observation> items_;
    json meta_;
};

class MultiBandObsList {
public:
    explicit MultiBandObsList(json meta = json::object());

    void push_back(ObsList band);
    std::size_t size() const { return bands_.size(); }
    bool empty() const { return bands_.empty(); }
    const ObsList& operator[](std::size_t i) const;
    ObsList& operator[](std::size_t i);

    std::vector<ObsList>::const_iterator begin() const { return bands_.begin(); }
    std::vector<ObsList>::const_iterator end() const { return bands_.end(); }

    const json& meta() const { return meta_; }
    void set_meta(json meta);
    void update_meta(const json& meta);

    S2NSums s2n_sums() const;
    double s2n() const;

private:
    std::vector<ObsList> bands_;
    json meta_;
};

MultiBandObsList get_mb_obs(const Observation& obs);
MultiBandObsList get_mb_obs(const ObsList& obs_list);

} // namespace metacal
