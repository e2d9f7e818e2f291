#include "metacal/observation/observation.hpp"
#include "metacal/core/errors.hpp"

#include <cmath>

namespace metacal {

namespace {

json checked_meta(json meta) {
    if (meta.is_null()) return json::object();
    if (!meta.is_object()) {
        throw ValidationError("meta data must be a JSON object, got " + std::string(meta.type_name()));
    }
    return meta;
}

void merge_meta(json& target, const json& update) {
    if (!update.is_object()) {
        throw ValidationError("meta data must be a JSON object, got " + std::string(update.type_name()));
    }
    target.update(update);
}

void accumulate(S2NSums& total, const S2NSums& part) {
    total.isum += part.isum;
    total.vsum += part.vsum;
    total.npix += part.npix;
}

} // namespace

double s2n_from_sums(const S2NSums& sums) {
    if (sums.vsum > 0.0) {
        return sums.isum / std::sqrt(sums.vsum);
    }
    return kS2NUnset;
}

Observation::Observation(Matrix2Dd image, std::optional<Matrix2Dd> weight,
                         std::optional<Jacobian> jacobian)
    : image_(std::move(image)),
      jacobian_(Jacobian::centered(static_cast<int>(image_.rows()), static_cast<int>(image_.cols()))) {
    if (image_.rows() < 1 || image_.cols() < 1) {
        throw ValidationError("observation image must be non-empty, got " + shape_of(image_));
    }
    set_weight(std::move(weight));
    set_jacobian(std::move(jacobian));
}

template <typename M>
void Observation::check_same_shape(const M& other, const char* what) const {
    if (other.rows() != image_.rows() || other.cols() != image_.cols()) {
        throw ValidationError(std::string("image and ") + what + " must have the same shape, got " +
                              shape_of(image_) + " vs " + shape_of(other));
    }
}

void Observation::set_image(Matrix2Dd image) {
    if (image.rows() != image_.rows() || image.cols() != image_.cols()) {
        throw ValidationError("old and new image must have the same shape, got " +
                              shape_of(image) + " vs " + shape_of(image_));
    }
    image_ = std::move(image);
}

void Observation::set_weight(std::optional<Matrix2Dd> weight) {
    if (!weight) {
        weight_ = Matrix2Dd::Constant(image_.rows(), image_.cols(), 1.0);
        return;
    }
    check_same_shape(*weight, "weight");
    weight_ = std::move(*weight);
}

void Observation::set_jacobian(std::optional<Jacobian> jacobian) {
    if (!jacobian) {
        jacobian_ = Jacobian::centered(rows(), cols());
        return;
    }
    jacobian_ = *jacobian;
}

const Observation& Observation::psf() const {
    if (!psf_) {
        throw ValidationError("this observation has no psf set");
    }
    return *psf_;
}

void Observation::set_psf(Observation psf) {
    if (psf.has_psf()) {
        throw ValidationError("a psf observation cannot carry its own psf");
    }
    psf_ = std::make_shared<const Observation>(std::move(psf));
}

void Observation::clear_psf() {
    psf_.reset();
}

const Matrix2Di& Observation::bmask() const {
    if (!bmask_) {
        throw ValidationError("this observation has no bmask set");
    }
    return *bmask_;
}

void Observation::set_bmask(Matrix2Di bmask) {
    check_same_shape(bmask, "bmask");
    bmask_ = std::move(bmask);
}

void Observation::clear_bmask() {
    bmask_.reset();
}

const Matrix2Di& Observation::ormask() const {
    if (!ormask_) {
        throw ValidationError("this observation has no ormask set");
    }
    return *ormask_;
}

void Observation::set_ormask(Matrix2Di ormask) {
    check_same_shape(ormask, "ormask");
    ormask_ = std::move(ormask);
}

void Observation::clear_ormask() {
    ormask_.reset();
}

const Matrix2Dd& Observation::noise() const {
    if (!noise_) {
        throw ValidationError("this observation has no noise image set");
    }
    return *noise_;
}

void Observation::set_noise(Matrix2Dd noise) {
    check_same_shape(noise, "noise");
    noise_ = std::move(noise);
}

void Observation::clear_noise() {
    noise_.reset();
}

void Observation::set_meta(json meta) {
    meta_ = checked_meta(std::move(meta));
}

void Observation::update_meta(const json& meta) {
    merge_meta(meta_, meta);
}

S2NSums Observation::s2n_sums() const {
    S2NSums sums;
    for (Eigen::Index i = 0; i < weight_.size(); ++i) {
        const double w = weight_.data()[i];
        if (w > 0.0) {
            sums.isum += image_.data()[i];
            sums.vsum += 1.0 / w;
            ++sums.npix;
        }
    }
    return sums;
}

double Observation::s2n() const {
    return s2n_from_sums(s2n_sums());
}

ObsList::ObsList(json meta) : meta_(checked_meta(std::move(meta))) {}

void ObsList::push_back(Observation obs) {
    items_.push_back(std::move(obs));
}

const Observation& ObsList::operator[](std::size_t i) const {
    if (i >= items_.size()) {
        throw ValidationError("observation index " + std::to_string(i) + " out of range for list of " +
                              std::to_string(items_.size()));
    }
    return items_[i];
}

Observation& ObsList::operator[](std::size_t i) {
    if (i >= items_.size()) {
        throw ValidationError("observation index " + std::to_string(i) + " out of range for list of " +
                              std::to_string(items_.size()));
    }
    return items_[i];
}

void ObsList::set_meta(json meta) {
    meta_ = checked_meta(std::move(meta));
}

void ObsList::update_meta(const json& meta) {
    merge_meta(meta_, meta);
}

S2NSums ObsList::s2n_sums() const {
    S2NSums total;
    for (const auto& obs : items_) {
        accumulate(total, obs.s2n_sums());
    }
    return total;
}

double ObsList::s2n() const {
    return s2n_from_sums(s2n_sums());
}

MultiBandObsList::MultiBandObsList(json meta) : meta_(checked_meta(std::move(meta))) {}

void MultiBandObsList::push_back(ObsList band) {
    bands_.push_back(std::move(band));
}

const ObsList& MultiBandObsList::operator[](std::size_t i) const {
    if (i >= bands_.size()) {
        throw ValidationError("band index " + std::to_string(i) + " out of range for " +
                              std::to_string(bands_.size()) + " bands");
    }
    return bands_[i];
}

ObsList& MultiBandObsList::operator[](std::size_t i) {
    if (i >= bands_.size()) {
        throw ValidationError("band index " + std::to_string(i) + " out of range for " +
                              std::to_string(bands_.size()) + " bands");
    }
    return bands_[i];
}

void MultiBandObsList::set_meta(json meta) {
    meta_ = checked_meta(std::move(meta));
}

void MultiBandObsList::update_meta(const json& meta) {
    merge_meta(meta_, meta);
}

S2NSums MultiBandObsList::s2n_sums() const {
    S2NSums total;
    for (const auto& band : bands_) {
        accumulate(total, band.s2n_sums());
    }
    return total;
}

double MultiBandObsList::s2n() const {
    return s2n_from_sums(s2n_sums());
}

MultiBandObsList get_mb_obs(const Observation& obs) {
    ObsList list;
    list.push_back(obs);
    return get_mb_obs(list);
}

MultiBandObsList get_mb_obs(const ObsList& obs_list) {
    MultiBandObsList mb;
    mb.push_back(obs_list);
    return mb;
}

} // namespace metacal
