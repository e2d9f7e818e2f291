#include "metacal/pipeline/symmetrization_cache.hpp"

#include <sstream>
#include <tuple>

namespace metacal::pipeline {

SymmetrizationKey SymmetrizationKey::make(SymmetrizeType type, int rows, int cols,
                                          const Shape& shear) {
    SymmetrizationKey key;
    key.rows = rows;
    key.cols = cols;
    switch (type) {
        case SymmetrizeType::Gal:
            key.g1 = shear.g1;
            key.g2 = shear.g2;
            break;
        case SymmetrizeType::Psf:
            key.g1psf = shear.g1;
            key.g2psf = shear.g2;
            break;
    }
    return key;
}

bool SymmetrizationKey::operator<(const SymmetrizationKey& other) const {
    return std::tie(rows, cols, g1, g2, g1psf, g2psf) <
           std::tie(other.rows, other.cols, other.g1, other.g2, other.g1psf, other.g2psf);
}

bool SymmetrizationKey::operator==(const SymmetrizationKey& other) const {
    return std::tie(rows, cols, g1, g2, g1psf, g2psf) ==
           std::tie(other.rows, other.cols, other.g1, other.g2, other.g1psf, other.g2psf);
}

std::string SymmetrizationKey::to_string() const {
    std::ostringstream oss;
    oss << rows << "x" << cols << " g=(" << g1 << ", " << g2 << ") gpsf=(" << g1psf << ", "
        << g2psf << ")";
    return oss.str();
}

SymmetrizationCache::SymmetrizationCache(std::size_t capacity) : capacity_(capacity) {}

std::optional<SymmetrizedField> SymmetrizationCache::find(const SymmetrizationKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        ++misses_;
        return std::nullopt;
    }
    ++hits_;
    return it->second;
}

void SymmetrizationCache::insert(const SymmetrizationKey& key, SymmetrizedField field) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.count(key) > 0) {
        return;
    }
    entries_.emplace(key, std::move(field));
    order_.push_back(key);

    if (capacity_ > 0) {
        while (entries_.size() > capacity_) {
            entries_.erase(order_.front());
            order_.pop_front();
        }
    }
}

void SymmetrizationCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    order_.clear();
    hits_ = 0;
    misses_ = 0;
}

std::size_t SymmetrizationCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::size_t SymmetrizationCache::hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

std::size_t SymmetrizationCache::misses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
}

} // namespace metacal::pipeline
