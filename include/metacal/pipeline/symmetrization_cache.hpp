#pragma once

#include "metacal/core/types.hpp"

#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace metacal::pipeline {

// Exact-valued key for a symmetrized noise field. Only one of the
// (g1, g2) / (g1psf, g2psf) pairs is non-zero for a given branch.
struct SymmetrizationKey {
    int rows = 0;
    int cols = 0;
    double g1 = 0.0;
    double g2 = 0.0;
    double g1psf = 0.0;
    double g2psf = 0.0;

    static SymmetrizationKey make(SymmetrizeType type, int rows, int cols, const Shape& shear);

    bool operator<(const SymmetrizationKey& other) const;
    bool operator==(const SymmetrizationKey& other) const;

    std::string to_string() const;
};

// Noise added by one symmetrization and the total noise variance after it
struct SymmetrizedField {
    Matrix2Dd diff;
    double variance = 0.0;
};

// Noise-difference fields keyed by image shape and applied shear.
// Thread-safe; values are deterministic per key so a lost insert race
// leaves an equivalent entry.
class SymmetrizationCache {
public:
    explicit SymmetrizationCache(std::size_t capacity = 0);

    std::optional<SymmetrizedField> find(const SymmetrizationKey& key) const;

    // Keeps an existing entry; evicts the oldest entry past capacity
    void insert(const SymmetrizationKey& key, SymmetrizedField field);

    void clear();
    std::size_t size() const;
    std::size_t capacity() const { return capacity_; }
    std::size_t hits() const;
    std::size_t misses() const;

private:
    mutable std::mutex mutex_;
    std::map<SymmetrizationKey, SymmetrizedField> entries_;
    std::deque<SymmetrizationKey> order_;
    std::size_t capacity_;
    mutable std::size_t hits_ = 0;
    mutable std::size_t misses_ = 0;
};

} // namespace metacal::pipeline
