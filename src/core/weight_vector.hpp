// File: src/core/weight_vector.hpp
#pragma once

#include <map>
#include <string>

namespace cinecbr {

/// WeightVector: per-attribute importance weights in [0.0, 1.0]
///
/// Weights need not sum to 1.0; aggregation renormalizes over the
/// attributes actually compared. A retrieval call takes the vector by
/// value, so the caller may keep editing its own copy between calls.
class WeightVector {
public:
    using const_iterator = std::map<std::string, float>::const_iterator;

    WeightVector() = default;

    /// Set weight for an attribute
    /// @throws std::invalid_argument if weight is not finite or outside [0, 1]
    void Set(const std::string& name, float weight);

    /// Get weight for an attribute (0.0 if not set)
    float Get(const std::string& name) const;

    bool Has(const std::string& name) const;
    bool Erase(const std::string& name);

    /// Sum of all configured weights
    float TotalWeight() const;

    size_t Size() const { return weights_.size(); }
    bool Empty() const { return weights_.empty(); }

    const_iterator begin() const { return weights_.begin(); }
    const_iterator end() const { return weights_.end(); }

    bool operator==(const WeightVector& other) const { return weights_ == other.weights_; }

private:
    std::map<std::string, float> weights_;
};

} // namespace cinecbr
