// File: src/core/weight_vector.cpp
#include "core/weight_vector.hpp"
#include <cmath>
#include <stdexcept>

namespace cinecbr {

void WeightVector::Set(const std::string& name, float weight) {
    if (!std::isfinite(weight) || weight < 0.0f || weight > 1.0f) {
        throw std::invalid_argument("Weight for '" + name + "' must be between 0.0 and 1.0");
    }
    weights_[name] = weight;
}

float WeightVector::Get(const std::string& name) const {
    auto it = weights_.find(name);
    return it != weights_.end() ? it->second : 0.0f;
}

bool WeightVector::Has(const std::string& name) const {
    return weights_.find(name) != weights_.end();
}

bool WeightVector::Erase(const std::string& name) {
    return weights_.erase(name) > 0;
}

float WeightVector::TotalWeight() const {
    float total = 0.0f;
    for (const auto& [name, weight] : weights_) {
        total += weight;
    }
    return total;
}

} // namespace cinecbr
