// File: src/core/attribute_schema.cpp
#include "core/attribute_schema.hpp"
#include <cmath>
#include <stdexcept>
#include <unordered_set>

namespace cinecbr {

// ============================================================================
// AttributeKind / AttributePresence
// ============================================================================

const char* ToString(AttributeKind kind) {
    switch (kind) {
        case AttributeKind::CATEGORICAL:   return "categorical";
        case AttributeKind::NUMERIC_RANGE: return "numeric_range";
        case AttributeKind::ORDINAL:       return "ordinal";
        case AttributeKind::SET_JACCARD:   return "set_jaccard";
    }
    return "unknown";
}

AttributeKind ParseAttributeKind(const std::string& str) {
    if (str == "categorical") return AttributeKind::CATEGORICAL;
    if (str == "numeric_range" || str == "numeric") return AttributeKind::NUMERIC_RANGE;
    if (str == "ordinal") return AttributeKind::ORDINAL;
    if (str == "set_jaccard" || str == "set") return AttributeKind::SET_JACCARD;
    throw std::invalid_argument("Unknown attribute kind: " + str);
}

const char* ToString(AttributePresence presence) {
    switch (presence) {
        case AttributePresence::PRESENT:       return "present";
        case AttributePresence::ABSENT:        return "absent";
        case AttributePresence::NOT_IN_SCHEMA: return "not_in_schema";
    }
    return "unknown";
}

// ============================================================================
// AttributeSpec
// ============================================================================

AttributeSpec AttributeSpec::Categorical(const std::string& name) {
    AttributeSpec spec;
    spec.name = name;
    spec.kind = AttributeKind::CATEGORICAL;
    return spec;
}

AttributeSpec AttributeSpec::NumericRange(const std::string& name, double min, double max) {
    AttributeSpec spec;
    spec.name = name;
    spec.kind = AttributeKind::NUMERIC_RANGE;
    spec.range.min = min;
    spec.range.max = max;
    return spec;
}

AttributeSpec AttributeSpec::Ordinal(const std::string& name,
                                     std::vector<std::string> ordered_values,
                                     std::string fallback_unknown) {
    AttributeSpec spec;
    spec.name = name;
    spec.kind = AttributeKind::ORDINAL;
    spec.ordinal.ordered_values = std::move(ordered_values);
    spec.ordinal.fallback_unknown = std::move(fallback_unknown);
    return spec;
}

AttributeSpec AttributeSpec::SetJaccard(const std::string& name) {
    AttributeSpec spec;
    spec.name = name;
    spec.kind = AttributeKind::SET_JACCARD;
    return spec;
}

std::string AttributeSpec::Validate() const {
    if (name.empty()) {
        return "attribute name must not be empty";
    }

    switch (kind) {
        case AttributeKind::NUMERIC_RANGE:
            if (!std::isfinite(range.min) || !std::isfinite(range.max)) {
                return "range of '" + name + "' must be finite";
            }
            // max == min is the degenerate single-value range
            if (range.max < range.min) {
                return "range of '" + name + "' must have max >= min";
            }
            break;

        case AttributeKind::ORDINAL: {
            if (ordinal.ordered_values.empty()) {
                return "ordered_values of '" + name + "' must not be empty";
            }
            std::unordered_set<std::string> seen;
            for (const auto& value : ordinal.ordered_values) {
                if (!seen.insert(value).second) {
                    return "ordered_values of '" + name + "' contains duplicate '" + value + "'";
                }
            }
            break;
        }

        case AttributeKind::CATEGORICAL:
        case AttributeKind::SET_JACCARD:
            break;
    }

    return {};
}

// ============================================================================
// AttributeSchema
// ============================================================================

void AttributeSchema::AddAttribute(const AttributeSpec& spec, float default_weight) {
    std::string error = spec.Validate();
    if (!error.empty()) {
        throw std::invalid_argument(error);
    }
    if (index_.count(spec.name) > 0) {
        throw std::invalid_argument("Attribute already configured: " + spec.name);
    }
    if (!std::isfinite(default_weight) || default_weight < 0.0f || default_weight > 1.0f) {
        throw std::invalid_argument("Default weight of '" + spec.name +
                                    "' must be between 0.0 and 1.0");
    }

    index_.emplace(spec.name, specs_.size());
    specs_.push_back(spec);
    default_weights_.push_back(default_weight);
}

const AttributeSpec* AttributeSchema::Find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return &specs_[it->second];
}

AttributePresence AttributeSchema::Classify(const CaseRecord& record,
                                            const std::string& name) const {
    if (!Contains(name)) {
        return AttributePresence::NOT_IN_SCHEMA;
    }
    return record.Has(name) ? AttributePresence::PRESENT : AttributePresence::ABSENT;
}

float AttributeSchema::GetDefaultWeight(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return 0.0f;
    }
    return default_weights_[it->second];
}

WeightVector AttributeSchema::DefaultWeights() const {
    WeightVector weights;
    for (size_t i = 0; i < specs_.size(); ++i) {
        weights.Set(specs_[i].name, default_weights_[i]);
    }
    return weights;
}

} // namespace cinecbr
