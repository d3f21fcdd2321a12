// File: src/core/attribute_schema.hpp
#pragma once

#include "core/case_record.hpp"
#include "core/weight_vector.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace cinecbr {

// AttributeKind: which local similarity metric compares an attribute
enum class AttributeKind : uint8_t {
    CATEGORICAL = 0,     // Exact match of a nominal value
    NUMERIC_RANGE = 1,   // Distance normalized by a [min, max] range
    ORDINAL = 2,         // Distance between positions in an ordered list
    SET_JACCARD = 3,     // Jaccard index of two value sets
};

// Convert AttributeKind to string ("categorical", "numeric_range", ...)
const char* ToString(AttributeKind kind);

// Parse AttributeKind from string
// @throws std::invalid_argument for unknown names
AttributeKind ParseAttributeKind(const std::string& str);

// AttributePresence: how an attribute relates to a given record
enum class AttributePresence : uint8_t {
    PRESENT = 0,         // Configured in the schema and set on the record
    ABSENT = 1,          // Configured in the schema but unknown on the record
    NOT_IN_SCHEMA = 2,   // Not configured; never compared
};

const char* ToString(AttributePresence presence);

/// Parameters of a NUMERIC_RANGE attribute
struct NumericRangeParams {
    double min{0.0};
    double max{1.0};

    double Span() const { return max - min; }
};

/// Parameters of an ORDINAL attribute
struct OrdinalParams {
    /// Values from least to most (e.g. least to most restrictive rating)
    std::vector<std::string> ordered_values;

    /// Substituted for an empty value before lookup
    std::string fallback_unknown;
};

/// Static description of one attribute and its similarity metric
struct AttributeSpec {
    std::string name;
    AttributeKind kind{AttributeKind::CATEGORICAL};

    /// Used when kind == NUMERIC_RANGE
    NumericRangeParams range;

    /// Used when kind == ORDINAL
    OrdinalParams ordinal;

    static AttributeSpec Categorical(const std::string& name);
    static AttributeSpec NumericRange(const std::string& name, double min, double max);
    static AttributeSpec Ordinal(const std::string& name,
                                 std::vector<std::string> ordered_values,
                                 std::string fallback_unknown);
    static AttributeSpec SetJaccard(const std::string& name);

    /// Check the parameter invariants of this spec
    /// @return Empty string if valid, otherwise a description of the problem
    std::string Validate() const;
};

/// Attribute Schema
///
/// Declarative registry of attribute specs and their default weights.
/// Lookup of an unknown name yields nullptr ("not configured"), which the
/// aggregator treats as a silent skip rather than an error.
class AttributeSchema {
public:
    AttributeSchema() = default;

    /// Register an attribute
    /// @param spec Attribute description
    /// @param default_weight Weight used by DefaultWeights()
    /// @throws std::invalid_argument on duplicate name, invalid parameters
    ///         or a weight outside [0, 1]
    void AddAttribute(const AttributeSpec& spec, float default_weight);

    /// Find spec by attribute name
    /// @return Pointer to the spec, or nullptr if not configured
    const AttributeSpec* Find(const std::string& name) const;

    bool Contains(const std::string& name) const { return Find(name) != nullptr; }

    /// Classify an attribute of a record as present, absent or unconfigured
    AttributePresence Classify(const CaseRecord& record, const std::string& name) const;

    /// Default weight of an attribute (0.0 if not configured)
    float GetDefaultWeight(const std::string& name) const;

    /// Default weight vector covering every configured attribute
    WeightVector DefaultWeights() const;

    /// Specs in declaration order
    const std::vector<AttributeSpec>& GetAttributes() const { return specs_; }

    size_t Size() const { return specs_.size(); }
    bool Empty() const { return specs_.empty(); }

private:
    std::vector<AttributeSpec> specs_;
    std::vector<float> default_weights_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace cinecbr
