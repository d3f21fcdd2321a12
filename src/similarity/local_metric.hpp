// File: src/similarity/local_metric.hpp
#pragma once

#include "core/attribute_schema.hpp"
#include "core/case_record.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cinecbr {

// ============================================================================
// Local similarity functions
// ============================================================================
//
// Each function compares one attribute value of a query against the same
// attribute of a case and returns a score in [0.0, 1.0] where 1.0 means
// identical. All of them are symmetric in their two value arguments and
// total: missing or invalid input maps to a boundary score, never an error.

/// 1.0 if the values are equal (same type and value), else 0.0
float CategoricalSimilarity(const AttributeValue& a, const AttributeValue& b);

/// 1 - |a - b| / (max - min), floored at 0.0
///
/// Missing or non-finite values score 0.0. A degenerate range (max <= min)
/// scores 1.0 for equal values and 0.0 otherwise.
float NumericRangeSimilarity(std::optional<double> a, std::optional<double> b,
                             double min, double max);

/// 1 - |idx(a) - idx(b)| / (n - 1) over the ordered values
///
/// Empty input is replaced by params.fallback_unknown before lookup; a value
/// not found verbatim is retried in normalized form (see
/// NormalizeOrdinalValue). If either side still does not resolve, the
/// metric degrades to exact equality of the raw strings.
float OrdinalSimilarity(const std::string& a, const std::string& b,
                        const OrdinalParams& params);

/// |A ∩ B| / |A ∪ B| over trimmed, non-empty, de-duplicated values
///
/// Two empty sets score 1.0; exactly one empty set scores 0.0.
float SetJaccardSimilarity(const std::vector<std::string>& a,
                           const std::vector<std::string>& b);

/// Upper-case, trimmed, internal whitespace replaced by single hyphens
/// ("pg 13" -> "PG-13")
std::string NormalizeOrdinalValue(const std::string& value);

/// Position of a value in the ordered list, after fallback and normalization
std::optional<size_t> ResolveOrdinalIndex(const std::string& value,
                                          const OrdinalParams& params);

// ============================================================================
// LocalMetric
// ============================================================================

/// Abstract base class for per-attribute similarity metrics
///
/// One implementation per AttributeKind. Implementations coerce the stored
/// AttributeValue to the representation their function expects; a value of
/// the wrong shape scores 0.0.
class LocalMetric {
public:
    virtual ~LocalMetric() = default;

    /// Compare two attribute values
    /// @return Similarity score [0.0, 1.0]
    virtual float Compute(const AttributeValue& a, const AttributeValue& b) const = 0;

    /// Kind of attribute this metric compares
    virtual AttributeKind GetKind() const = 0;

    /// Get the name of this metric
    virtual std::string GetName() const = 0;

    /// similarity(a,b) == similarity(b,a)
    virtual bool IsSymmetric() const { return true; }
};

class CategoricalMetric : public LocalMetric {
public:
    float Compute(const AttributeValue& a, const AttributeValue& b) const override;
    AttributeKind GetKind() const override { return AttributeKind::CATEGORICAL; }
    std::string GetName() const override { return "Categorical"; }
};

class NumericRangeMetric : public LocalMetric {
public:
    explicit NumericRangeMetric(const NumericRangeParams& params) : params_(params) {}

    float Compute(const AttributeValue& a, const AttributeValue& b) const override;
    AttributeKind GetKind() const override { return AttributeKind::NUMERIC_RANGE; }
    std::string GetName() const override { return "NumericRange"; }

    const NumericRangeParams& GetParams() const { return params_; }

private:
    NumericRangeParams params_;
};

class OrdinalMetric : public LocalMetric {
public:
    explicit OrdinalMetric(OrdinalParams params) : params_(std::move(params)) {}

    float Compute(const AttributeValue& a, const AttributeValue& b) const override;
    AttributeKind GetKind() const override { return AttributeKind::ORDINAL; }
    std::string GetName() const override { return "Ordinal"; }

    const OrdinalParams& GetParams() const { return params_; }

private:
    OrdinalParams params_;
};

class SetJaccardMetric : public LocalMetric {
public:
    float Compute(const AttributeValue& a, const AttributeValue& b) const override;
    AttributeKind GetKind() const override { return AttributeKind::SET_JACCARD; }
    std::string GetName() const override { return "SetJaccard"; }
};

/// Create the metric configured by an attribute spec
std::shared_ptr<LocalMetric> CreateLocalMetric(const AttributeSpec& spec);

} // namespace cinecbr
