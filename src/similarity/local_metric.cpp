// File: src/similarity/local_metric.cpp
#include "similarity/local_metric.hpp"
#include "core/string_utils.hpp"
#include <algorithm>
#include <cmath>
#include <set>

namespace cinecbr {

namespace {

std::set<std::string> ToValueSet(const std::vector<std::string>& values) {
    std::set<std::string> out;
    for (const auto& value : values) {
        std::string trimmed = Trim(value);
        if (!trimmed.empty()) {
            out.insert(std::move(trimmed));
        }
    }
    return out;
}

std::optional<double> AsNumber(const AttributeValue& value) {
    if (const double* number = std::get_if<double>(&value)) {
        return *number;
    }
    return std::nullopt;
}

std::optional<std::string> AsOrdinalText(const AttributeValue& value) {
    if (const std::string* text = std::get_if<std::string>(&value)) {
        return *text;
    }
    if (const double* number = std::get_if<double>(&value)) {
        return FormatNumber(*number);
    }
    const auto& list = std::get<std::vector<std::string>>(value);
    if (list.size() == 1) {
        return list.front();
    }
    return std::nullopt;
}

std::vector<std::string> AsValueList(const AttributeValue& value) {
    if (const std::string* text = std::get_if<std::string>(&value)) {
        return {*text};
    }
    if (const double* number = std::get_if<double>(&value)) {
        return {FormatNumber(*number)};
    }
    return std::get<std::vector<std::string>>(value);
}

} // anonymous namespace

// ============================================================================
// Local similarity functions
// ============================================================================

float CategoricalSimilarity(const AttributeValue& a, const AttributeValue& b) {
    return a == b ? 1.0f : 0.0f;
}

float NumericRangeSimilarity(std::optional<double> a, std::optional<double> b,
                             double min, double max) {
    if (!a || !b || !std::isfinite(*a) || !std::isfinite(*b)) {
        return 0.0f;
    }

    double span = max - min;
    if (!(span > 0.0)) {
        return *a == *b ? 1.0f : 0.0f;
    }

    // Out-of-range values can push the raw score below zero
    double similarity = 1.0 - std::abs(*a - *b) / span;
    return static_cast<float>(std::max(0.0, similarity));
}

std::string NormalizeOrdinalValue(const std::string& value) {
    return ToUpper(CollapseWhitespace(value, '-'));
}

std::optional<size_t> ResolveOrdinalIndex(const std::string& value,
                                          const OrdinalParams& params) {
    const auto& ordered = params.ordered_values;
    const std::string& lookup = Trim(value).empty() ? params.fallback_unknown : value;

    auto it = std::find(ordered.begin(), ordered.end(), lookup);
    if (it == ordered.end()) {
        it = std::find(ordered.begin(), ordered.end(), NormalizeOrdinalValue(lookup));
    }
    if (it == ordered.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(std::distance(ordered.begin(), it));
}

float OrdinalSimilarity(const std::string& a, const std::string& b,
                        const OrdinalParams& params) {
    auto index_a = ResolveOrdinalIndex(a, params);
    auto index_b = ResolveOrdinalIndex(b, params);

    if (!index_a || !index_b) {
        return a == b ? 1.0f : 0.0f;
    }

    size_t count = params.ordered_values.size();
    if (count <= 1) {
        return 1.0f;
    }

    double distance = index_a > index_b ? static_cast<double>(*index_a - *index_b)
                                        : static_cast<double>(*index_b - *index_a);
    return static_cast<float>(1.0 - distance / static_cast<double>(count - 1));
}

float SetJaccardSimilarity(const std::vector<std::string>& a,
                           const std::vector<std::string>& b) {
    std::set<std::string> set_a = ToValueSet(a);
    std::set<std::string> set_b = ToValueSet(b);

    if (set_a.empty() && set_b.empty()) {
        return 1.0f;
    }
    if (set_a.empty() || set_b.empty()) {
        return 0.0f;
    }

    size_t intersection = 0;
    for (const auto& value : set_a) {
        intersection += set_b.count(value);
    }
    size_t union_size = set_a.size() + set_b.size() - intersection;

    return static_cast<float>(static_cast<double>(intersection) /
                              static_cast<double>(union_size));
}

// ============================================================================
// LocalMetric implementations
// ============================================================================

float CategoricalMetric::Compute(const AttributeValue& a, const AttributeValue& b) const {
    return CategoricalSimilarity(a, b);
}

float NumericRangeMetric::Compute(const AttributeValue& a, const AttributeValue& b) const {
    return NumericRangeSimilarity(AsNumber(a), AsNumber(b), params_.min, params_.max);
}

float OrdinalMetric::Compute(const AttributeValue& a, const AttributeValue& b) const {
    auto text_a = AsOrdinalText(a);
    auto text_b = AsOrdinalText(b);
    if (!text_a || !text_b) {
        return 0.0f;
    }
    return OrdinalSimilarity(*text_a, *text_b, params_);
}

float SetJaccardMetric::Compute(const AttributeValue& a, const AttributeValue& b) const {
    return SetJaccardSimilarity(AsValueList(a), AsValueList(b));
}

std::shared_ptr<LocalMetric> CreateLocalMetric(const AttributeSpec& spec) {
    switch (spec.kind) {
        case AttributeKind::CATEGORICAL:
            return std::make_shared<CategoricalMetric>();
        case AttributeKind::NUMERIC_RANGE:
            return std::make_shared<NumericRangeMetric>(spec.range);
        case AttributeKind::ORDINAL:
            return std::make_shared<OrdinalMetric>(spec.ordinal);
        case AttributeKind::SET_JACCARD:
            return std::make_shared<SetJaccardMetric>();
    }
    return std::make_shared<CategoricalMetric>();
}

} // namespace cinecbr
