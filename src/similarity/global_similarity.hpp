// File: src/similarity/global_similarity.hpp
#pragma once

#include "similarity/local_metric.hpp"
#include "core/attribute_schema.hpp"
#include "core/case_record.hpp"
#include "core/weight_vector.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace cinecbr {

/// Why an attribute did not contribute to a global score
enum class SkipReason : uint8_t {
    ZERO_WEIGHT = 0,
    NOT_IN_SCHEMA = 1,
    ABSENT_ON_QUERY = 2,
    ABSENT_ON_CASE = 3,
};

const char* ToString(SkipReason reason);

/// One attribute's share of a global score
struct AttributeContribution {
    std::string attribute;
    AttributeKind kind;
    float weight;
    float local_similarity;
};

/// Global score together with how it was assembled
struct SimilarityBreakdown {
    float score{0.0f};

    /// Sum of the weights actually applied
    float effective_weight{0.0f};

    std::vector<AttributeContribution> contributions;
    std::vector<std::pair<std::string, SkipReason>> skipped;
};

/// Global Similarity Aggregator
///
/// Weighted mean of local similarities, renormalized over the attributes
/// that are weighted, configured, and present on both query and case:
///
///   score = sum(w_i * sim_i) / sum(w_i)   over usable attributes i
///
/// With no usable attribute the score is 0.0. The result is always in
/// [0.0, 1.0] and Compute never throws.
///
/// Example:
///   GlobalSimilarity similarity(schema);
///   float score = similarity.Compute(query, movie, schema.DefaultWeights());
class GlobalSimilarity {
public:
    /// Build one local metric per schema attribute
    /// @param schema Attribute schema; must outlive this object
    explicit GlobalSimilarity(const AttributeSchema& schema);

    /// Weighted global similarity of a case to a query
    float Compute(const Query& query, const CaseRecord& candidate,
                  const WeightVector& weights) const;

    /// Same as Compute, also reporting per-attribute contributions
    SimilarityBreakdown Explain(const Query& query, const CaseRecord& candidate,
                                const WeightVector& weights) const;

    const AttributeSchema& GetSchema() const { return schema_; }

    /// Metric configured for an attribute (nullptr if not in schema)
    const LocalMetric* GetMetric(const std::string& attribute) const;

private:
    const AttributeSchema& schema_;
    std::map<std::string, std::shared_ptr<LocalMetric>> metrics_;

    /// Shared implementation; breakdown may be null
    float Aggregate(const Query& query, const CaseRecord& candidate,
                    const WeightVector& weights, SimilarityBreakdown* breakdown) const;
};

/// Weighted global similarity of one (query, case) pair
float Aggregate(const Query& query, const CaseRecord& candidate,
                const WeightVector& weights, const AttributeSchema& schema);

} // namespace cinecbr
