// File: src/similarity/global_similarity.cpp
#include "similarity/global_similarity.hpp"
#include <algorithm>

namespace cinecbr {

const char* ToString(SkipReason reason) {
    switch (reason) {
        case SkipReason::ZERO_WEIGHT:     return "zero weight";
        case SkipReason::NOT_IN_SCHEMA:   return "not in schema";
        case SkipReason::ABSENT_ON_QUERY: return "absent on query";
        case SkipReason::ABSENT_ON_CASE:  return "absent on case";
    }
    return "unknown";
}

GlobalSimilarity::GlobalSimilarity(const AttributeSchema& schema)
    : schema_(schema) {
    for (const auto& spec : schema_.GetAttributes()) {
        metrics_.emplace(spec.name, CreateLocalMetric(spec));
    }
}

float GlobalSimilarity::Compute(const Query& query, const CaseRecord& candidate,
                                const WeightVector& weights) const {
    return Aggregate(query, candidate, weights, nullptr);
}

SimilarityBreakdown GlobalSimilarity::Explain(const Query& query, const CaseRecord& candidate,
                                              const WeightVector& weights) const {
    SimilarityBreakdown breakdown;
    breakdown.score = Aggregate(query, candidate, weights, &breakdown);
    return breakdown;
}

const LocalMetric* GlobalSimilarity::GetMetric(const std::string& attribute) const {
    auto it = metrics_.find(attribute);
    return it != metrics_.end() ? it->second.get() : nullptr;
}

float GlobalSimilarity::Aggregate(const Query& query, const CaseRecord& candidate,
                                  const WeightVector& weights,
                                  SimilarityBreakdown* breakdown) const {
    double numerator = 0.0;
    double denominator = 0.0;

    auto skip = [breakdown](const std::string& name, SkipReason reason) {
        if (breakdown) {
            breakdown->skipped.emplace_back(name, reason);
        }
    };

    for (const auto& [name, weight] : weights) {
        if (!(weight > 0.0f)) {
            skip(name, SkipReason::ZERO_WEIGHT);
            continue;
        }

        auto metric_it = metrics_.find(name);
        if (metric_it == metrics_.end()) {
            skip(name, SkipReason::NOT_IN_SCHEMA);
            continue;
        }

        const AttributeValue* query_value = query.Find(name);
        if (!query_value) {
            skip(name, SkipReason::ABSENT_ON_QUERY);
            continue;
        }

        const AttributeValue* case_value = candidate.Find(name);
        if (!case_value) {
            skip(name, SkipReason::ABSENT_ON_CASE);
            continue;
        }

        float local = metric_it->second->Compute(*query_value, *case_value);
        numerator += static_cast<double>(weight) * local;
        denominator += weight;

        if (breakdown) {
            breakdown->contributions.push_back(
                {name, metric_it->second->GetKind(), weight, local});
        }
    }

    if (breakdown) {
        breakdown->effective_weight = static_cast<float>(denominator);
    }

    if (denominator <= 0.0) {
        return 0.0f;
    }

    // Guard against rounding drift past the bounds
    return std::clamp(static_cast<float>(numerator / denominator), 0.0f, 1.0f);
}

float Aggregate(const Query& query, const CaseRecord& candidate,
                const WeightVector& weights, const AttributeSchema& schema) {
    return GlobalSimilarity(schema).Compute(query, candidate, weights);
}

} // namespace cinecbr
