// File: src/retrieval/case_retriever.cpp
#include "retrieval/case_retriever.hpp"
#include <algorithm>
#include <functional>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace cinecbr {

namespace {

std::shared_ptr<const AttributeSchema> RequireSchema(
        std::shared_ptr<const AttributeSchema> schema) {
    if (!schema) {
        throw std::invalid_argument("Schema cannot be null");
    }
    return schema;
}

void SortResults(std::vector<SimilarityResult>& results) {
    // Stable: equal scores keep base order
    std::stable_sort(results.begin(), results.end(),
        [](const SimilarityResult& a, const SimilarityResult& b) {
            return a.score > b.score;
        });
}

} // anonymous namespace

// ============================================================================
// CaseRetriever Implementation
// ============================================================================

CaseRetriever::CaseRetriever(std::shared_ptr<const AttributeSchema> schema,
                             const RetrievalConfig& config)
    : schema_(RequireSchema(std::move(schema)))
    , similarity_(*schema_)
    , config_(config)
    , debug_stream_(&std::cerr) {
    if (config_.num_threads == 0) {
        config_.num_threads = 1;
    }
}

void CaseRetriever::SetConfig(const RetrievalConfig& config) {
    config_ = config;
    if (config_.num_threads == 0) {
        config_.num_threads = 1;
    }
}

std::vector<SimilarityResult> CaseRetriever::Retrieve(const Query& query,
                                                      const CaseBase& base,
                                                      WeightVector weights) const {
    last_stats_ = Stats{};

    const size_t count = base.Size();
    std::vector<float> scores(count, 0.0f);
    size_t threads = PlanThreads(count);

    if (threads <= 1) {
        ScoreRange(query, base, weights, 0, count, scores);
    } else {
        // Each worker writes only the slots of its own chunk
        threads = RunInChunks(count, threads, [&](size_t begin, size_t end) {
            ScoreRange(query, base, weights, begin, end, scores);
        });
    }

    std::vector<SimilarityResult> results;
    results.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        results.emplace_back(&base[i], i, scores[i]);
    }

    SortResults(results);
    UpdateStats(results, threads);

    if (config_.debug_logging) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(4)
            << "query attributes=" << query.Size()
            << " cases=" << count
            << " threads=" << threads
            << " nonzero=" << last_stats_.nonzero_results;
        if (!results.empty()) {
            oss << " best=" << results.front().score
                << " (" << results.front().record->GetTitle() << ")";
        }
        LogDebug(oss.str());
    }

    return results;
}

SimilarityBreakdown CaseRetriever::Explain(const Query& query, const CaseRecord& candidate,
                                           const WeightVector& weights) const {
    return similarity_.Explain(query, candidate, weights);
}

void CaseRetriever::ScoreRange(const Query& query, const CaseBase& base,
                               const WeightVector& weights,
                               size_t begin, size_t end, std::vector<float>& scores) const {
    for (size_t i = begin; i < end; ++i) {
        scores[i] = similarity_.Compute(query, base[i], weights);
    }
}

size_t CaseRetriever::PlanThreads(size_t case_count) const {
    if (config_.num_threads <= 1 || case_count == 0) {
        return 1;
    }

    size_t per_thread = std::max<size_t>(1, config_.min_cases_per_thread);
    size_t useful = std::max<size_t>(1, case_count / per_thread);
    return std::min(config_.num_threads, useful);
}

void CaseRetriever::UpdateStats(const std::vector<SimilarityResult>& results,
                                size_t threads) const {
    last_stats_.cases_evaluated = results.size();
    last_stats_.threads_used = threads;

    if (results.empty()) {
        return;
    }

    // Results are sorted, so the extremes sit at the ends
    last_stats_.max_score_found = results.front().score;
    last_stats_.min_score_found = results.back().score;

    double sum = 0.0;
    for (const auto& result : results) {
        sum += result.score;
        if (result.score > 0.0f) {
            last_stats_.nonzero_results++;
        }
    }
    last_stats_.avg_score_found = static_cast<float>(sum / results.size());
}

void CaseRetriever::LogDebug(const std::string& message) const {
    if (config_.debug_logging && debug_stream_) {
        *debug_stream_ << "[CaseRetriever] " << message << std::endl;
    }
}

std::thread LaunchThread(std::function<void()> task) {
    return std::thread(std::move(task));
}

size_t RunInChunks(size_t count, size_t threads,
                   const std::function<void(size_t, size_t)>& work,
                   const ThreadLauncher& launch) {
    if (count == 0) {
        return 0;
    }
    threads = std::max<size_t>(1, threads);
    size_t chunk = (count + threads - 1) / threads;

    std::vector<std::thread> workers;
    workers.reserve(threads);

    size_t begin = 0;
    for (; begin < count; begin += chunk) {
        size_t end = std::min(count, begin + chunk);
        try {
            workers.push_back(launch([&work, begin, end]() { work(begin, end); }));
        } catch (const std::system_error& e) {
            std::cerr << "Warning: could not start a retrieval thread (" << e.what()
                      << "); scoring the rest on the calling thread" << std::endl;
            break;
        }
    }

    const bool fallback = begin < count;
    if (fallback) {
        work(begin, count);
    }

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    return workers.size() + (fallback ? 1 : 0);
}

std::vector<SimilarityResult> Retrieve(const Query& query,
                                       const CaseBase& base,
                                       const WeightVector& weights,
                                       const AttributeSchema& schema) {
    CaseRetriever retriever(std::make_shared<const AttributeSchema>(schema));
    return retriever.Retrieve(query, base, weights);
}

} // namespace cinecbr
