// File: src/retrieval/case_retriever.hpp
#pragma once

#include "similarity/global_similarity.hpp"
#include "core/attribute_schema.hpp"
#include "core/case_base.hpp"
#include "core/weight_vector.hpp"
#include <functional>
#include <iosfwd>
#include <memory>
#include <thread>
#include <vector>

namespace cinecbr {

/// One ranked case: a reference into the case base and its global score
struct SimilarityResult {
    /// Case in the base the result was computed from
    const CaseRecord* record;

    /// Insertion position of the case in the base
    size_t position;

    /// Global similarity [0.0, 1.0]
    float score;

    SimilarityResult(const CaseRecord* rec, size_t pos, float sim)
        : record(rec), position(pos), score(sim) {}
};

/// Retrieval configuration
struct RetrievalConfig {
    /// Worker threads used to score the base (1 = score on the calling thread)
    size_t num_threads{1};

    /// Bases smaller than this are always scored on the calling thread
    size_t min_cases_per_thread{64};

    /// Write per-retrieval trace lines to the debug stream
    bool debug_logging{false};

    static RetrievalConfig Default() {
        return RetrievalConfig{};
    }

    static RetrievalConfig Parallel(size_t threads) {
        RetrievalConfig config;
        config.num_threads = threads;
        return config;
    }
};

/// Retrieval Ranker
///
/// Scores every case of the base against a query with GlobalSimilarity and
/// returns all cases ordered by descending score. Equal scores keep the
/// order of the base, so the output is the same for any thread count.
class CaseRetriever {
public:
    /// Constructor
    /// @param schema Attribute schema to score with
    /// @param config Retrieval configuration
    /// @throws std::invalid_argument if schema is null
    explicit CaseRetriever(std::shared_ptr<const AttributeSchema> schema,
                           const RetrievalConfig& config = RetrievalConfig::Default());

    /// Rank the whole case base against a query
    /// @param query Partial case describing the desired movie
    /// @param base Case base; results point into it, so it must outlive them
    /// @param weights Weight snapshot for this call
    /// @return One result per case, highest score first
    std::vector<SimilarityResult> Retrieve(const Query& query,
                                           const CaseBase& base,
                                           WeightVector weights) const;

    /// Score breakdown of a single case (for explaining a result)
    SimilarityBreakdown Explain(const Query& query, const CaseRecord& candidate,
                                const WeightVector& weights) const;

    const RetrievalConfig& GetConfig() const { return config_; }
    void SetConfig(const RetrievalConfig& config);

    std::shared_ptr<const AttributeSchema> GetSchema() const { return schema_; }

    /// Redirect debug output (nullptr disables it)
    void SetDebugStream(std::ostream* os) { debug_stream_ = os; }

    /// Statistics
    struct Stats {
        size_t cases_evaluated{0};
        size_t nonzero_results{0};
        size_t threads_used{0};
        float min_score_found{0.0f};
        float max_score_found{0.0f};
        float avg_score_found{0.0f};
    };

    /// Get statistics from last retrieval
    const Stats& GetLastRetrievalStats() const { return last_stats_; }

private:
    std::shared_ptr<const AttributeSchema> schema_;
    GlobalSimilarity similarity_;
    RetrievalConfig config_;
    std::ostream* debug_stream_;
    mutable Stats last_stats_;

    /// Score cases [begin, end) into results
    void ScoreRange(const Query& query, const CaseBase& base, const WeightVector& weights,
                    size_t begin, size_t end, std::vector<float>& scores) const;

    /// Number of workers to use for a base of the given size
    size_t PlanThreads(size_t case_count) const;

    void UpdateStats(const std::vector<SimilarityResult>& results, size_t threads) const;

    void LogDebug(const std::string& message) const;
};

/// Starts a worker thread running the given task
using ThreadLauncher = std::function<std::thread(std::function<void()>)>;

/// Launcher constructing a plain std::thread
std::thread LaunchThread(std::function<void()> task);

/// Run work over [0, count) split into contiguous chunks, one per thread
///
/// If a worker cannot be started (std::system_error), the chunks left over
/// run on the calling thread; workers already started are always joined.
/// @return Number of threads that did work, the calling thread included
size_t RunInChunks(size_t count, size_t threads,
                   const std::function<void(size_t, size_t)>& work,
                   const ThreadLauncher& launch = LaunchThread);

/// Rank a case base against a query with a one-off single-threaded retriever
std::vector<SimilarityResult> Retrieve(const Query& query,
                                       const CaseBase& base,
                                       const WeightVector& weights,
                                       const AttributeSchema& schema);

} // namespace cinecbr
