// File: examples/movie_retrieval_example.cpp
//
// Movie retrieval example using CineCBR.
// Demonstrates:
// - Building the movie schema and a small case base
// - Ranking the case base against a partial query
// - Changing weights between two searches
// - Explaining a single score attribute by attribute

#include "core/movie_domain.hpp"
#include "retrieval/case_retriever.hpp"
#include "report/result_report.hpp"
#include <iomanip>
#include <iostream>
#include <memory>

using namespace cinecbr;

int main() {
    std::cout << "=== CineCBR Movie Retrieval Example ===\n\n";

    // Step 1: Schema and case base
    std::cout << "Step 1: Building the movie schema and case base...\n";
    auto schema = std::make_shared<const AttributeSchema>(MovieSchema());
    CaseBase movies = SampleMovieCases();
    std::cout << "  " << schema->Size() << " attributes, " << movies.Size() << " movies\n\n";

    // Step 2: Query for a recent science-fiction movie
    std::cout << "Step 2: Searching for a recent R-rated sci-fi movie...\n";
    Query query;
    query.Set(attr::GENRE, std::vector<std::string>{"Sci-Fi", "Thriller"});
    query.Set(attr::YEAR, 2001.0);
    query.Set(attr::CONTENT_RATING, std::string("R"));

    CaseRetriever retriever(schema);
    WeightVector weights = schema->DefaultWeights();
    auto results = retriever.Retrieve(query, movies, weights);

    ResultReport report(*schema);
    report.SetColorsEnabled(false);
    report.WriteConsole(std::cout, query, results);

    // Step 3: Favor release year over everything else
    std::cout << "\nStep 3: Same query, release year weighted at 1.0 and genre at 0.0...\n";
    weights.Set(attr::YEAR, 1.0f);
    weights.Set(attr::GENRE, 0.0f);
    auto reweighted = retriever.Retrieve(query, movies, weights);
    report.WriteConsole(std::cout, query, reweighted);

    // Step 4: Explain the best match
    if (!reweighted.empty()) {
        const SimilarityResult& best = reweighted.front();
        std::cout << "\nStep 4: Why '" << best.record->GetTitle() << "' ranked first\n";

        SimilarityBreakdown breakdown = retriever.Explain(query, *best.record, weights);
        std::cout << std::fixed << std::setprecision(3);
        for (const auto& contribution : breakdown.contributions) {
            std::cout << "  " << std::left << std::setw(16) << contribution.attribute
                      << " similarity " << contribution.local_similarity
                      << "  weight " << contribution.weight << "\n";
        }
        for (const auto& [name, reason] : breakdown.skipped) {
            std::cout << "  " << std::left << std::setw(16) << name
                      << " skipped: " << ToString(reason) << "\n";
        }
        std::cout << "  score " << breakdown.score << "\n";
    }

    // Step 5: Statistics
    const auto& stats = retriever.GetLastRetrievalStats();
    std::cout << "\nStep 5: Retrieval statistics\n";
    std::cout << "  Cases evaluated: " << stats.cases_evaluated << "\n";
    std::cout << "  Non-zero scores: " << stats.nonzero_results << "\n";
    std::cout << "  Best score:      " << stats.max_score_found << "\n";

    std::cout << "\n=== Example Complete ===\n";
    return 0;
}
