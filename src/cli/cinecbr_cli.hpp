// File: src/cli/cinecbr_cli.hpp
//
// CineCBR CLI class definition
// Interactive movie retrieval: build a query, tune weights, rank the case
// base and save reports

#ifndef CINECBR_CLI_HPP
#define CINECBR_CLI_HPP

#include "cli/cli_config.hpp"
#include "core/attribute_schema.hpp"
#include "core/case_base.hpp"
#include "core/weight_vector.hpp"
#include "retrieval/case_retriever.hpp"
#include "report/result_report.hpp"
#include "storage/csv_case_loader.hpp"
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cinecbr {

/// Interactive CLI interface for CineCBR
///
/// Holds the current query and weight vector; every /search hands the
/// retriever a copy of the weights, so edits made afterwards never affect
/// a finished ranking.
class CineCli {
public:
    /// Construct with console streams
    explicit CineCli(const CliConfig& config);

    /// Construct with explicit streams (for testing)
    CineCli(const CliConfig& config, std::istream& in, std::ostream& out);

    /// Main run loop - interactive mode
    void Run();

    /// Process a single command line (for testing)
    void ProcessCommand(const std::string& input);

    /// Load the case base from the configured sources
    ///
    /// Tries the SQLite store, then the CSV case file (caching it in the
    /// store), then the built-in sample movies.
    /// @return true if a non-empty case base is available
    bool LoadCases();

    /// Replace the case base (clears previous results)
    void SetCaseBase(CaseBase base);

    // Inspection (for testing)
    const Query& GetQuery() const { return query_; }
    const WeightVector& GetWeights() const { return weights_; }
    const CaseBase& GetCaseBase() const { return cases_; }
    const AttributeSchema& GetSchema() const { return *schema_; }
    const std::vector<SimilarityResult>& GetLastResults() const { return last_results_; }
    std::optional<std::string> GetLastReportPath() const { return last_report_path_; }
    size_t GetSearchCount() const { return searches_performed_; }
    bool IsRunning() const { return running_; }
    bool IsVerboseEnabled() const { return verbose_; }

private:
    CliConfig config_;
    std::istream& in_;
    std::ostream& out_;

    std::shared_ptr<const AttributeSchema> schema_;
    std::unique_ptr<CaseRetriever> retriever_;
    CsvCaseLoader loader_;
    ResultReport report_;

    CaseBase cases_;
    Query query_;
    WeightVector weights_;

    // Last search (results point into cases_)
    Query last_query_;
    WeightVector last_weights_;
    std::vector<SimilarityResult> last_results_;
    std::optional<std::string> last_report_path_;

    bool running_ = true;
    bool verbose_ = false;
    size_t searches_performed_ = 0;

    void PrintWelcome();
    void HandleCommand(const std::string& cmd);

    // Commands
    void ShowHelp();
    void ShowSchema();
    void SetAttribute(const std::string& name, const std::string& value);
    void UnsetAttribute(const std::string& name);
    void ShowQuery();
    void SetWeight(const std::string& name, const std::string& value);
    void ShowWeights();
    void Search(std::optional<size_t> top_n);
    void Explain(const std::string& rank_text);
    void SaveReport();
    void LoadFromCsv(const std::string& filepath);
    void ImportToStore(const std::string& filepath);
    void ShowCases();
    void AskQuery();
    void ToggleVerbose();
    void Shutdown();

    // Helpers

    /// Read a case file, reporting the outcome
    /// @return Loaded cases, or std::nullopt if the file gave no cases
    std::optional<CaseBase> ReadCaseFile(const std::string& filepath);
    bool ReadLine(const std::string& prompt, std::string& line);
    std::optional<AttributeValue> ParseQueryValue(const AttributeSpec& spec,
                                                  const std::string& text,
                                                  std::string* error) const;
    std::string DescribeSpec(const AttributeSpec& spec) const;
    PresentationPolicy CurrentPolicy(std::optional<size_t> top_n) const;

    const char* C(const char* color) const { return config_.interface.colors_enabled ? color : ""; }
};

} // namespace cinecbr

#endif // CINECBR_CLI_HPP
