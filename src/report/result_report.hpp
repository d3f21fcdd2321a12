// File: src/report/result_report.hpp
#pragma once

#include "retrieval/case_retriever.hpp"
#include "core/attribute_schema.hpp"
#include "core/case_record.hpp"
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace cinecbr {

/// ANSI color codes for terminal output
namespace Color {
    inline const char* RESET = "\033[0m";
    inline const char* RED = "\033[31m";
    inline const char* GREEN = "\033[32m";
    inline const char* YELLOW = "\033[33m";
    inline const char* CYAN = "\033[36m";
    inline const char* BOLD = "\033[1m";
    inline const char* DIM = "\033[2m";
}

/// Caller-side filtering of a ranked result list before display
struct PresentationPolicy {
    /// Keep at most this many results (0 = keep all)
    size_t top_n{0};

    /// Drop results with a score of exactly 0.0
    bool hide_zero_scores{false};
};

/// Apply a presentation policy to a ranked result list (order is kept)
std::vector<SimilarityResult> ApplyPresentationPolicy(
    const std::vector<SimilarityResult>& results,
    const PresentationPolicy& policy);

/// "runtime_minutes" -> "Runtime minutes"
std::string AttributeLabel(const std::string& name);

/// Renders a query and its ranked results for the console or as Markdown
///
/// Attributes are listed in schema order, followed by any attribute the
/// schema does not know about. Scores are shown as percentages.
class ResultReport {
public:
    explicit ResultReport(const AttributeSchema& schema) : schema_(schema) {}

    /// Enable ANSI colors in console output
    void SetColorsEnabled(bool enabled) { colors_enabled_ = enabled; }

    /// Write a human-readable report to a stream
    void WriteConsole(std::ostream& out, const Query& query,
                      const std::vector<SimilarityResult>& results) const;

    /// Render the report as a Markdown document
    std::string ToMarkdown(const Query& query,
                           const std::vector<SimilarityResult>& results) const;

    /// Save the Markdown report as <directory>/<base_name>_<YYYYmmdd_HHMMSS>.md
    /// @return Path of the written file, or std::nullopt on error
    std::optional<std::string> SaveMarkdown(const std::string& directory,
                                            const std::string& base_name,
                                            const Query& query,
                                            const std::vector<SimilarityResult>& results) const;

    /// Score formatted as a percentage with two decimals ("87.50%")
    static std::string FormatScore(float score);

private:
    const AttributeSchema& schema_;
    bool colors_enabled_{false};

    /// Attribute names of a record in display order
    std::vector<std::string> DisplayOrder(const CaseRecord& record) const;

    const char* C(const char* color) const { return colors_enabled_ ? color : ""; }
};

} // namespace cinecbr
