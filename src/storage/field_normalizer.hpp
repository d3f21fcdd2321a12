// File: src/storage/field_normalizer.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>

namespace cinecbr {

/// Field normalization for raw text coming from case files and user input
///
/// These turn free-form strings into the typed values the retrieval core
/// expects. Every parser returns std::nullopt on input it cannot read.
namespace normalize {

/// Parse a decimal number, accepting ',' as the decimal separator ("8,7")
std::optional<double> ParseDecimal(const std::string& text);

/// Parse a duration into minutes
///
/// Accepted: "136", "136 min", "136 minutes", "2h", "2h 16min", "2h16m",
/// "2 hours 16 minutes", "2:16"
std::optional<double> ParseDuration(const std::string& text);

/// Canonical content rating: trimmed, upper-case, whitespace runs replaced
/// by '-' ("pg 13" -> "PG-13"); "UNRATED", "NR" and "NOT RATED" become
/// "NOT-RATED". Empty input stays empty.
std::string CanonicalizeRating(const std::string& text);

/// Canonical yes/no flag ("sim", "true", "y", "1" -> "Yes"; "não", "nao",
/// "false", "n", "0" -> "No"); anything else is returned trimmed
std::string CanonicalizeFlag(const std::string& text);

/// Split a list field on ',', '|' or ';', trimming items and dropping empties
std::vector<std::string> SplitList(const std::string& text);

} // namespace normalize
} // namespace cinecbr
