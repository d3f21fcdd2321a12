// File: src/storage/csv_case_loader.hpp
#pragma once

#include "core/attribute_schema.hpp"
#include "core/case_base.hpp"
#include <iosfwd>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace cinecbr {

/// Read one CSV record (RFC 4180 quoting, quoted fields may span lines)
/// @return false at end of input
bool ReadCsvRecord(std::istream& in, char delimiter, std::vector<std::string>& fields);

/// Loads a case base from a header-driven CSV file
///
/// The header names the columns; a title column is required and every
/// column named after a schema attribute is coerced by the attribute kind:
/// - numeric_range: decimal number (',' accepted as decimal separator), or
///   a duration such as "2h 16min" for the configured duration columns
/// - ordinal: the matching scale value ("pg 13" -> "PG-13", "livre" ->
///   "Livre"); text naming no scale value is kept trimmed
/// - set_jaccard: list split on ',', '|' or ';'
/// - categorical: trimmed text, yes/no variants canonicalized for the
///   configured flag columns
/// Column names match attribute names case-insensitively. Empty fields
/// leave the attribute unknown. Rows with a missing title, a
/// wrong field count or an unreadable number are rejected with a warning.
class CsvCaseLoader {
public:
    struct Config {
        /// Column holding the movie title
        std::string title_column{"title"};

        /// Field delimiter
        char delimiter{','};

        /// Numeric columns parsed as durations in minutes
        std::set<std::string> duration_columns{"runtime_minutes"};

        /// Categorical columns holding yes/no flags
        std::set<std::string> flag_columns{"has_sequel"};

        /// Print warnings to std::cerr as they occur
        bool echo_warnings{true};
    };

    /// Load statistics
    struct Stats {
        size_t rows_read{0};
        size_t cases_loaded{0};
        size_t rows_rejected{0};
        std::vector<std::string> warnings;
    };

    /// @throws std::invalid_argument if schema is null
    explicit CsvCaseLoader(std::shared_ptr<const AttributeSchema> schema);
    CsvCaseLoader(std::shared_ptr<const AttributeSchema> schema, const Config& config);

    /// Load cases from a CSV file
    /// @return Case base, or std::nullopt if the file cannot be opened or
    ///         has no usable header
    std::optional<CaseBase> LoadFromFile(const std::string& filepath);

    /// Load cases from CSV content
    std::optional<CaseBase> LoadFromString(const std::string& content);

    /// Load cases from a stream
    std::optional<CaseBase> Load(std::istream& in);

    /// Convert one raw field to the typed value its attribute expects
    /// @param spec Attribute the field belongs to
    /// @param raw Raw field text
    /// @param error Set when the field cannot be converted
    /// @return Value, or std::nullopt for an empty field or a conversion error
    std::optional<AttributeValue> CoerceField(const AttributeSpec& spec,
                                              const std::string& raw,
                                              std::string* error) const;

    const Stats& GetLastLoadStats() const { return last_stats_; }
    const Config& GetConfig() const { return config_; }

private:
    std::shared_ptr<const AttributeSchema> schema_;
    Config config_;
    Stats last_stats_;

    void Warn(const std::string& message);
};

} // namespace cinecbr
