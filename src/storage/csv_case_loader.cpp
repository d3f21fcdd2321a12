// File: src/storage/csv_case_loader.cpp
#include "storage/csv_case_loader.hpp"
#include "storage/field_normalizer.hpp"
#include "similarity/local_metric.hpp"
#include "core/string_utils.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace cinecbr {

// ============================================================================
// CSV record reader
// ============================================================================

bool ReadCsvRecord(std::istream& in, char delimiter, std::vector<std::string>& fields) {
    fields.clear();

    std::string line;
    if (!std::getline(in, line)) {
        return false;
    }

    std::string field;
    bool in_quotes = false;

    while (true) {
        for (size_t i = 0; i < line.size(); ++i) {
            char c = line[i];
            if (in_quotes) {
                if (c == '"') {
                    if (i + 1 < line.size() && line[i + 1] == '"') {
                        field.push_back('"');
                        ++i;
                    } else {
                        in_quotes = false;
                    }
                } else {
                    field.push_back(c);
                }
            } else if (c == '"') {
                in_quotes = true;
            } else if (c == delimiter) {
                fields.push_back(field);
                field.clear();
            } else if (c == '\r' && i + 1 == line.size()) {
                // CRLF line ending
            } else {
                field.push_back(c);
            }
        }

        if (!in_quotes) {
            break;
        }

        // Quoted field continues on the next line
        if (!std::getline(in, line)) {
            break;
        }
        field.push_back('\n');
    }

    fields.push_back(field);
    return true;
}

// ============================================================================
// CsvCaseLoader
// ============================================================================

CsvCaseLoader::CsvCaseLoader(std::shared_ptr<const AttributeSchema> schema)
    : CsvCaseLoader(std::move(schema), Config{}) {}

CsvCaseLoader::CsvCaseLoader(std::shared_ptr<const AttributeSchema> schema,
                             const Config& config)
    : schema_(std::move(schema)), config_(config) {
    if (!schema_) {
        throw std::invalid_argument("Schema cannot be null");
    }
}

std::optional<CaseBase> CsvCaseLoader::LoadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        last_stats_ = Stats{};
        std::cerr << "Failed to open case file: " << filepath << std::endl;
        return std::nullopt;
    }
    return Load(file);
}

std::optional<CaseBase> CsvCaseLoader::LoadFromString(const std::string& content) {
    std::istringstream in(content);
    return Load(in);
}

std::optional<CaseBase> CsvCaseLoader::Load(std::istream& in) {
    last_stats_ = Stats{};

    std::vector<std::string> header;
    if (!ReadCsvRecord(in, config_.delimiter, header)) {
        std::cerr << "Case file is empty" << std::endl;
        return std::nullopt;
    }

    // Strip a UTF-8 byte order mark from the first column name
    if (!header.empty() && header[0].compare(0, 3, "\xEF\xBB\xBF") == 0) {
        header[0] = header[0].substr(3);
    }

    std::optional<size_t> title_column;
    std::vector<std::pair<size_t, const AttributeSpec*>> attribute_columns;

    const std::string title_name = ToLower(config_.title_column);
    for (size_t i = 0; i < header.size(); ++i) {
        std::string column = ToLower(Trim(header[i]));
        if (column == title_name) {
            title_column = i;
            continue;
        }
        for (const auto& spec : schema_->GetAttributes()) {
            if (ToLower(spec.name) == column) {
                attribute_columns.emplace_back(i, &spec);
                break;
            }
        }
    }

    if (!title_column) {
        std::cerr << "Case file has no '" << config_.title_column << "' column" << std::endl;
        return std::nullopt;
    }

    for (const auto& spec : schema_->GetAttributes()) {
        bool found = false;
        for (const auto& [column, column_spec] : attribute_columns) {
            found = found || column_spec->name == spec.name;
        }
        if (!found) {
            Warn("Column '" + spec.name + "' not found; attribute will be unknown for all cases");
        }
    }

    CaseBase base;
    std::vector<std::string> fields;

    while (ReadCsvRecord(in, config_.delimiter, fields)) {
        if (fields.size() == 1 && Trim(fields[0]).empty()) {
            continue;  // Blank line
        }

        last_stats_.rows_read++;
        const size_t row = last_stats_.rows_read;

        if (fields.size() != header.size()) {
            Warn("Row " + std::to_string(row) + ": expected " + std::to_string(header.size()) +
                 " fields, found " + std::to_string(fields.size()) + ". Skipping row.");
            last_stats_.rows_rejected++;
            continue;
        }

        std::string title = Trim(fields[*title_column]);
        if (title.empty()) {
            Warn("Row " + std::to_string(row) + ": missing title. Skipping row.");
            last_stats_.rows_rejected++;
            continue;
        }

        CaseRecord record(title);
        bool rejected = false;

        for (const auto& [column, spec] : attribute_columns) {
            std::string error;
            auto value = CoerceField(*spec, fields[column], &error);
            if (!error.empty()) {
                Warn("Movie '" + title + "': " + error + ". Skipping row.");
                rejected = true;
                break;
            }
            if (!value) {
                continue;
            }

            if (spec->kind == AttributeKind::ORDINAL) {
                const std::string& text = std::get<std::string>(*value);
                if (!ResolveOrdinalIndex(text, spec->ordinal)) {
                    Warn("Movie '" + title + "': " + spec->name + " '" + text +
                         "' is not a known value; it will only match exactly");
                }
            }

            record.Set(spec->name, std::move(*value));
        }

        if (rejected) {
            last_stats_.rows_rejected++;
            continue;
        }

        base.Add(std::move(record));
        last_stats_.cases_loaded++;
    }

    if (base.Empty()) {
        Warn("No cases loaded");
    }

    return base;
}

std::optional<AttributeValue> CsvCaseLoader::CoerceField(const AttributeSpec& spec,
                                                         const std::string& raw,
                                                         std::string* error) const {
    std::string text = Trim(raw);
    if (text.empty()) {
        return std::nullopt;
    }

    switch (spec.kind) {
        case AttributeKind::NUMERIC_RANGE: {
            bool is_duration = config_.duration_columns.count(spec.name) > 0;
            auto number = is_duration ? normalize::ParseDuration(text)
                                      : normalize::ParseDecimal(text);
            if (!number) {
                if (error) {
                    *error = "cannot read " + spec.name + " '" + text + "' as a number";
                }
                return std::nullopt;
            }
            return AttributeValue(*number);
        }

        case AttributeKind::ORDINAL: {
            // Store the scale's own spelling when the text names a scale value
            const auto& ordered = spec.ordinal.ordered_values;
            auto index = ResolveOrdinalIndex(text, spec.ordinal);
            if (!index) {
                index = ResolveOrdinalIndex(normalize::CanonicalizeRating(text), spec.ordinal);
            }
            if (index) {
                return AttributeValue(ordered[*index]);
            }
            const std::string folded = NormalizeOrdinalValue(text);
            for (const auto& value : ordered) {
                if (NormalizeOrdinalValue(value) == folded) {
                    return AttributeValue(value);
                }
            }
            return AttributeValue(text);
        }

        case AttributeKind::SET_JACCARD: {
            auto items = normalize::SplitList(text);
            if (items.empty()) {
                return std::nullopt;
            }
            return AttributeValue(std::move(items));
        }

        case AttributeKind::CATEGORICAL:
            if (config_.flag_columns.count(spec.name) > 0) {
                return AttributeValue(normalize::CanonicalizeFlag(text));
            }
            return AttributeValue(text);
    }

    return AttributeValue(text);
}

void CsvCaseLoader::Warn(const std::string& message) {
    last_stats_.warnings.push_back(message);
    if (config_.echo_warnings) {
        std::cerr << "Warning: " << message << std::endl;
    }
}

} // namespace cinecbr
