// File: src/storage/field_normalizer.cpp
#include "storage/field_normalizer.hpp"
#include "core/string_utils.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace cinecbr {
namespace normalize {

namespace {

bool IsDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool IsAlpha(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

// Minutes per unit word, or a negative value for unknown units
double UnitToMinutes(const std::string& unit) {
    if (unit.empty() || unit == "m" || unit == "min" || unit == "mins" ||
        unit == "minute" || unit == "minutes") {
        return 1.0;
    }
    if (unit == "h" || unit == "hr" || unit == "hrs" || unit == "hour" || unit == "hours") {
        return 60.0;
    }
    return -1.0;
}

} // anonymous namespace

std::optional<double> ParseDecimal(const std::string& text) {
    std::string value = Trim(text);
    if (value.empty()) {
        return std::nullopt;
    }

    for (char& c : value) {
        if (c == ',') {
            c = '.';
        }
    }

    char* end = nullptr;
    double number = std::strtod(value.c_str(), &end);
    if (end != value.c_str() + value.size() || !std::isfinite(number)) {
        return std::nullopt;
    }
    return number;
}

std::optional<double> ParseDuration(const std::string& text) {
    std::string value = ToLower(Trim(text));
    if (value.empty()) {
        return std::nullopt;
    }

    // "H:MM"
    size_t colon = value.find(':');
    if (colon != std::string::npos) {
        auto hours = ParseDecimal(value.substr(0, colon));
        auto minutes = ParseDecimal(value.substr(colon + 1));
        if (!hours || !minutes || *hours < 0.0 || *minutes < 0.0 || *minutes >= 60.0) {
            return std::nullopt;
        }
        return *hours * 60.0 + *minutes;
    }

    // Sequence of <number><unit> groups, whitespace allowed anywhere between
    double total = 0.0;
    bool any_group = false;
    size_t pos = 0;

    while (pos < value.size()) {
        while (pos < value.size() && std::isspace(static_cast<unsigned char>(value[pos]))) {
            ++pos;
        }
        if (pos >= value.size()) {
            break;
        }

        size_t number_start = pos;
        while (pos < value.size() && (IsDigit(value[pos]) || value[pos] == '.' || value[pos] == ',')) {
            ++pos;
        }
        if (pos == number_start) {
            return std::nullopt;
        }
        auto number = ParseDecimal(value.substr(number_start, pos - number_start));
        if (!number) {
            return std::nullopt;
        }

        while (pos < value.size() && std::isspace(static_cast<unsigned char>(value[pos]))) {
            ++pos;
        }

        size_t unit_start = pos;
        while (pos < value.size() && IsAlpha(value[pos])) {
            ++pos;
        }
        double factor = UnitToMinutes(value.substr(unit_start, pos - unit_start));
        if (factor < 0.0) {
            return std::nullopt;
        }

        total += *number * factor;
        any_group = true;
    }

    if (!any_group) {
        return std::nullopt;
    }
    return total;
}

std::string CanonicalizeRating(const std::string& text) {
    std::string rating = ToUpper(CollapseWhitespace(text, '-'));
    if (rating == "UNRATED" || rating == "NR" || rating == "NOT-RATED") {
        return "NOT-RATED";
    }
    return rating;
}

std::string CanonicalizeFlag(const std::string& text) {
    std::string trimmed = Trim(text);
    std::string lower = ToLower(trimmed);

    if (lower == "yes" || lower == "y" || lower == "sim" || lower == "s" ||
        lower == "true" || lower == "1") {
        return "Yes";
    }
    if (lower == "no" || lower == "n" || lower == "não" || lower == "nao" ||
        lower == "false" || lower == "0") {
        return "No";
    }
    return trimmed;
}

std::vector<std::string> SplitList(const std::string& text) {
    std::vector<std::string> items;
    for (const auto& part : Split(text, ",|;")) {
        std::string item = Trim(part);
        if (!item.empty()) {
            items.push_back(std::move(item));
        }
    }
    return items;
}

} // namespace normalize
} // namespace cinecbr
