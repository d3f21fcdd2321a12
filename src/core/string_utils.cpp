// File: src/core/string_utils.cpp
#include "core/string_utils.hpp"
#include <algorithm>
#include <cctype>

namespace cinecbr {

namespace {

bool IsSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // anonymous namespace

std::string Trim(const std::string& str) {
    auto begin = std::find_if_not(str.begin(), str.end(), IsSpace);
    auto end = std::find_if_not(str.rbegin(), str.rend(), IsSpace).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

std::string ToUpper(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::string ToLower(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string CollapseWhitespace(const std::string& str, char separator) {
    std::string trimmed = Trim(str);
    std::string out;
    out.reserve(trimmed.size());

    bool in_space = false;
    for (char c : trimmed) {
        if (IsSpace(c)) {
            in_space = true;
            continue;
        }
        if (in_space) {
            out.push_back(separator);
            in_space = false;
        }
        out.push_back(c);
    }
    return out;
}

std::vector<std::string> Split(const std::string& str, const std::string& delimiters) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : str) {
        if (delimiters.find(c) != std::string::npos) {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    parts.push_back(current);
    return parts;
}

} // namespace cinecbr
