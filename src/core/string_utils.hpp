// File: src/core/string_utils.hpp
#pragma once

#include <string>
#include <vector>

namespace cinecbr {

/// Remove leading and trailing whitespace
std::string Trim(const std::string& str);

/// ASCII upper-case copy
std::string ToUpper(const std::string& str);

/// ASCII lower-case copy
std::string ToLower(const std::string& str);

/// Trim, then replace every internal run of whitespace with one separator
std::string CollapseWhitespace(const std::string& str, char separator);

/// Split on any of the given delimiter characters (empty pieces kept)
std::vector<std::string> Split(const std::string& str, const std::string& delimiters);

} // namespace cinecbr
