// File: src/core/movie_domain.hpp
#pragma once

#include "core/attribute_schema.hpp"
#include "core/case_base.hpp"

namespace cinecbr {

/// Attribute names of the movie case base
namespace attr {
    inline const char* GENRE = "genre";
    inline const char* YEAR = "year";
    inline const char* CONTENT_RATING = "content_rating";
    inline const char* RUNTIME_MINUTES = "runtime_minutes";
    inline const char* CRITIC_RATING = "critic_rating";
    inline const char* HAS_SEQUEL = "has_sequel";
}

/// Content ratings ordered from least to most restrictive
const std::vector<std::string>& MovieContentRatings();

/// Schema and default weights for the movie case base
///
///   genre            set_jaccard             0.25
///   year             numeric_range 1920-2025 0.15
///   content_rating   ordinal                 0.15
///   runtime_minutes  numeric_range 60-240    0.15
///   critic_rating    numeric_range 1-10      0.20
///   has_sequel       categorical             0.10
AttributeSchema MovieSchema();

/// Small built-in case base used when no case file is available
CaseBase SampleMovieCases();

} // namespace cinecbr
