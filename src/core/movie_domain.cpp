// File: src/core/movie_domain.cpp
#include "core/movie_domain.hpp"

namespace cinecbr {

const std::vector<std::string>& MovieContentRatings() {
    static const std::vector<std::string> ratings = {
        "G", "PG", "PG-13", "R", "NC-17", "NOT-RATED"
    };
    return ratings;
}

AttributeSchema MovieSchema() {
    AttributeSchema schema;
    schema.AddAttribute(AttributeSpec::SetJaccard(attr::GENRE), 0.25f);
    schema.AddAttribute(AttributeSpec::NumericRange(attr::YEAR, 1920.0, 2025.0), 0.15f);
    schema.AddAttribute(AttributeSpec::Ordinal(attr::CONTENT_RATING,
                                               MovieContentRatings(), "NOT-RATED"), 0.15f);
    schema.AddAttribute(AttributeSpec::NumericRange(attr::RUNTIME_MINUTES, 60.0, 240.0), 0.15f);
    schema.AddAttribute(AttributeSpec::NumericRange(attr::CRITIC_RATING, 1.0, 10.0), 0.20f);
    schema.AddAttribute(AttributeSpec::Categorical(attr::HAS_SEQUEL), 0.10f);
    return schema;
}

namespace {

CaseRecord MakeMovie(const std::string& title,
                     std::vector<std::string> genres,
                     double year,
                     const std::string& rating,
                     double runtime,
                     double critic_rating,
                     const std::string& has_sequel) {
    CaseRecord movie(title);
    movie.Set(attr::GENRE, std::move(genres));
    movie.Set(attr::YEAR, year);
    movie.Set(attr::CONTENT_RATING, rating);
    movie.Set(attr::RUNTIME_MINUTES, runtime);
    movie.Set(attr::CRITIC_RATING, critic_rating);
    movie.Set(attr::HAS_SEQUEL, has_sequel);
    return movie;
}

} // anonymous namespace

CaseBase SampleMovieCases() {
    CaseBase base;
    base.Add(MakeMovie("The Matrix", {"Sci-Fi", "Action"}, 1999, "R", 136, 8.7, "Yes"));
    base.Add(MakeMovie("The Godfather", {"Crime", "Drama"}, 1972, "R", 175, 9.2, "Yes"));
    base.Add(MakeMovie("Toy Story", {"Animation", "Comedy"}, 1995, "G", 81, 8.3, "Yes"));
    return base;
}

} // namespace cinecbr
