// File: tests/core/attribute_schema_test.cpp
#include "core/attribute_schema.hpp"
#include "core/movie_domain.hpp"
#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>

namespace cinecbr {
namespace {

TEST(AttributeKindTest, ToStringAndParse) {
    EXPECT_STREQ("categorical", ToString(AttributeKind::CATEGORICAL));
    EXPECT_STREQ("numeric_range", ToString(AttributeKind::NUMERIC_RANGE));
    EXPECT_STREQ("ordinal", ToString(AttributeKind::ORDINAL));
    EXPECT_STREQ("set_jaccard", ToString(AttributeKind::SET_JACCARD));

    EXPECT_EQ(AttributeKind::NUMERIC_RANGE, ParseAttributeKind("numeric_range"));
    EXPECT_EQ(AttributeKind::NUMERIC_RANGE, ParseAttributeKind("numeric"));
    EXPECT_EQ(AttributeKind::SET_JACCARD, ParseAttributeKind("set"));
    EXPECT_THROW(ParseAttributeKind("fuzzy"), std::invalid_argument);
}

TEST(AttributeSpecTest, ValidateNumericRange) {
    EXPECT_TRUE(AttributeSpec::NumericRange("year", 1920, 2025).Validate().empty());
    EXPECT_TRUE(AttributeSpec::NumericRange("fixed", 5, 5).Validate().empty());
    EXPECT_FALSE(AttributeSpec::NumericRange("year", 2025, 1920).Validate().empty());
    EXPECT_FALSE(AttributeSpec::NumericRange(
        "year", 0, std::numeric_limits<double>::infinity()).Validate().empty());
}

TEST(AttributeSpecTest, ValidateOrdinal) {
    EXPECT_TRUE(AttributeSpec::Ordinal("rating", {"G", "PG"}, "").Validate().empty());
    EXPECT_FALSE(AttributeSpec::Ordinal("rating", {}, "").Validate().empty());
    EXPECT_FALSE(AttributeSpec::Ordinal("rating", {"G", "G"}, "").Validate().empty());
}

TEST(AttributeSpecTest, ValidateName) {
    EXPECT_FALSE(AttributeSpec::Categorical("").Validate().empty());
}

TEST(AttributeSchemaTest, AddAndFind) {
    AttributeSchema schema;
    schema.AddAttribute(AttributeSpec::SetJaccard("genre"), 0.5f);
    schema.AddAttribute(AttributeSpec::NumericRange("year", 1920, 2025), 0.25f);

    ASSERT_EQ(2u, schema.Size());
    const AttributeSpec* year = schema.Find("year");
    ASSERT_NE(nullptr, year);
    EXPECT_EQ(AttributeKind::NUMERIC_RANGE, year->kind);
    EXPECT_DOUBLE_EQ(105.0, year->range.Span());

    EXPECT_EQ(nullptr, schema.Find("budget"));
    EXPECT_FALSE(schema.Contains("budget"));
    EXPECT_FLOAT_EQ(0.0f, schema.GetDefaultWeight("budget"));
}

TEST(AttributeSchemaTest, RejectsDuplicatesAndBadWeights) {
    AttributeSchema schema;
    schema.AddAttribute(AttributeSpec::Categorical("has_sequel"), 0.1f);

    EXPECT_THROW(schema.AddAttribute(AttributeSpec::Categorical("has_sequel"), 0.1f),
                 std::invalid_argument);
    EXPECT_THROW(schema.AddAttribute(AttributeSpec::Categorical("other"), 1.5f),
                 std::invalid_argument);
    EXPECT_THROW(schema.AddAttribute(AttributeSpec::NumericRange("bad", 10, 1), 0.1f),
                 std::invalid_argument);
    EXPECT_EQ(1u, schema.Size());
}

TEST(AttributeSchemaTest, KeepsDeclarationOrder) {
    AttributeSchema schema = MovieSchema();
    const auto& specs = schema.GetAttributes();
    ASSERT_EQ(6u, specs.size());
    EXPECT_EQ(attr::GENRE, specs[0].name);
    EXPECT_EQ(attr::YEAR, specs[1].name);
    EXPECT_EQ(attr::CONTENT_RATING, specs[2].name);
    EXPECT_EQ(attr::RUNTIME_MINUTES, specs[3].name);
    EXPECT_EQ(attr::CRITIC_RATING, specs[4].name);
    EXPECT_EQ(attr::HAS_SEQUEL, specs[5].name);
}

TEST(AttributeSchemaTest, Classify) {
    AttributeSchema schema = MovieSchema();
    CaseRecord record;
    record.Set(attr::YEAR, 1999.0);
    record.Set("budget", 63.0);

    EXPECT_EQ(AttributePresence::PRESENT, schema.Classify(record, attr::YEAR));
    EXPECT_EQ(AttributePresence::ABSENT, schema.Classify(record, attr::GENRE));
    EXPECT_EQ(AttributePresence::NOT_IN_SCHEMA, schema.Classify(record, "budget"));
}

TEST(MovieSchemaTest, DefaultWeights) {
    WeightVector weights = MovieSchema().DefaultWeights();
    EXPECT_FLOAT_EQ(0.25f, weights.Get(attr::GENRE));
    EXPECT_FLOAT_EQ(0.15f, weights.Get(attr::YEAR));
    EXPECT_FLOAT_EQ(0.15f, weights.Get(attr::CONTENT_RATING));
    EXPECT_FLOAT_EQ(0.15f, weights.Get(attr::RUNTIME_MINUTES));
    EXPECT_FLOAT_EQ(0.20f, weights.Get(attr::CRITIC_RATING));
    EXPECT_FLOAT_EQ(0.10f, weights.Get(attr::HAS_SEQUEL));
    EXPECT_NEAR(1.0f, weights.TotalWeight(), 1e-5f);
}

TEST(MovieSchemaTest, ContentRatingOrder) {
    const AttributeSpec* rating = MovieSchema().Find(attr::CONTENT_RATING);
    ASSERT_NE(nullptr, rating);
    std::vector<std::string> expected = {"G", "PG", "PG-13", "R", "NC-17", "NOT-RATED"};
    EXPECT_EQ(expected, rating->ordinal.ordered_values);
    EXPECT_EQ("NOT-RATED", rating->ordinal.fallback_unknown);
}

TEST(MovieSchemaTest, SampleCases) {
    CaseBase samples = SampleMovieCases();
    ASSERT_EQ(3u, samples.Size());
    EXPECT_EQ("The Matrix", samples[0].GetTitle());
    EXPECT_EQ(6u, samples[0].Size());
}

} // namespace
} // namespace cinecbr
