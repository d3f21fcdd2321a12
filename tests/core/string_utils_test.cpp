// File: tests/core/string_utils_test.cpp
#include "core/string_utils.hpp"
#include <gtest/gtest.h>

namespace cinecbr {
namespace {

TEST(StringUtilsTest, Trim) {
    EXPECT_EQ("Sci-Fi", Trim("  Sci-Fi\t\n"));
    EXPECT_EQ("a b", Trim("a b"));
    EXPECT_EQ("", Trim("   "));
    EXPECT_EQ("", Trim(""));
}

TEST(StringUtilsTest, CaseFolding) {
    EXPECT_EQ("PG-13", ToUpper("pg-13"));
    EXPECT_EQ("not rated", ToLower("NOT Rated"));
}

TEST(StringUtilsTest, CollapseWhitespace) {
    EXPECT_EQ("not-rated", CollapseWhitespace("  not   \t rated ", '-'));
    EXPECT_EQ("a b c", CollapseWhitespace("a  b\n\nc", ' '));
    EXPECT_EQ("", CollapseWhitespace(" \t ", ' '));
}

TEST(StringUtilsTest, SplitKeepsEmptyPieces) {
    auto parts = Split("Drama|Comedy||Romance", "|");
    ASSERT_EQ(4u, parts.size());
    EXPECT_EQ("Drama", parts[0]);
    EXPECT_EQ("", parts[2]);
    EXPECT_EQ("Romance", parts[3]);
}

TEST(StringUtilsTest, SplitOnAnyDelimiter) {
    auto parts = Split("Action, Sci-Fi|Thriller", ",|");
    ASSERT_EQ(3u, parts.size());
    EXPECT_EQ(" Sci-Fi", parts[1]);
    EXPECT_EQ("Thriller", parts[2]);

    EXPECT_EQ(std::vector<std::string>{""}, Split("", ","));
}

} // namespace
} // namespace cinecbr
