// File: tests/report/result_report_test.cpp
#include "report/result_report.hpp"
#include "core/movie_domain.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace cinecbr;

class ResultReportTest : public ::testing::Test {
protected:
    void SetUp() override {
        schema_ = MovieSchema();
        movies_ = SampleMovieCases();

        query_.Set(attr::YEAR, 1999.0);
        query_.Set(attr::GENRE, std::vector<std::string>{"Sci-Fi"});

        results_.emplace_back(&movies_[0], 0, 0.875f);
        results_.emplace_back(&movies_[2], 2, 0.5f);
        results_.emplace_back(&movies_[1], 1, 0.0f);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    AttributeSchema schema_;
    CaseBase movies_;
    Query query_;
    std::vector<SimilarityResult> results_;
    std::string temp_dir_ = "/tmp/cinecbr_report_test";
};

TEST(PresentationPolicyTest, DefaultKeepsEverything) {
    CaseRecord a("A"), b("B");
    std::vector<SimilarityResult> results = {{&a, 0, 0.5f}, {&b, 1, 0.0f}};

    auto shown = ApplyPresentationPolicy(results, PresentationPolicy{});
    ASSERT_EQ(2u, shown.size());
    EXPECT_EQ(&a, shown[0].record);
}

TEST(PresentationPolicyTest, TopNAndZeroFilter) {
    CaseRecord a("A"), b("B"), c("C");
    std::vector<SimilarityResult> results = {{&a, 0, 0.9f}, {&b, 1, 0.4f}, {&c, 2, 0.0f}};

    PresentationPolicy top_one;
    top_one.top_n = 1;
    auto shown = ApplyPresentationPolicy(results, top_one);
    ASSERT_EQ(1u, shown.size());
    EXPECT_EQ(&a, shown[0].record);

    PresentationPolicy nonzero;
    nonzero.hide_zero_scores = true;
    shown = ApplyPresentationPolicy(results, nonzero);
    ASSERT_EQ(2u, shown.size());
    EXPECT_EQ(&b, shown[1].record);
}

TEST(AttributeLabelTest, Humanizes) {
    EXPECT_EQ("Runtime minutes", AttributeLabel("runtime_minutes"));
    EXPECT_EQ("Genre", AttributeLabel("genre"));
    EXPECT_EQ("", AttributeLabel(""));
}

TEST_F(ResultReportTest, FormatScore) {
    EXPECT_EQ("87.50%", ResultReport::FormatScore(0.875f));
    EXPECT_EQ("100.00%", ResultReport::FormatScore(1.0f));
    EXPECT_EQ("0.00%", ResultReport::FormatScore(0.0f));
}

TEST_F(ResultReportTest, ConsoleReport) {
    ResultReport report(schema_);
    std::ostringstream out;
    report.WriteConsole(out, query_, results_);

    std::string text = out.str();
    EXPECT_NE(std::string::npos, text.find("--- SEARCH RESULTS ---"));
    EXPECT_NE(std::string::npos, text.find("Genre: Sci-Fi"));
    EXPECT_NE(std::string::npos, text.find("1. The Matrix"));
    EXPECT_NE(std::string::npos, text.find("2. Toy Story"));
    EXPECT_NE(std::string::npos, text.find("Similarity: 87.50%"));
    EXPECT_NE(std::string::npos, text.find("Content rating: R"));
    EXPECT_EQ(std::string::npos, text.find("\033["));

    // Schema order: genre before year in the query block
    EXPECT_LT(text.find("Genre: Sci-Fi"), text.find("Year: 1999"));
}

TEST_F(ResultReportTest, ConsoleColors) {
    ResultReport report(schema_);
    report.SetColorsEnabled(true);
    std::ostringstream out;
    report.WriteConsole(out, query_, results_);
    EXPECT_NE(std::string::npos, out.str().find(Color::GREEN));
}

TEST_F(ResultReportTest, ConsoleEmptyResults) {
    ResultReport report(schema_);
    std::ostringstream out;
    report.WriteConsole(out, Query{}, {});
    EXPECT_NE(std::string::npos, out.str().find("(no criteria)"));
    EXPECT_NE(std::string::npos, out.str().find("No movies"));
}

TEST_F(ResultReportTest, MarkdownReport) {
    ResultReport report(schema_);
    std::string md = report.ToMarkdown(query_, results_);

    EXPECT_EQ(0u, md.find("# Movie Search Results"));
    EXPECT_NE(std::string::npos, md.find("## Query"));
    EXPECT_NE(std::string::npos, md.find("- **Year**: 1999"));
    EXPECT_NE(std::string::npos, md.find("## Movies Found (ordered by similarity)"));
    EXPECT_NE(std::string::npos, md.find("### The Matrix"));
    EXPECT_NE(std::string::npos, md.find("- **Similarity**: 87.50%"));
    EXPECT_NE(std::string::npos, md.find("  - **Genre**: Sci-Fi, Action"));
    EXPECT_LT(md.find("### The Matrix"), md.find("### Toy Story"));
}

TEST_F(ResultReportTest, ExtraAttributesListedAfterSchema) {
    Query query = query_;
    query.Set("director", std::string("Wachowski"));

    ResultReport report(schema_);
    std::string md = report.ToMarkdown(query, {});
    EXPECT_LT(md.find("**Year**"), md.find("**Director**"));
}

TEST_F(ResultReportTest, SaveMarkdown) {
    ResultReport report(schema_);
    auto path = report.SaveMarkdown(temp_dir_ + "/nested", "movie_search_results",
                                    query_, results_);

    ASSERT_TRUE(path.has_value());
    EXPECT_TRUE(std::filesystem::exists(*path));
    std::string filename = std::filesystem::path(*path).filename().string();
    EXPECT_EQ(0u, filename.find("movie_search_results_"));
    EXPECT_EQ(".md", std::filesystem::path(*path).extension().string());

    std::ifstream file(*path);
    std::stringstream content;
    content << file.rdbuf();
    EXPECT_EQ(report.ToMarkdown(query_, results_), content.str());
}
