// File: tests/cli/cinecbr_cli_test.cpp
//
// Test suite for the CineCBR CLI, driven through explicit streams

#include "cli/cinecbr_cli.hpp"
#include "core/movie_domain.hpp"
#include "storage/sqlite_case_store.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace cinecbr {
namespace {

// Test fixture for CLI tests
class CineCliTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir_ = "/tmp/cinecbr_cli_test_" + std::to_string(
            std::chrono::system_clock::now().time_since_epoch().count());
        std::filesystem::create_directories(temp_dir_);

        config_ = CliConfig::Default();
        config_.interface.colors_enabled = false;
        config_.data.case_file = temp_dir_ + "/missing.csv";
        config_.data.report_directory = temp_dir_ + "/reports";

        cli_ = std::make_unique<CineCli>(config_, in_, out_);
        cli_->SetCaseBase(SampleMovieCases());
    }

    void TearDown() override {
        cli_.reset();
        std::filesystem::remove_all(temp_dir_);
    }

    std::string WriteFile(const std::string& name, const std::string& content) {
        std::string path = temp_dir_ + "/" + name;
        std::ofstream file(path);
        file << content;
        return path;
    }

    std::string Output() const { return out_.str(); }
    void ClearOutput() { out_.str(""); }

    std::string temp_dir_;
    CliConfig config_;
    std::istringstream in_;
    std::ostringstream out_;
    std::unique_ptr<CineCli> cli_;
};

// ============================================================================
// Query building
// ============================================================================

TEST_F(CineCliTest, StartsWithEmptyQueryAndDefaultWeights) {
    EXPECT_TRUE(cli_->GetQuery().Empty());
    EXPECT_EQ(MovieSchema().DefaultWeights(), cli_->GetWeights());
    EXPECT_EQ(3u, cli_->GetCaseBase().Size());
    EXPECT_TRUE(cli_->IsRunning());
    EXPECT_FALSE(cli_->IsVerboseEnabled());
}

TEST_F(CineCliTest, SetParsesValuesByKind) {
    cli_->ProcessCommand("/set genre Sci-Fi, Thriller");
    cli_->ProcessCommand("/set year 2001");
    cli_->ProcessCommand("/set content_rating pg 13");
    cli_->ProcessCommand("/set runtime_minutes 2h 10min");
    cli_->ProcessCommand("/set has_sequel sim");

    const Query& query = cli_->GetQuery();
    ASSERT_EQ(5u, query.Size());
    EXPECT_EQ((std::vector<std::string>{"Sci-Fi", "Thriller"}),
              std::get<std::vector<std::string>>(*query.Find(attr::GENRE)));
    EXPECT_DOUBLE_EQ(2001.0, std::get<double>(*query.Find(attr::YEAR)));
    EXPECT_EQ("PG-13", std::get<std::string>(*query.Find(attr::CONTENT_RATING)));
    EXPECT_DOUBLE_EQ(130.0, std::get<double>(*query.Find(attr::RUNTIME_MINUTES)));
    EXPECT_EQ("Yes", std::get<std::string>(*query.Find(attr::HAS_SEQUEL)));
}

TEST_F(CineCliTest, SetRejectsUnknownAttributesAndBadValues) {
    cli_->ProcessCommand("/set budget 10");
    EXPECT_NE(std::string::npos, Output().find("Unknown attribute: budget"));

    cli_->ProcessCommand("/set year soon");
    EXPECT_NE(std::string::npos, Output().find("Invalid value for year"));

    cli_->ProcessCommand("/set year");
    EXPECT_NE(std::string::npos, Output().find("Usage: /set"));

    EXPECT_TRUE(cli_->GetQuery().Empty());
}

TEST_F(CineCliTest, UnknownRatingIsAcceptedWithNote) {
    cli_->ProcessCommand("/set content_rating TV-MA");
    EXPECT_TRUE(cli_->GetQuery().Has(attr::CONTENT_RATING));
    EXPECT_NE(std::string::npos, Output().find("only match exactly"));
}

TEST_F(CineCliTest, UnsetAndClear) {
    cli_->ProcessCommand("/set year 1999");
    cli_->ProcessCommand("/set genre Drama");

    cli_->ProcessCommand("/unset year");
    EXPECT_FALSE(cli_->GetQuery().Has(attr::YEAR));
    EXPECT_EQ(1u, cli_->GetQuery().Size());

    cli_->ProcessCommand("/clear");
    EXPECT_TRUE(cli_->GetQuery().Empty());
}

// ============================================================================
// Weights
// ============================================================================

TEST_F(CineCliTest, WeightCommand) {
    cli_->ProcessCommand("/weight genre 0,9");
    EXPECT_FLOAT_EQ(0.9f, cli_->GetWeights().Get(attr::GENRE));

    cli_->ProcessCommand("/weight genre 2");
    EXPECT_NE(std::string::npos, Output().find("between 0.0 and 1.0"));
    EXPECT_FLOAT_EQ(0.9f, cli_->GetWeights().Get(attr::GENRE));

    cli_->ProcessCommand("/weight budget 0.5");
    EXPECT_FALSE(cli_->GetWeights().Has("budget"));

    cli_->ProcessCommand("/reset-weights");
    EXPECT_FLOAT_EQ(0.25f, cli_->GetWeights().Get(attr::GENRE));
}

// ============================================================================
// Search
// ============================================================================

TEST_F(CineCliTest, SearchWithEmptyQueryIsRefused) {
    cli_->ProcessCommand("/search");
    EXPECT_NE(std::string::npos, Output().find("No search criteria"));
    EXPECT_EQ(0u, cli_->GetSearchCount());
    EXPECT_TRUE(cli_->GetLastResults().empty());
}

TEST_F(CineCliTest, SearchRanksWholeBase) {
    cli_->ProcessCommand("/set genre Crime, Drama");
    cli_->ProcessCommand("/set year 1970");
    cli_->ProcessCommand("/search");

    ASSERT_EQ(3u, cli_->GetLastResults().size());
    EXPECT_EQ("The Godfather", cli_->GetLastResults()[0].record->GetTitle());
    EXPECT_EQ(1u, cli_->GetSearchCount());
    EXPECT_NE(std::string::npos, Output().find("--- SEARCH RESULTS ---"));
    EXPECT_NE(std::string::npos, Output().find("1. The Godfather"));
}

TEST_F(CineCliTest, SearchTopNLimitsDisplayOnly) {
    cli_->ProcessCommand("/set genre Sci-Fi");
    ClearOutput();
    cli_->ProcessCommand("/search 1");

    EXPECT_EQ(3u, cli_->GetLastResults().size());
    EXPECT_NE(std::string::npos, Output().find("1. The Matrix"));
    EXPECT_EQ(std::string::npos, Output().find("Toy Story"));
    EXPECT_EQ(std::string::npos, Output().find("The Godfather"));
}

TEST_F(CineCliTest, WeightChangesAfterSearchDoNotAffectExplain) {
    cli_->ProcessCommand("/set genre Sci-Fi");
    cli_->ProcessCommand("/set year 1995");
    cli_->ProcessCommand("/search");
    float first_score = cli_->GetLastResults()[0].score;

    cli_->ProcessCommand("/weight genre 0");
    ClearOutput();
    cli_->ProcessCommand("/explain 1");

    EXPECT_NE(std::string::npos, Output().find(ResultReport::FormatScore(first_score)));
    EXPECT_NE(std::string::npos, Output().find("genre"));
}

TEST_F(CineCliTest, ExplainValidatesRank) {
    cli_->ProcessCommand("/explain 1");
    EXPECT_NE(std::string::npos, Output().find("No results yet"));

    cli_->ProcessCommand("/set year 1999");
    cli_->ProcessCommand("/search");
    ClearOutput();
    cli_->ProcessCommand("/explain 9");
    EXPECT_NE(std::string::npos, Output().find("Usage: /explain"));
}

TEST_F(CineCliTest, SaveWritesMarkdownReport) {
    cli_->ProcessCommand("/save");
    EXPECT_FALSE(cli_->GetLastReportPath().has_value());

    cli_->ProcessCommand("/set genre Animation");
    cli_->ProcessCommand("/search");
    cli_->ProcessCommand("/save");

    ASSERT_TRUE(cli_->GetLastReportPath().has_value());
    EXPECT_TRUE(std::filesystem::exists(*cli_->GetLastReportPath()));
    EXPECT_NE(std::string::npos, Output().find("Results saved to:"));
}

// ============================================================================
// Case base
// ============================================================================

TEST_F(CineCliTest, LoadReplacesCaseBaseAndClearsResults) {
    cli_->ProcessCommand("/set year 1999");
    cli_->ProcessCommand("/search");
    ASSERT_FALSE(cli_->GetLastResults().empty());

    std::string path = WriteFile("small.csv", "title,year\nOne,2000\nTwo,1990\n");
    cli_->ProcessCommand("/load " + path);

    EXPECT_EQ(2u, cli_->GetCaseBase().Size());
    EXPECT_TRUE(cli_->GetLastResults().empty());
}

TEST_F(CineCliTest, LoadMissingFileKeepsCaseBase) {
    cli_->ProcessCommand("/load " + temp_dir_ + "/nope.csv");
    EXPECT_EQ(3u, cli_->GetCaseBase().Size());
    EXPECT_NE(std::string::npos, Output().find("Could not load"));
}

TEST_F(CineCliTest, ImportRequiresDatabase) {
    cli_->ProcessCommand("/import whatever.csv");
    EXPECT_NE(std::string::npos, Output().find("No database_file configured"));
}

TEST_F(CineCliTest, ImportStoresCases) {
    config_.data.database_file = temp_dir_ + "/cases.db";
    CineCli cli(config_, in_, out_);

    std::string path = WriteFile("import.csv", "title,genre\nA,Drama\nB,Comedy\nC,Horror\n");
    cli.ProcessCommand("/import " + path);

    EXPECT_EQ(3u, cli.GetCaseBase().Size());
    SqliteCaseStore::Config store_config;
    store_config.db_path = config_.data.database_file;
    SqliteCaseStore store(store_config);
    EXPECT_EQ(3u, store.Count());
}

TEST_F(CineCliTest, ImportOfMissingFileStoresNothing) {
    config_.data.database_file = temp_dir_ + "/cases.db";
    CineCli cli(config_, in_, out_);
    cli.SetCaseBase(SampleMovieCases());

    cli.ProcessCommand("/import " + temp_dir_ + "/does_not_exist.csv");

    EXPECT_NE(std::string::npos, Output().find("Could not load"));
    EXPECT_NE(std::string::npos, Output().find("Nothing imported"));
    EXPECT_EQ(std::string::npos, Output().find("movies stored"));
    EXPECT_EQ(3u, cli.GetCaseBase().Size());

    SqliteCaseStore::Config store_config;
    store_config.db_path = config_.data.database_file;
    SqliteCaseStore store(store_config);
    EXPECT_EQ(0u, store.Count());
}

TEST_F(CineCliTest, ImportWithoutUsableRowsKeepsStoredCases) {
    config_.data.database_file = temp_dir_ + "/cases.db";
    CineCli cli(config_, in_, out_);

    cli.ProcessCommand("/import " + WriteFile("first.csv", "title,genre\nA,Drama\nB,Comedy\n"));
    ClearOutput();
    cli.ProcessCommand("/import " + WriteFile("empty.csv", "title,genre\n,Drama\n"));

    EXPECT_NE(std::string::npos, Output().find("Nothing imported"));
    EXPECT_EQ(2u, cli.GetCaseBase().Size());

    SqliteCaseStore::Config store_config;
    store_config.db_path = config_.data.database_file;
    SqliteCaseStore store(store_config);
    auto stored = store.LoadAll();
    ASSERT_TRUE(stored.has_value());
    ASSERT_EQ(2u, stored->Size());
    EXPECT_EQ("A", (*stored)[0].GetTitle());
}

TEST_F(CineCliTest, LoadCasesFallsBackToSamples) {
    CineCli cli(config_, in_, out_);
    EXPECT_TRUE(cli.LoadCases());
    EXPECT_EQ(3u, cli.GetCaseBase().Size());

    config_.data.use_sample_cases = false;
    CineCli no_samples(config_, in_, out_);
    EXPECT_FALSE(no_samples.LoadCases());
}

TEST_F(CineCliTest, LoadCasesFromCsvThenDatabase) {
    config_.data.case_file = CINECBR_SOURCE_DIR "/data/movies.csv";
    config_.data.database_file = temp_dir_ + "/movies.db";

    {
        CineCli first(config_, in_, out_);
        ASSERT_TRUE(first.LoadCases());
        EXPECT_EQ(21u, first.GetCaseBase().Size());
    }

    // Second start reads the cached copy even without the CSV
    config_.data.case_file = temp_dir_ + "/missing.csv";
    config_.data.use_sample_cases = false;
    ClearOutput();

    CineCli second(config_, in_, out_);
    ASSERT_TRUE(second.LoadCases());
    EXPECT_EQ(21u, second.GetCaseBase().Size());
    EXPECT_EQ("The Matrix", second.GetCaseBase()[0].GetTitle());
    EXPECT_NE(std::string::npos, Output().find("movies.db"));
}

// ============================================================================
// Guided mode and session
// ============================================================================

TEST_F(CineCliTest, AskBuildsQueryAndWeights) {
    // Six attribute answers, six weight answers, then decline saving
    in_.str("Sci-Fi, Action\n2000\n\n\n\n\n"
            "1\n\n\n\n\n\n"
            "n\n");

    cli_->ProcessCommand("/ask");

    EXPECT_EQ(2u, cli_->GetQuery().Size());
    EXPECT_FLOAT_EQ(1.0f, cli_->GetWeights().Get(attr::GENRE));
    EXPECT_EQ(1u, cli_->GetSearchCount());
    EXPECT_EQ("The Matrix", cli_->GetLastResults()[0].record->GetTitle());
    EXPECT_NE(std::string::npos, Output().find("Results not saved"));
}

TEST_F(CineCliTest, AskRetriesInvalidAnswers) {
    in_.str("\nnot a year\n1999\n\n\n\n\n"
            "\n\n\n\n\n\n"
            "n\n");

    cli_->ProcessCommand("/ask");

    ASSERT_EQ(1u, cli_->GetQuery().Size());
    EXPECT_DOUBLE_EQ(1999.0, std::get<double>(*cli_->GetQuery().Find(attr::YEAR)));
    EXPECT_NE(std::string::npos, Output().find("Invalid value"));
}

TEST_F(CineCliTest, VerboseTogglesState) {
    EXPECT_FALSE(cli_->IsVerboseEnabled());
    cli_->ProcessCommand("/verbose");
    EXPECT_TRUE(cli_->IsVerboseEnabled());

    cli_->ProcessCommand("/set year 1999");
    cli_->ProcessCommand("/search");
    EXPECT_NE(std::string::npos, Output().find("[CaseRetriever]"));

    cli_->ProcessCommand("/verbose");
    EXPECT_FALSE(cli_->IsVerboseEnabled());
}

TEST_F(CineCliTest, UnknownCommandAndPlainText) {
    cli_->ProcessCommand("/frobnicate");
    EXPECT_NE(std::string::npos, Output().find("Unknown command: /frobnicate"));

    cli_->ProcessCommand("find me a movie");
    EXPECT_NE(std::string::npos, Output().find("Commands start with '/'"));

    cli_->ProcessCommand("   ");
    EXPECT_TRUE(cli_->IsRunning());
}

TEST_F(CineCliTest, RunProcessesInputUntilExit) {
    in_.str("/set genre Drama\n/search\n/exit\n/search\n");
    cli_->Run();

    EXPECT_FALSE(cli_->IsRunning());
    EXPECT_EQ(1u, cli_->GetSearchCount());
    EXPECT_NE(std::string::npos, Output().find("Session Summary"));
    EXPECT_NE(std::string::npos, Output().find("Searches performed: 1"));
}

TEST_F(CineCliTest, RunStopsAtEndOfInput) {
    in_.str("/schema\n");
    cli_->Run();
    EXPECT_NE(std::string::npos, Output().find("content_rating"));
    EXPECT_NE(std::string::npos, Output().find("Session Summary"));
}

} // namespace
} // namespace cinecbr
