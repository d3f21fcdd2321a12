// File: src/cli/cinecbr_cli.cpp
//
// Interactive CLI interface for CineCBR
//
// Features:
// - Query building by command or guided prompts
// - Weight adjustment between searches
// - Ranked retrieval with per-attribute explanations
// - Markdown reports
// - CSV import with SQLite caching of the case base

#include "cli/cinecbr_cli.hpp"
#include "core/movie_domain.hpp"
#include "core/string_utils.hpp"
#include "storage/field_normalizer.hpp"
#include "similarity/local_metric.hpp"
#include "storage/sqlite_case_store.hpp"
#include <cmath>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace cinecbr {

namespace {

std::shared_ptr<const AttributeSchema> BuildSchema(const CliConfig& config) {
    return std::make_shared<const AttributeSchema>(config.BuildSchema());
}

RetrievalConfig BuildRetrievalConfig(const CliConfig& config) {
    RetrievalConfig retrieval;
    retrieval.num_threads = config.retrieval.num_threads;
    retrieval.debug_logging = config.retrieval.debug_logging;
    return retrieval;
}

CsvCaseLoader::Config BuildLoaderConfig() {
    CsvCaseLoader::Config loader;
    loader.echo_warnings = true;
    return loader;
}

} // anonymous namespace

CineCli::CineCli(const CliConfig& config)
    : CineCli(config, std::cin, std::cout) {}

CineCli::CineCli(const CliConfig& config, std::istream& in, std::ostream& out)
    : config_(config)
    , in_(in)
    , out_(out)
    , schema_(BuildSchema(config))
    , retriever_(std::make_unique<CaseRetriever>(schema_, BuildRetrievalConfig(config)))
    , loader_(schema_, BuildLoaderConfig())
    , report_(*schema_)
    , weights_(config.BuildWeights(*schema_))
    , verbose_(config.interface.verbose) {
    report_.SetColorsEnabled(config_.interface.colors_enabled);
    retriever_->SetDebugStream(&out_);
    if (verbose_) {
        RetrievalConfig retrieval = retriever_->GetConfig();
        retrieval.debug_logging = true;
        retriever_->SetConfig(retrieval);
    }
}

void CineCli::Run() {
    PrintWelcome();

    if (cases_.Empty() && !LoadCases()) {
        out_ << "The case base is empty. Check the case file '" << config_.data.case_file
             << "' or enable use_sample_cases.\n";
        return;
    }

    std::string line;
    while (running_) {
        if (!ReadLine(config_.interface.prompt, line)) {
            break;
        }
        ProcessCommand(line);
    }

    Shutdown();
}

void CineCli::PrintWelcome() {
    out_ << R"(
+--------------------------------------------------------------+
|                                                              |
|   CineCBR - case-based movie recommendation                  |
|                                                              |
|   Describe the movie you want; the closest recorded movies   |
|   are ranked by weighted attribute similarity.               |
|                                                              |
+--------------------------------------------------------------+

Type '/help' for available commands, or '/ask' for a guided search.

)";
}

bool CineCli::LoadCases() {
    std::unique_ptr<SqliteCaseStore> store;
    if (!config_.data.database_file.empty()) {
        try {
            SqliteCaseStore::Config store_config;
            store_config.db_path = config_.data.database_file;
            store = std::make_unique<SqliteCaseStore>(store_config);
        } catch (const std::runtime_error& e) {
            std::cerr << "Case database unavailable: " << e.what() << std::endl;
        }
    }

    if (store && store->Count() > 0) {
        auto stored = store->LoadAll();
        if (stored && !stored->Empty()) {
            out_ << stored->Size() << " movies loaded from '" << store->GetPath() << "'.\n";
            SetCaseBase(std::move(*stored));
            return true;
        }
    }

    if (std::filesystem::exists(config_.data.case_file)) {
        auto loaded = loader_.LoadFromFile(config_.data.case_file);
        if (loaded && !loaded->Empty()) {
            out_ << loaded->Size() << " movies loaded from '" << config_.data.case_file << "'.\n";
            if (store && !store->StoreAll(*loaded)) {
                std::cerr << "Failed to cache movies in '" << store->GetPath() << "'" << std::endl;
            }
            SetCaseBase(std::move(*loaded));
            return true;
        }
    } else {
        std::cerr << "Case file not found: " << config_.data.case_file << std::endl;
    }

    if (config_.data.use_sample_cases) {
        out_ << "Case base is empty. Using the built-in sample movies.\n";
        SetCaseBase(SampleMovieCases());
        return true;
    }

    return false;
}

void CineCli::SetCaseBase(CaseBase base) {
    // Results point into the old base
    last_results_.clear();
    cases_ = std::move(base);
}

void CineCli::ProcessCommand(const std::string& input) {
    std::string line = Trim(input);
    if (line.empty()) return;

    if (line[0] == '/') {
        HandleCommand(line.substr(1));
    } else if (line == "exit" || line == "quit") {
        running_ = false;
    } else {
        out_ << "Commands start with '/'. Type '/help' for available commands.\n";
    }
}

void CineCli::HandleCommand(const std::string& cmd) {
    std::istringstream iss(cmd);
    std::string command;
    iss >> command;

    std::string rest;
    std::getline(iss, rest);
    rest = Trim(rest);

    if (command == "help") {
        ShowHelp();
    } else if (command == "schema") {
        ShowSchema();
    } else if (command == "set") {
        std::istringstream args(rest);
        std::string name;
        args >> name;
        std::string value;
        std::getline(args, value);
        SetAttribute(name, Trim(value));
    } else if (command == "unset") {
        UnsetAttribute(rest);
    } else if (command == "clear") {
        query_.Clear();
        out_ << "Query cleared.\n";
    } else if (command == "query") {
        ShowQuery();
    } else if (command == "weight") {
        std::istringstream args(rest);
        std::string name, value;
        args >> name >> value;
        SetWeight(name, value);
    } else if (command == "weights") {
        ShowWeights();
    } else if (command == "reset-weights") {
        weights_ = config_.BuildWeights(*schema_);
        out_ << "Weights reset to defaults.\n";
    } else if (command == "search") {
        if (rest.empty()) {
            Search(std::nullopt);
        } else {
            auto n = normalize::ParseDecimal(rest);
            if (!n || *n < 0.0 || std::floor(*n) != *n) {
                out_ << "Usage: /search [N]\n";
                return;
            }
            Search(static_cast<size_t>(*n));
        }
    } else if (command == "explain") {
        Explain(rest);
    } else if (command == "save") {
        SaveReport();
    } else if (command == "load") {
        LoadFromCsv(rest);
    } else if (command == "import") {
        ImportToStore(rest);
    } else if (command == "cases") {
        ShowCases();
    } else if (command == "ask") {
        AskQuery();
    } else if (command == "verbose") {
        ToggleVerbose();
    } else if (command == "exit" || command == "quit") {
        running_ = false;
    } else {
        out_ << "Unknown command: /" << command << "\n";
        out_ << "Type '/help' for available commands.\n";
    }
}

void CineCli::ShowHelp() {
    out_ << C(Color::BOLD) << "Query\n" << C(Color::RESET);
    out_ << "  /set <attribute> <value>   Set a query attribute (lists: a, b, c)\n";
    out_ << "  /unset <attribute>         Remove a query attribute\n";
    out_ << "  /clear                     Remove all query attributes\n";
    out_ << "  /query                     Show the current query\n";
    out_ << "  /ask                       Guided query and weight entry\n";
    out_ << C(Color::BOLD) << "Weights\n" << C(Color::RESET);
    out_ << "  /weight <attribute> <w>    Set a weight between 0.0 and 1.0\n";
    out_ << "  /weights                   Show current weights\n";
    out_ << "  /reset-weights             Restore default weights\n";
    out_ << C(Color::BOLD) << "Retrieval\n" << C(Color::RESET);
    out_ << "  /search [N]                Rank the case base (top N)\n";
    out_ << "  /explain <rank>            Per-attribute breakdown of a result\n";
    out_ << "  /save                      Save the last results as Markdown\n";
    out_ << C(Color::BOLD) << "Case base\n" << C(Color::RESET);
    out_ << "  /schema                    Show attributes and their metrics\n";
    out_ << "  /cases                     List movies in the case base\n";
    out_ << "  /load <file.csv>           Replace the case base from a CSV file\n";
    out_ << "  /import <file.csv>         Load a CSV file and store it in the database\n";
    out_ << C(Color::BOLD) << "Other\n" << C(Color::RESET);
    out_ << "  /verbose                   Toggle retrieval trace output\n";
    out_ << "  /exit                      Quit\n";
}

std::string CineCli::DescribeSpec(const AttributeSpec& spec) const {
    std::ostringstream ss;
    ss << ToString(spec.kind);
    if (spec.kind == AttributeKind::NUMERIC_RANGE) {
        ss << " [" << FormatNumber(spec.range.min) << ", " << FormatNumber(spec.range.max) << "]";
    } else if (spec.kind == AttributeKind::ORDINAL) {
        ss << " {";
        for (size_t i = 0; i < spec.ordinal.ordered_values.size(); ++i) {
            ss << (i > 0 ? " < " : "") << spec.ordinal.ordered_values[i];
        }
        ss << "}";
    }
    return ss.str();
}

void CineCli::ShowSchema() {
    out_ << "Attributes:\n";
    for (const auto& spec : schema_->GetAttributes()) {
        out_ << "  " << std::left << std::setw(18) << spec.name << std::right
             << DescribeSpec(spec)
             << "  weight " << std::fixed << std::setprecision(2) << weights_.Get(spec.name)
             << " (default " << schema_->GetDefaultWeight(spec.name) << ")\n";
        out_.unsetf(std::ios::floatfield);
    }
}

std::optional<AttributeValue> CineCli::ParseQueryValue(const AttributeSpec& spec,
                                                       const std::string& text,
                                                       std::string* error) const {
    auto value = loader_.CoerceField(spec, text, error);
    if (!value && error && error->empty()) {
        *error = "empty value";
    }
    return value;
}

void CineCli::SetAttribute(const std::string& name, const std::string& value) {
    if (name.empty() || value.empty()) {
        out_ << "Usage: /set <attribute> <value>\n";
        return;
    }

    const AttributeSpec* spec = schema_->Find(name);
    if (!spec) {
        out_ << "Unknown attribute: " << name << " (see /schema)\n";
        return;
    }

    std::string error;
    auto parsed = ParseQueryValue(*spec, value, &error);
    if (!parsed) {
        out_ << "Invalid value for " << name << ": " << error << "\n";
        return;
    }

    if (spec->kind == AttributeKind::ORDINAL &&
        !ResolveOrdinalIndex(std::get<std::string>(*parsed), spec->ordinal)) {
        out_ << C(Color::YELLOW) << "Note: '" << ToDisplayString(*parsed)
             << "' is not a known " << name << "; it will only match exactly."
             << C(Color::RESET) << "\n";
    }

    query_.Set(name, *parsed);
    out_ << AttributeLabel(name) << " = " << ToDisplayString(*parsed) << "\n";
}

void CineCli::UnsetAttribute(const std::string& name) {
    if (query_.Erase(name)) {
        out_ << "Removed " << name << " from the query.\n";
    } else {
        out_ << name << " is not set.\n";
    }
}

void CineCli::ShowQuery() {
    if (query_.Empty()) {
        out_ << "Query is empty. Use /set or /ask.\n";
        return;
    }
    out_ << "Query:\n";
    for (const auto& spec : schema_->GetAttributes()) {
        if (const AttributeValue* value = query_.Find(spec.name)) {
            out_ << "  " << AttributeLabel(spec.name) << ": " << ToDisplayString(*value) << "\n";
        }
    }
}

void CineCli::SetWeight(const std::string& name, const std::string& value) {
    auto weight = normalize::ParseDecimal(value);
    if (name.empty() || !weight) {
        out_ << "Usage: /weight <attribute> <0.0-1.0>\n";
        return;
    }
    if (!schema_->Contains(name)) {
        out_ << "Unknown attribute: " << name << " (see /schema)\n";
        return;
    }

    try {
        weights_.Set(name, static_cast<float>(*weight));
    } catch (const std::invalid_argument& e) {
        out_ << e.what() << "\n";
        return;
    }
    out_ << "Weight of " << name << " = " << FormatNumber(*weight) << "\n";
}

void CineCli::ShowWeights() {
    out_ << "Weights:\n";
    for (const auto& [name, weight] : weights_) {
        out_ << "  " << std::left << std::setw(18) << name << std::right
             << std::fixed << std::setprecision(2) << weight << "\n";
    }
    out_.unsetf(std::ios::floatfield);
}

PresentationPolicy CineCli::CurrentPolicy(std::optional<size_t> top_n) const {
    PresentationPolicy policy;
    policy.top_n = top_n.value_or(config_.retrieval.top_n);
    policy.hide_zero_scores = config_.retrieval.hide_zero_scores;
    return policy;
}

void CineCli::Search(std::optional<size_t> top_n) {
    if (query_.Empty()) {
        out_ << "No search criteria given. Use /set or /ask first.\n";
        return;
    }
    if (cases_.Empty()) {
        out_ << "The case base is empty. Use /load first.\n";
        return;
    }

    last_query_ = query_;
    last_weights_ = weights_;
    last_results_ = retriever_->Retrieve(last_query_, cases_, last_weights_);
    searches_performed_++;

    report_.WriteConsole(out_, last_query_, ApplyPresentationPolicy(last_results_, CurrentPolicy(top_n)));

    if (verbose_) {
        const auto& stats = retriever_->GetLastRetrievalStats();
        out_ << "[" << stats.cases_evaluated << " cases evaluated, "
             << stats.nonzero_results << " with a non-zero score]\n";
    }
}

void CineCli::Explain(const std::string& rank_text) {
    if (last_results_.empty()) {
        out_ << "No results yet. Run /search first.\n";
        return;
    }

    auto rank = normalize::ParseDecimal(rank_text);
    if (!rank || *rank < 1.0 || *rank > static_cast<double>(last_results_.size()) ||
        std::floor(*rank) != *rank) {
        out_ << "Usage: /explain <rank between 1 and " << last_results_.size() << ">\n";
        return;
    }

    const SimilarityResult& result = last_results_[static_cast<size_t>(*rank) - 1];
    SimilarityBreakdown breakdown =
        retriever_->Explain(last_query_, *result.record, last_weights_);

    out_ << std::fixed << std::setprecision(3);
    out_ << result.record->GetTitle() << ": " << ResultReport::FormatScore(breakdown.score)
         << " (effective weight " << breakdown.effective_weight << ")\n";
    for (const auto& contribution : breakdown.contributions) {
        out_ << "  " << std::left << std::setw(18) << contribution.attribute << std::right
             << " similarity " << contribution.local_similarity
             << " x weight " << contribution.weight << "\n";
    }
    for (const auto& [name, reason] : breakdown.skipped) {
        out_ << "  " << std::left << std::setw(18) << name << std::right
             << " skipped (" << ToString(reason) << ")\n";
    }
    out_.unsetf(std::ios::floatfield);
}

void CineCli::SaveReport() {
    if (last_results_.empty()) {
        out_ << "Nothing to save. Run /search first.\n";
        return;
    }

    auto path = report_.SaveMarkdown(config_.data.report_directory, "movie_search_results",
                                     last_query_,
                                     ApplyPresentationPolicy(last_results_, CurrentPolicy(std::nullopt)));
    if (!path) {
        out_ << "Failed to save the report.\n";
        return;
    }

    last_report_path_ = path;
    out_ << "Results saved to: " << *path << "\n";
}

std::optional<CaseBase> CineCli::ReadCaseFile(const std::string& filepath) {
    auto loaded = loader_.LoadFromFile(filepath);
    if (!loaded) {
        out_ << "Could not load '" << filepath << "'.\n";
        return std::nullopt;
    }

    const auto& stats = loader_.GetLastLoadStats();
    out_ << loaded->Size() << " movies loaded from '" << filepath << "'";
    if (stats.rows_rejected > 0) {
        out_ << " (" << stats.rows_rejected << " rows skipped)";
    }
    out_ << ".\n";

    if (loaded->Empty()) {
        out_ << "Keeping the current case base.\n";
        return std::nullopt;
    }
    return loaded;
}

void CineCli::LoadFromCsv(const std::string& filepath) {
    if (filepath.empty()) {
        out_ << "Usage: /load <file.csv>\n";
        return;
    }

    auto loaded = ReadCaseFile(filepath);
    if (loaded) {
        SetCaseBase(std::move(*loaded));
    }
}

void CineCli::ImportToStore(const std::string& filepath) {
    if (filepath.empty()) {
        out_ << "Usage: /import <file.csv>\n";
        return;
    }
    if (config_.data.database_file.empty()) {
        out_ << "No database_file configured.\n";
        return;
    }

    auto loaded = ReadCaseFile(filepath);
    if (!loaded) {
        out_ << "Nothing imported.\n";
        return;
    }

    try {
        SqliteCaseStore::Config store_config;
        store_config.db_path = config_.data.database_file;
        SqliteCaseStore store(store_config);

        auto stored = store.StoreAll(*loaded);
        if (!stored) {
            out_ << "Failed to store movies in '" << store.GetPath() << "'.\n";
            return;
        }
        out_ << *stored << " movies stored in '" << store.GetPath() << "'.\n";
    } catch (const std::runtime_error& e) {
        out_ << "Case database unavailable: " << e.what() << "\n";
        return;
    }

    SetCaseBase(std::move(*loaded));
}

void CineCli::ShowCases() {
    if (cases_.Empty()) {
        out_ << "The case base is empty.\n";
        return;
    }
    out_ << cases_.Size() << " movies:\n";
    size_t position = 1;
    for (const auto& movie : cases_) {
        out_ << "  " << std::setw(4) << position++ << ". " << movie.GetTitle() << "\n";
    }
}

void CineCli::AskQuery() {
    out_ << "\n--- Describe the movie you want (Enter to skip an attribute) ---\n";

    Query query;
    for (const auto& spec : schema_->GetAttributes()) {
        while (true) {
            std::string line;
            if (!ReadLine(AttributeLabel(spec.name) + " [" + DescribeSpec(spec) + "]: ", line)) {
                return;
            }
            line = Trim(line);
            if (line.empty()) {
                break;
            }

            std::string error;
            auto value = ParseQueryValue(spec, line, &error);
            if (value) {
                query.Set(spec.name, *value);
                break;
            }
            out_ << "Invalid value: " << error << ". Try again or press Enter to skip.\n";
        }
    }

    out_ << "\n--- Adjust attribute weights (0.0 to 1.0, Enter keeps the current value) ---\n";

    WeightVector weights = weights_;
    for (const auto& spec : schema_->GetAttributes()) {
        while (true) {
            std::ostringstream prompt;
            prompt << "Weight for '" << spec.name << "' (current: " << std::fixed
                   << std::setprecision(2) << weights.Get(spec.name) << "): ";

            std::string line;
            if (!ReadLine(prompt.str(), line)) {
                return;
            }
            line = Trim(line);
            if (line.empty()) {
                break;
            }

            auto weight = normalize::ParseDecimal(line);
            if (weight && *weight >= 0.0 && *weight <= 1.0) {
                weights.Set(spec.name, static_cast<float>(*weight));
                break;
            }
            out_ << "Weight must be a number between 0.0 and 1.0.\n";
        }
    }
    weights_ = weights;

    if (query.Empty()) {
        out_ << "No criteria given for the new query. Nothing to search.\n";
        return;
    }

    query_ = query;
    Search(std::nullopt);

    std::string answer;
    if (ReadLine("\nSave the results to a file? (y/N): ", answer)) {
        answer = ToLower(Trim(answer));
        if (answer == "y" || answer == "yes" || answer == "s") {
            SaveReport();
        } else {
            out_ << "Results not saved.\n";
        }
    }
}

void CineCli::ToggleVerbose() {
    verbose_ = !verbose_;

    RetrievalConfig retrieval = retriever_->GetConfig();
    retrieval.debug_logging = verbose_ || config_.retrieval.debug_logging;
    retriever_->SetConfig(retrieval);

    out_ << "Verbose mode: " << (verbose_ ? "ON" : "OFF") << "\n";
}

void CineCli::Shutdown() {
    out_ << "\nSession Summary:\n";
    out_ << "  Movies in case base: " << cases_.Size() << "\n";
    out_ << "  Searches performed: " << searches_performed_ << "\n";
    out_ << "\nThanks for using CineCBR!\n";
}

bool CineCli::ReadLine(const std::string& prompt, std::string& line) {
    out_ << prompt;
    out_.flush();
    if (!std::getline(in_, line)) {
        return false;
    }
    return true;
}

} // namespace cinecbr
