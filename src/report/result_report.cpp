// File: src/report/result_report.cpp
#include "report/result_report.hpp"
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace cinecbr {

namespace {

std::string TimestampSuffix() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);

    std::ostringstream ss;
    ss << std::put_time(&local, "%Y%m%d_%H%M%S");
    return ss.str();
}

} // anonymous namespace

std::vector<SimilarityResult> ApplyPresentationPolicy(
        const std::vector<SimilarityResult>& results,
        const PresentationPolicy& policy) {
    std::vector<SimilarityResult> shown;
    shown.reserve(results.size());

    for (const auto& result : results) {
        if (policy.top_n > 0 && shown.size() >= policy.top_n) {
            break;
        }
        if (policy.hide_zero_scores && result.score <= 0.0f) {
            continue;
        }
        shown.push_back(result);
    }

    return shown;
}

std::string AttributeLabel(const std::string& name) {
    std::string label = name;
    for (char& c : label) {
        if (c == '_') {
            c = ' ';
        }
    }
    if (!label.empty()) {
        label[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(label[0])));
    }
    return label;
}

// ============================================================================
// ResultReport
// ============================================================================

std::string ResultReport::FormatScore(float score) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << score * 100.0f << "%";
    return ss.str();
}

std::vector<std::string> ResultReport::DisplayOrder(const CaseRecord& record) const {
    std::vector<std::string> names;
    for (const auto& spec : schema_.GetAttributes()) {
        if (record.Has(spec.name)) {
            names.push_back(spec.name);
        }
    }
    for (const auto& name : record.GetNames()) {
        if (!schema_.Contains(name)) {
            names.push_back(name);
        }
    }
    return names;
}

void ResultReport::WriteConsole(std::ostream& out, const Query& query,
                                const std::vector<SimilarityResult>& results) const {
    out << "\n" << C(Color::BOLD) << "--- SEARCH RESULTS ---" << C(Color::RESET) << "\n";

    out << "\nQuery:\n";
    if (query.Empty()) {
        out << "  (no criteria)\n";
    } else {
        for (const auto& name : DisplayOrder(query)) {
            out << "  " << AttributeLabel(name) << ": "
                << ToDisplayString(*query.Find(name)) << "\n";
        }
    }

    out << "\nMovies found (ordered by similarity):\n";
    if (results.empty()) {
        out << "  No movies in the case base matched the query.\n";
        return;
    }

    size_t rank = 1;
    for (const auto& result : results) {
        const CaseRecord& movie = *result.record;
        out << "\n  ------------------------------------\n";
        out << "  " << rank++ << ". " << C(Color::CYAN) << movie.GetTitle() << C(Color::RESET) << "\n";
        out << "  Similarity: " << C(Color::GREEN) << FormatScore(result.score) << C(Color::RESET) << "\n";
        for (const auto& name : DisplayOrder(movie)) {
            out << "    " << AttributeLabel(name) << ": "
                << ToDisplayString(*movie.Find(name)) << "\n";
        }
    }
    out << "  ------------------------------------\n";
}

std::string ResultReport::ToMarkdown(const Query& query,
                                     const std::vector<SimilarityResult>& results) const {
    std::ostringstream md;

    md << "# Movie Search Results\n\n";

    md << "## Query\n\n";
    if (query.Empty()) {
        md << "- No search criteria provided.\n";
    } else {
        for (const auto& name : DisplayOrder(query)) {
            md << "- **" << AttributeLabel(name) << "**: "
               << ToDisplayString(*query.Find(name)) << "\n";
        }
    }
    md << "\n";

    md << "## Movies Found (ordered by similarity)\n";
    if (results.empty()) {
        md << "\n- No movies in the case base matched the query.\n";
        return md.str();
    }

    for (const auto& result : results) {
        const CaseRecord& movie = *result.record;
        md << "\n---\n\n";
        md << "### " << movie.GetTitle() << "\n\n";
        md << "- **Similarity**: " << FormatScore(result.score) << "\n";
        for (const auto& name : DisplayOrder(movie)) {
            md << "  - **" << AttributeLabel(name) << "**: "
               << ToDisplayString(*movie.Find(name)) << "\n";
        }
    }

    return md.str();
}

std::optional<std::string> ResultReport::SaveMarkdown(
        const std::string& directory,
        const std::string& base_name,
        const Query& query,
        const std::vector<SimilarityResult>& results) const {
    std::filesystem::path dir = directory.empty() ? std::filesystem::path(".")
                                                  : std::filesystem::path(directory);

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        std::cerr << "Failed to create report directory " << dir << ": "
                  << ec.message() << std::endl;
        return std::nullopt;
    }

    std::filesystem::path path = dir / (base_name + "_" + TimestampSuffix() + ".md");

    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "Failed to open file for writing: " << path.string() << std::endl;
        return std::nullopt;
    }

    file << ToMarkdown(query, results);
    if (!file) {
        std::cerr << "Failed to write report: " << path.string() << std::endl;
        return std::nullopt;
    }

    return path.string();
}

} // namespace cinecbr
