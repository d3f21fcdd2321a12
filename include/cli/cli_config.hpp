// File: include/cli/cli_config.hpp
//
// YAML Configuration Support for the CineCBR CLI
// Loads interface settings, data sources, retrieval options, the attribute
// schema and the default weights from a YAML file

#ifndef CINECBR_CLI_CONFIG_HPP
#define CINECBR_CLI_CONFIG_HPP

#include "core/attribute_schema.hpp"
#include "core/weight_vector.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cinecbr {

/// Configuration structure for the CineCBR CLI
struct CliConfig {
    // === Interface Settings ===
    struct Interface {
        std::string prompt = "cinecbr> ";
        bool colors_enabled = true;
        bool verbose = false;
    } interface;

    // === Data Sources ===
    struct Data {
        std::string case_file = "movies.csv";
        std::string database_file;               // Empty: no SQLite store
        std::string report_directory = ".";
        bool use_sample_cases = true;            // Fall back to built-in movies
    } data;

    // === Retrieval Settings ===
    struct Retrieval {
        size_t num_threads = 1;
        size_t top_n = 10;                       // 0 = show all results
        bool hide_zero_scores = false;
        bool debug_logging = false;
    } retrieval;

    // === Attribute Schema ===
    struct Attribute {
        std::string name;
        std::string kind = "categorical";
        float weight = 0.0f;
        double min = 0.0;                        // numeric_range only
        double max = 1.0;                        // numeric_range only
        std::vector<std::string> ordered_values; // ordinal only
        std::string fallback_unknown;            // ordinal only
    };

    /// Attribute definitions in file order; empty means the movie schema
    std::vector<Attribute> attributes;

    /// Weight overrides applied on top of the schema defaults
    std::map<std::string, float> weights;

    /// Load configuration from YAML file
    /// @param filepath Path to YAML configuration file
    /// @return CliConfig structure if successful, std::nullopt on error
    static std::optional<CliConfig> LoadFromFile(const std::string& filepath);

    /// Load configuration from YAML string
    /// @param yaml_content YAML content as string
    /// @return CliConfig structure if successful, std::nullopt on error
    static std::optional<CliConfig> LoadFromString(const std::string& yaml_content);

    /// Save configuration to YAML file
    /// @param filepath Path to save YAML file
    /// @return true if successful, false on error
    bool SaveToFile(const std::string& filepath) const;

    /// Convert to YAML string
    /// @return YAML representation of configuration
    std::string ToYamlString() const;

    /// Validate configuration values
    /// @return true if configuration is valid, false otherwise
    bool Validate() const;

    /// Get validation errors (if any)
    /// @return Vector of error messages
    std::vector<std::string> GetValidationErrors() const;

    /// Build the attribute schema described by this configuration
    /// @throws std::invalid_argument if the attribute definitions are invalid
    AttributeSchema BuildSchema() const;

    /// Schema default weights with the configured overrides applied
    /// @throws std::invalid_argument if an override is outside [0, 1]
    WeightVector BuildWeights(const AttributeSchema& schema) const;

    /// Create default configuration
    static CliConfig Default();
};

} // namespace cinecbr

#endif // CINECBR_CLI_CONFIG_HPP
