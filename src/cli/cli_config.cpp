// File: src/cli/cli_config.cpp
//
// YAML Configuration Implementation for the CineCBR CLI

#include "cli/cli_config.hpp"
#include "core/movie_domain.hpp"
#include <yaml.h>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>

namespace cinecbr {

namespace {

/// Parsed YAML node (anchors and aliases are not supported)
struct YamlNode {
    enum class Type { SCALAR, SEQUENCE, MAPPING };

    Type type = Type::SCALAR;
    std::string scalar;
    std::vector<YamlNode> items;           // SEQUENCE
    std::vector<std::string> keys;         // MAPPING, parallel to values
    std::vector<YamlNode> values;
};

// Helper function to read string from YAML scalar
std::string GetScalarValue(const yaml_event_t* event) {
    return std::string(reinterpret_cast<const char*>(event->data.scalar.value),
                       event->data.scalar.length);
}

// Helper to convert string to bool
bool ParseBool(const std::string& value) {
    return (value == "true" || value == "True" || value == "TRUE" ||
            value == "yes" || value == "Yes" || value == "YES" ||
            value == "1" || value == "on" || value == "On" || value == "ON");
}

size_t ParseSize(const std::string& key, const std::string& value) {
    char* end = nullptr;
    long long parsed = std::strtoll(value.c_str(), &end, 10);
    if (value.empty() || *end != '\0' || parsed < 0) {
        throw std::invalid_argument(key + " must be a non-negative integer, got '" + value + "'");
    }
    return static_cast<size_t>(parsed);
}

double ParseDouble(const std::string& key, const std::string& value) {
    char* end = nullptr;
    double parsed = std::strtod(value.c_str(), &end);
    if (value.empty() || *end != '\0') {
        throw std::invalid_argument(key + " must be a number, got '" + value + "'");
    }
    return parsed;
}

float ParseFloat(const std::string& key, const std::string& value) {
    return static_cast<float>(ParseDouble(key, value));
}

const std::string& RequireScalar(const std::string& key, const YamlNode& node) {
    if (node.type != YamlNode::Type::SCALAR) {
        throw std::invalid_argument(key + " must be a scalar value");
    }
    return node.scalar;
}

// Parse the node that starts with `event`; takes ownership of `event`
bool ParseNode(yaml_parser_t* parser, yaml_event_t* event, YamlNode& node) {
    switch (event->type) {
        case YAML_SCALAR_EVENT:
            node.type = YamlNode::Type::SCALAR;
            node.scalar = GetScalarValue(event);
            yaml_event_delete(event);
            return true;

        case YAML_SEQUENCE_START_EVENT:
            node.type = YamlNode::Type::SEQUENCE;
            yaml_event_delete(event);
            while (true) {
                yaml_event_t child;
                if (!yaml_parser_parse(parser, &child)) {
                    return false;
                }
                if (child.type == YAML_SEQUENCE_END_EVENT) {
                    yaml_event_delete(&child);
                    return true;
                }
                YamlNode item;
                if (!ParseNode(parser, &child, item)) {
                    return false;
                }
                node.items.push_back(std::move(item));
            }

        case YAML_MAPPING_START_EVENT:
            node.type = YamlNode::Type::MAPPING;
            yaml_event_delete(event);
            while (true) {
                yaml_event_t key_event;
                if (!yaml_parser_parse(parser, &key_event)) {
                    return false;
                }
                if (key_event.type == YAML_MAPPING_END_EVENT) {
                    yaml_event_delete(&key_event);
                    return true;
                }
                if (key_event.type != YAML_SCALAR_EVENT) {
                    yaml_event_delete(&key_event);
                    return false;
                }
                std::string key = GetScalarValue(&key_event);
                yaml_event_delete(&key_event);

                yaml_event_t value_event;
                if (!yaml_parser_parse(parser, &value_event)) {
                    return false;
                }
                YamlNode value;
                if (!ParseNode(parser, &value_event, value)) {
                    return false;
                }
                node.keys.push_back(std::move(key));
                node.values.push_back(std::move(value));
            }

        default:
            yaml_event_delete(event);
            return false;
    }
}

// Parse a whole YAML document; an empty stream yields an empty mapping
std::optional<YamlNode> ParseDocument(const std::string& yaml_content) {
    yaml_parser_t parser;
    if (!yaml_parser_initialize(&parser)) {
        std::cerr << "Failed to initialize YAML parser" << std::endl;
        return std::nullopt;
    }

    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(yaml_content.c_str()),
        yaml_content.size());

    YamlNode root;
    root.type = YamlNode::Type::MAPPING;
    bool ok = true;

    yaml_event_t event;
    while (ok) {
        if (!yaml_parser_parse(&parser, &event)) {
            ok = false;
            break;
        }

        yaml_event_type_t type = event.type;
        if (type == YAML_STREAM_START_EVENT || type == YAML_DOCUMENT_START_EVENT ||
            type == YAML_DOCUMENT_END_EVENT) {
            yaml_event_delete(&event);
            continue;
        }
        if (type == YAML_STREAM_END_EVENT) {
            yaml_event_delete(&event);
            break;
        }

        // Root node; ParseNode takes the event
        ok = ParseNode(&parser, &event, root);
    }

    if (!ok) {
        std::cerr << "YAML parse error";
        if (parser.problem) {
            std::cerr << ": " << parser.problem << " (line " << parser.problem_mark.line + 1 << ")";
        }
        std::cerr << std::endl;
    }

    yaml_parser_delete(&parser);

    if (!ok) {
        return std::nullopt;
    }
    return root;
}

void ApplyInterface(const YamlNode& section, CliConfig& config) {
    for (size_t i = 0; i < section.keys.size(); ++i) {
        const std::string& key = section.keys[i];
        const std::string& value = RequireScalar(key, section.values[i]);

        if (key == "prompt") config.interface.prompt = value;
        else if (key == "colors_enabled") config.interface.colors_enabled = ParseBool(value);
        else if (key == "verbose") config.interface.verbose = ParseBool(value);
    }
}

void ApplyData(const YamlNode& section, CliConfig& config) {
    for (size_t i = 0; i < section.keys.size(); ++i) {
        const std::string& key = section.keys[i];
        const std::string& value = RequireScalar(key, section.values[i]);

        if (key == "case_file") config.data.case_file = value;
        else if (key == "database_file") config.data.database_file = value;
        else if (key == "report_directory") config.data.report_directory = value;
        else if (key == "use_sample_cases") config.data.use_sample_cases = ParseBool(value);
    }
}

void ApplyRetrieval(const YamlNode& section, CliConfig& config) {
    for (size_t i = 0; i < section.keys.size(); ++i) {
        const std::string& key = section.keys[i];
        const std::string& value = RequireScalar(key, section.values[i]);

        if (key == "num_threads") config.retrieval.num_threads = ParseSize(key, value);
        else if (key == "top_n") config.retrieval.top_n = ParseSize(key, value);
        else if (key == "hide_zero_scores") config.retrieval.hide_zero_scores = ParseBool(value);
        else if (key == "debug_logging") config.retrieval.debug_logging = ParseBool(value);
    }
}

void ApplyWeights(const YamlNode& section, CliConfig& config) {
    for (size_t i = 0; i < section.keys.size(); ++i) {
        const std::string& key = section.keys[i];
        config.weights[key] = ParseFloat(key, RequireScalar(key, section.values[i]));
    }
}

void ApplyAttributes(const YamlNode& section, CliConfig& config) {
    config.attributes.clear();

    for (size_t i = 0; i < section.keys.size(); ++i) {
        const YamlNode& definition = section.values[i];
        if (definition.type != YamlNode::Type::MAPPING) {
            throw std::invalid_argument("attribute '" + section.keys[i] + "' must be a mapping");
        }

        CliConfig::Attribute attribute;
        attribute.name = section.keys[i];

        for (size_t j = 0; j < definition.keys.size(); ++j) {
            const std::string& key = definition.keys[j];
            const YamlNode& value = definition.values[j];

            if (key == "ordered_values") {
                if (value.type != YamlNode::Type::SEQUENCE) {
                    throw std::invalid_argument("ordered_values of '" + attribute.name +
                                                "' must be a sequence");
                }
                for (const auto& item : value.items) {
                    attribute.ordered_values.push_back(RequireScalar(key, item));
                }
                continue;
            }

            const std::string& scalar = RequireScalar(key, value);
            if (key == "kind") attribute.kind = scalar;
            else if (key == "weight") attribute.weight = ParseFloat(key, scalar);
            else if (key == "min") attribute.min = ParseDouble(key, scalar);
            else if (key == "max") attribute.max = ParseDouble(key, scalar);
            else if (key == "fallback_unknown") attribute.fallback_unknown = scalar;
        }

        config.attributes.push_back(std::move(attribute));
    }
}

std::string Quote(const std::string& value) {
    std::string out = "\"";
    for (char c : value) {
        if (c == '"' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

bool WeightInRange(float weight) {
    return std::isfinite(weight) && weight >= 0.0f && weight <= 1.0f;
}

} // anonymous namespace

std::optional<CliConfig> CliConfig::LoadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file: " << filepath << std::endl;
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return LoadFromString(buffer.str());
}

std::optional<CliConfig> CliConfig::LoadFromString(const std::string& yaml_content) {
    auto root = ParseDocument(yaml_content);
    if (!root) {
        return std::nullopt;
    }
    if (root->type != YamlNode::Type::MAPPING) {
        std::cerr << "Configuration root must be a mapping" << std::endl;
        return std::nullopt;
    }

    CliConfig config = Default();

    try {
        for (size_t i = 0; i < root->keys.size(); ++i) {
            const std::string& section = root->keys[i];
            const YamlNode& node = root->values[i];

            if (node.type != YamlNode::Type::MAPPING) {
                throw std::invalid_argument("section '" + section + "' must be a mapping");
            }

            if (section == "interface") ApplyInterface(node, config);
            else if (section == "data") ApplyData(node, config);
            else if (section == "retrieval") ApplyRetrieval(node, config);
            else if (section == "weights") ApplyWeights(node, config);
            else if (section == "attributes") ApplyAttributes(node, config);
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return std::nullopt;
    }

    // Validate configuration
    if (!config.Validate()) {
        std::cerr << "Configuration validation failed:" << std::endl;
        for (const auto& error : config.GetValidationErrors()) {
            std::cerr << "  - " << error << std::endl;
        }
        return std::nullopt;
    }

    return config;
}

bool CliConfig::SaveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open file for writing: " << filepath << std::endl;
        return false;
    }

    file << ToYamlString();
    return static_cast<bool>(file);
}

std::string CliConfig::ToYamlString() const {
    std::ostringstream ss;

    ss << "# CineCBR CLI Configuration\n";
    ss << "# Auto-generated configuration file\n\n";

    ss << "interface:\n";
    ss << "  prompt: " << Quote(interface.prompt) << "\n";
    ss << "  colors_enabled: " << (interface.colors_enabled ? "true" : "false") << "\n";
    ss << "  verbose: " << (interface.verbose ? "true" : "false") << "\n\n";

    ss << "data:\n";
    ss << "  case_file: " << Quote(data.case_file) << "\n";
    ss << "  database_file: " << Quote(data.database_file) << "\n";
    ss << "  report_directory: " << Quote(data.report_directory) << "\n";
    ss << "  use_sample_cases: " << (data.use_sample_cases ? "true" : "false") << "\n\n";

    ss << "retrieval:\n";
    ss << "  num_threads: " << retrieval.num_threads << "\n";
    ss << "  top_n: " << retrieval.top_n << "\n";
    ss << "  hide_zero_scores: " << (retrieval.hide_zero_scores ? "true" : "false") << "\n";
    ss << "  debug_logging: " << (retrieval.debug_logging ? "true" : "false") << "\n";

    if (!weights.empty()) {
        ss << "\nweights:\n";
        for (const auto& [name, weight] : weights) {
            ss << "  " << name << ": " << weight << "\n";
        }
    }

    if (!attributes.empty()) {
        ss << "\nattributes:\n";
        for (const auto& attribute : attributes) {
            ss << "  " << attribute.name << ":\n";
            ss << "    kind: " << attribute.kind << "\n";
            ss << "    weight: " << attribute.weight << "\n";
            if (attribute.kind == "numeric_range" || attribute.kind == "numeric") {
                ss << "    min: " << attribute.min << "\n";
                ss << "    max: " << attribute.max << "\n";
            }
            if (!attribute.ordered_values.empty()) {
                ss << "    ordered_values: [";
                for (size_t i = 0; i < attribute.ordered_values.size(); ++i) {
                    ss << (i > 0 ? ", " : "") << Quote(attribute.ordered_values[i]);
                }
                ss << "]\n";
            }
            if (!attribute.fallback_unknown.empty()) {
                ss << "    fallback_unknown: " << Quote(attribute.fallback_unknown) << "\n";
            }
        }
    }

    return ss.str();
}

bool CliConfig::Validate() const {
    return GetValidationErrors().empty();
}

std::vector<std::string> CliConfig::GetValidationErrors() const {
    std::vector<std::string> errors;

    if (retrieval.num_threads == 0) {
        errors.push_back("num_threads must be greater than 0");
    }

    for (const auto& [name, weight] : weights) {
        if (!WeightInRange(weight)) {
            errors.push_back("weight of '" + name + "' must be between 0.0 and 1.0");
        }
    }

    std::set<std::string> seen;
    for (const auto& attribute : attributes) {
        if (!seen.insert(attribute.name).second) {
            errors.push_back("attribute '" + attribute.name + "' is defined more than once");
        }
        if (!WeightInRange(attribute.weight)) {
            errors.push_back("weight of '" + attribute.name + "' must be between 0.0 and 1.0");
        }

        AttributeKind kind;
        try {
            kind = ParseAttributeKind(attribute.kind);
        } catch (const std::invalid_argument&) {
            errors.push_back("kind of '" + attribute.name +
                             "' must be one of: categorical, numeric_range, ordinal, set_jaccard");
            continue;
        }

        AttributeSpec spec;
        spec.name = attribute.name;
        spec.kind = kind;
        spec.range.min = attribute.min;
        spec.range.max = attribute.max;
        spec.ordinal.ordered_values = attribute.ordered_values;
        spec.ordinal.fallback_unknown = attribute.fallback_unknown;

        std::string error = spec.Validate();
        if (!error.empty()) {
            errors.push_back(error);
        }
    }

    return errors;
}

AttributeSchema CliConfig::BuildSchema() const {
    if (attributes.empty()) {
        return MovieSchema();
    }

    AttributeSchema schema;
    for (const auto& attribute : attributes) {
        AttributeSpec spec;
        spec.name = attribute.name;
        spec.kind = ParseAttributeKind(attribute.kind);
        spec.range.min = attribute.min;
        spec.range.max = attribute.max;
        spec.ordinal.ordered_values = attribute.ordered_values;
        spec.ordinal.fallback_unknown = attribute.fallback_unknown;
        schema.AddAttribute(spec, attribute.weight);
    }
    return schema;
}

WeightVector CliConfig::BuildWeights(const AttributeSchema& schema) const {
    WeightVector result = schema.DefaultWeights();
    for (const auto& [name, weight] : weights) {
        result.Set(name, weight);
    }
    return result;
}

CliConfig CliConfig::Default() {
    return CliConfig{};  // Uses default member initializers
}

} // namespace cinecbr
