// File: src/config/generator_config.cpp
//
// YAML Configuration Implementation for canforge

#include "config/generator_config.hpp"
#include <yaml.h>
#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace canforge {

// Helper function to read string from YAML scalar
static std::string GetScalarValue(yaml_event_t* event) {
    return std::string(reinterpret_cast<char*>(event->data.scalar.value),
                       event->data.scalar.length);
}

// Helper to convert string to bool
static bool ParseBool(const std::string& value) {
    return (value == "true" || value == "True" || value == "TRUE" ||
            value == "yes" || value == "Yes" || value == "YES" ||
            value == "1" || value == "on" || value == "On" || value == "ON");
}

// Helper to parse an unsigned integer; std::stoul wraps negative input
// @throws std::invalid_argument or std::out_of_range
static unsigned long ParseUnsigned(const std::string& value, unsigned long max_value) {
    if (value.find('-') != std::string::npos) {
        throw std::out_of_range("negative value " + value);
    }
    unsigned long parsed = std::stoul(value);
    if (parsed > max_value) {
        throw std::out_of_range("value " + value + " exceeds " + std::to_string(max_value));
    }
    return parsed;
}

// Helper to parse a comma-separated strategy list ("max, min, replay")
static std::vector<MutationStrategy> ParseStrategyList(const std::string& value) {
    std::vector<MutationStrategy> strategies;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        size_t begin = item.find_first_not_of(" \t");
        size_t end = item.find_last_not_of(" \t");
        if (begin == std::string::npos) {
            continue;
        }
        strategies.push_back(ParseMutationStrategy(item.substr(begin, end - begin + 1)));
    }
    return strategies;
}

// Apply one "section.key: value" pair
// @throws std::logic_error on values that do not parse
static void ApplyValue(GeneratorConfig& config,
                       const std::string& section,
                       const std::string& key,
                       const std::string& value) {
    if (section == "traffic") {
        if (key == "csv_path") config.traffic.csv_path = value;
        else if (key == "can_id") config.traffic.can_id = value;
        else if (key == "sampling_period") config.traffic.sampling_period = std::stod(value);
        else if (key == "duration") config.traffic.duration = std::stod(value);
    }
    else if (section == "fields") {
        if (key == "db_path") config.fields.db_path = value;
        else if (key == "classify_if_missing") config.fields.classify_if_missing = ParseBool(value);
    }
    else if (section == "classifier") {
        if (key == "max_multi_value_cardinality") config.classifier.max_multi_value_cardinality =
            ParseUnsigned(value, std::numeric_limits<size_t>::max());
        else if (key == "high_var_threshold") config.classifier.high_var_threshold = std::stof(value);
        else if (key == "mid_var_threshold") config.classifier.mid_var_threshold = std::stof(value);
    }
    else if (section == "anomaly") {
        if (key == "anomaly_duration") config.anomaly.anomaly_duration = std::stod(value);
        else if (key == "drop_length") config.anomaly.drop_length =
            ParseUnsigned(value, std::numeric_limits<size_t>::max());
        else if (key == "target_category") config.anomaly.target_category = ParseFieldVariability(value);
        else if (key == "strategies") config.anomaly.strategies = ParseStrategyList(value);
        else if (key == "seed") config.anomaly.seed = static_cast<uint32_t>(
            ParseUnsigned(value, std::numeric_limits<uint32_t>::max()));
    }
    else if (section == "output") {
        if (key == "directory") config.output.directory = value;
        else if (key == "strip_constant_bits") config.output.strip_constant_bits = ParseBool(value);
        else if (key == "verbose") config.output.verbose = ParseBool(value);
    }
}

size_t GeneratorConfig::AnomalyWordCount() const {
    if (traffic.sampling_period <= 0.0 || anomaly.anomaly_duration <= 0.0) {
        return 0;
    }
    return static_cast<size_t>(std::floor(anomaly.anomaly_duration / traffic.sampling_period));
}

std::optional<GeneratorConfig> GeneratorConfig::LoadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file: " << filepath << std::endl;
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return LoadFromString(buffer.str());
}

std::optional<GeneratorConfig> GeneratorConfig::LoadFromString(const std::string& yaml_content) {
    yaml_parser_t parser;
    yaml_event_t event;

    if (!yaml_parser_initialize(&parser)) {
        std::cerr << "Failed to initialize YAML parser" << std::endl;
        return std::nullopt;
    }

    // Set input string
    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(yaml_content.c_str()),
        yaml_content.size());

    GeneratorConfig config = Default();
    std::string current_section;
    std::string current_key;
    std::string sequence_items;  // Items of a YAML list value, comma-joined
    bool in_sequence = false;
    int depth = 0;

    bool done = false;
    while (!done) {
        if (!yaml_parser_parse(&parser, &event)) {
            std::cerr << "YAML parse error: "
                      << (parser.problem ? parser.problem : "unknown") << std::endl;
            yaml_parser_delete(&parser);
            return std::nullopt;
        }

        try {
            switch (event.type) {
                case YAML_STREAM_START_EVENT:
                case YAML_DOCUMENT_START_EVENT:
                    break;

                case YAML_MAPPING_START_EVENT:
                    // Keys map to scalars or lists only
                    if (depth >= 2) {
                        throw std::invalid_argument("nested mappings are not supported");
                    }
                    depth++;
                    break;

                case YAML_MAPPING_END_EVENT:
                    depth--;
                    if (depth == 1) {
                        current_section.clear();
                    }
                    break;

                case YAML_SEQUENCE_START_EVENT:
                    // Lists are only meaningful as values ("strategies: [max, min]")
                    if (depth == 2 && !current_key.empty()) {
                        in_sequence = true;
                        sequence_items.clear();
                    }
                    break;

                case YAML_SEQUENCE_END_EVENT:
                    if (in_sequence) {
                        ApplyValue(config, current_section, current_key, sequence_items);
                        in_sequence = false;
                        current_key.clear();
                    }
                    break;

                case YAML_SCALAR_EVENT: {
                    std::string value = GetScalarValue(&event);

                    if (in_sequence) {
                        if (!sequence_items.empty()) {
                            sequence_items += ",";
                        }
                        sequence_items += value;
                    } else if (depth == 1) {
                        // Top-level key (section name)
                        current_section = value;
                    } else if (depth == 2) {
                        if (current_key.empty()) {
                            current_key = value;
                        } else {
                            ApplyValue(config, current_section, current_key, value);
                            current_key.clear();
                        }
                    }
                    break;
                }

                case YAML_STREAM_END_EVENT:
                case YAML_DOCUMENT_END_EVENT:
                    done = true;
                    break;

                default:
                    break;
            }
        } catch (const std::logic_error& e) {
            std::cerr << "Invalid value for " << current_section << "." << current_key
                      << ": " << e.what() << std::endl;
            yaml_event_delete(&event);
            yaml_parser_delete(&parser);
            return std::nullopt;
        }

        yaml_event_delete(&event);
    }

    yaml_parser_delete(&parser);

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

bool GeneratorConfig::SaveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open file for writing: " << filepath << std::endl;
        return false;
    }

    file << ToYamlString();
    return static_cast<bool>(file);
}

std::string GeneratorConfig::ToYamlString() const {
    std::ostringstream ss;

    ss << "# canforge Configuration\n";
    ss << "# Auto-generated configuration file\n\n";

    ss << "traffic:\n";
    ss << "  csv_path: \"" << traffic.csv_path << "\"\n";
    ss << "  can_id: \"" << traffic.can_id << "\"\n";
    ss << "  sampling_period: " << traffic.sampling_period << "\n";
    ss << "  duration: " << traffic.duration << "\n\n";

    ss << "fields:\n";
    ss << "  db_path: \"" << fields.db_path << "\"\n";
    ss << "  classify_if_missing: " << (fields.classify_if_missing ? "true" : "false") << "\n\n";

    ss << "classifier:\n";
    ss << "  max_multi_value_cardinality: " << classifier.max_multi_value_cardinality << "\n";
    ss << "  high_var_threshold: " << classifier.high_var_threshold << "\n";
    ss << "  mid_var_threshold: " << classifier.mid_var_threshold << "\n\n";

    ss << "anomaly:\n";
    ss << "  anomaly_duration: " << anomaly.anomaly_duration << "\n";
    ss << "  drop_length: " << anomaly.drop_length << "\n";
    ss << "  target_category: " << ToString(anomaly.target_category) << "\n";
    ss << "  strategies: [";
    for (size_t i = 0; i < anomaly.strategies.size(); ++i) {
        ss << (i > 0 ? ", " : "") << ToString(anomaly.strategies[i]);
    }
    ss << "]\n";
    ss << "  seed: " << anomaly.seed << "\n\n";

    ss << "output:\n";
    ss << "  directory: \"" << output.directory << "\"\n";
    ss << "  strip_constant_bits: " << (output.strip_constant_bits ? "true" : "false") << "\n";
    ss << "  verbose: " << (output.verbose ? "true" : "false") << "\n";

    return ss.str();
}

bool GeneratorConfig::Validate() const {
    return GetValidationErrors().empty();
}

std::vector<std::string> GeneratorConfig::GetValidationErrors() const {
    std::vector<std::string> errors;

    // Validate traffic timing
    if (traffic.can_id.empty()) {
        errors.push_back("can_id must not be empty");
    }
    if (traffic.sampling_period <= 0.0) {
        errors.push_back("sampling_period must be greater than 0");
    }
    if (traffic.duration < traffic.sampling_period) {
        errors.push_back("duration must be at least one sampling_period");
    }

    // Validate classifier thresholds
    if (classifier.max_multi_value_cardinality == 0) {
        errors.push_back("max_multi_value_cardinality must be greater than 0");
    }
    if (classifier.high_var_threshold < 0.0f || classifier.high_var_threshold > 1.0f) {
        errors.push_back("high_var_threshold must be between 0.0 and 1.0");
    }
    if (classifier.mid_var_threshold < 0.0f || classifier.mid_var_threshold > 1.0f) {
        errors.push_back("mid_var_threshold must be between 0.0 and 1.0");
    }
    if (classifier.mid_var_threshold > classifier.high_var_threshold) {
        errors.push_back("mid_var_threshold must be <= high_var_threshold");
    }

    // Validate anomaly settings
    if (anomaly.anomaly_duration < 0.0) {
        errors.push_back("anomaly_duration must not be negative");
    }
    if (anomaly.strategies.empty()) {
        errors.push_back("strategies must name at least one mutation strategy");
    }
    if (traffic.sampling_period > 0.0) {
        const size_t words = static_cast<size_t>(std::floor(traffic.duration / traffic.sampling_period));
        if (anomaly.drop_length >= words) {
            errors.push_back("drop_length must be less than the number of words per sequence");
        }
        // The field anomaly run starts no earlier than the first third of a sequence
        if (AnomalyWordCount() + 1 > words - words / 3) {
            errors.push_back("anomaly_duration must fit after the first third of a sequence");
        }
    }

    return errors;
}

GeneratorConfig GeneratorConfig::Default() {
    return GeneratorConfig{};  // Uses default member initializers
}

} // namespace canforge
