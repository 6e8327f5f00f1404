// File: include/config/generator_config.hpp
//
// YAML Configuration Support for canforge
// Allows loading anomaly generation settings from YAML configuration files

#ifndef CANFORGE_GENERATOR_CONFIG_HPP
#define CANFORGE_GENERATOR_CONFIG_HPP

#include "core/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace canforge {

/// Configuration structure for anomaly generation runs
struct GeneratorConfig {
    // === Traffic Settings ===
    struct Traffic {
        std::string csv_path = "data/traffic.csv";
        std::string can_id = "0DE";
        double sampling_period = 0.01;  // Seconds between messages
        double duration = 3.0;          // Seconds per sequence
    } traffic;

    // === Field Classification Storage ===
    struct Fields {
        std::string db_path = "fields.db";
        bool classify_if_missing = true;
    } fields;

    // === Field Classifier Thresholds ===
    struct Classifier {
        size_t max_multi_value_cardinality = 16;
        float high_var_threshold = 0.5f;
        float mid_var_threshold = 0.1f;
    } classifier;

    // === Anomaly Settings ===
    struct Anomaly {
        double anomaly_duration = 1.0;  // Seconds of corrupted field values
        size_t drop_length = 10;        // Words removed by the drop anomaly
        FieldVariability target_category = FieldVariability::HIGH_VAR;
        std::vector<MutationStrategy> strategies = AllMutationStrategies();
        uint32_t seed = 0;              // 0 = nondeterministic
    } anomaly;

    // === Output Settings ===
    struct Output {
        std::string directory = "anomalies";
        bool strip_constant_bits = false;  // Drop CONST field bits before writing
        bool verbose = false;
    } output;

    /// Number of words covered by a field anomaly of anomaly_duration seconds
    size_t AnomalyWordCount() const;

    /// Load configuration from YAML file
    /// @param filepath Path to YAML configuration file
    /// @return GeneratorConfig structure if successful, std::nullopt on error
    static std::optional<GeneratorConfig> LoadFromFile(const std::string& filepath);

    /// Load configuration from YAML string
    /// @param yaml_content YAML content as string
    /// @return GeneratorConfig structure if successful, std::nullopt on error
    static std::optional<GeneratorConfig> LoadFromString(const std::string& yaml_content);

    /// Save configuration to YAML file
    /// @param filepath Path to save YAML file
    /// @return true if successful, false on error
    bool SaveToFile(const std::string& filepath) const;

    /// Convert to YAML string
    std::string ToYamlString() const;

    /// Validate configuration values
    bool Validate() const;

    /// Get validation errors (if any)
    std::vector<std::string> GetValidationErrors() const;

    /// Create default configuration
    static GeneratorConfig Default();
};

} // namespace canforge

#endif // CANFORGE_GENERATOR_CONFIG_HPP
