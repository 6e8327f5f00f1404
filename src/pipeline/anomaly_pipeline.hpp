// File: src/pipeline/anomaly_pipeline.hpp
#pragma once

#include "anomaly/field_anomaly_engine.hpp"
#include "anomaly/structural_anomalies.hpp"
#include "config/generator_config.hpp"
#include "core/sequence_tensor.hpp"
#include "core/traffic_record.hpp"
#include "fields/field.hpp"
#include "storage/field_repository.hpp"
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace canforge {

/// One generated anomaly and where it was written
struct GeneratedAnomaly {
    std::string label;
    TensorShape shape;
    std::string output_path;  // Empty when nothing was written
};

/// Outcome of a full generation run
struct PipelineResult {
    /// Shape of the clean test sequences
    TensorShape sequences_shape;

    /// Words dropped because they did not fill a complete sequence
    size_t discarded_words{0};

    /// Field targeted by the field anomalies, if one was available
    std::optional<Field> target_field;

    /// Anomalies in generation order: structural first, then field anomalies
    std::vector<GeneratedAnomaly> anomalies;

    /// True when no field of the target category existed
    bool field_anomalies_skipped{false};
};

/// AnomalyPipeline - drives one identifier from traffic to anomaly files
///
/// Loads the traffic dump, keeps one identifier, windows it into test
/// sequences, resolves the identifier's field layout from the repository
/// (classifying and storing it when missing), then generates the four
/// structural anomalies and one field anomaly per configured strategy.
class AnomalyPipeline {
public:
    /// Constructor
    /// @param config Run configuration
    /// @param repository Field layout storage, must outlive the pipeline
    AnomalyPipeline(const GeneratorConfig& config, FieldRepository& repository);

    /// Run the whole pipeline from the configured CSV file
    /// @throws std::runtime_error on I/O failures or a missing field layout
    /// @throws std::invalid_argument on contract violations in the traffic
    PipelineResult Run();

    /// Run the pipeline on already decoded records
    PipelineResult Run(const std::vector<TrafficRecord>& records);

    /// Field layout of the configured identifier
    ///
    /// Returns the stored layout; when none is stored and classification is
    /// enabled, classifies `sequences` and stores the result.
    /// @throws std::runtime_error if no layout is stored and classification
    ///         is disabled or the layout cannot be stored
    std::vector<Field> ResolveFields(const SequenceTensor& sequences);

    /// Generate every configured anomaly for a tensor
    /// @param sequences Clean test sequences
    /// @param fields Field layout of the identifier
    /// @param result Receives the target field and skip flag
    /// @return Generated tensors with their labels
    std::vector<AnomalyResult> Generate(const SequenceTensor& sequences,
                                        const std::vector<Field>& fields,
                                        PipelineResult& result);

    /// Get current configuration
    const GeneratorConfig& GetConfig() const { return config_; }

private:
    GeneratorConfig config_;
    FieldRepository& repository_;
    std::mt19937 rng_;
    FieldAnomalyEngine engine_;

    /// Write one tensor below the output directory
    /// @return Path of the written file
    /// @throws std::runtime_error if the file cannot be written
    std::string WriteAnomaly(const AnomalyResult& anomaly, const std::vector<Field>& fields);

    void LogDebug(const std::string& message) const;
};

} // namespace canforge
