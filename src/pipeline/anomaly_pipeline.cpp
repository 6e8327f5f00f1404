// File: src/pipeline/anomaly_pipeline.cpp
#include "pipeline/anomaly_pipeline.hpp"
#include "fields/field_classifier.hpp"
#include "core/random.hpp"
#include "fields/field_model.hpp"
#include "fields/field_selector.hpp"
#include "io/tensor_writer.hpp"
#include "io/traffic_reader.hpp"
#include "sequence/sequence_reshaper.hpp"
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace canforge {

namespace {

FieldAnomalyEngine::Config EngineConfig(const GeneratorConfig& config) {
    FieldAnomalyEngine::Config engine_config;
    // Onsets draw from seed + 1, field selection from seed
    engine_config.seed = config.anomaly.seed == 0 ? 0 : config.anomaly.seed + 1;
    engine_config.verbose = config.output.verbose;
    return engine_config;
}

} // anonymous namespace

AnomalyPipeline::AnomalyPipeline(const GeneratorConfig& config, FieldRepository& repository)
    : config_(config),
      repository_(repository),
      rng_(CreateRandomEngine(config.anomaly.seed)),
      engine_(EngineConfig(config)) {}

// ============================================================================
// Pipeline Stages
// ============================================================================

PipelineResult AnomalyPipeline::Run() {
    LogDebug("Loading traffic from " + config_.traffic.csv_path);
    return Run(TrafficReader::LoadFile(config_.traffic.csv_path));
}

PipelineResult AnomalyPipeline::Run(const std::vector<TrafficRecord>& records) {
    std::vector<TrafficRecord> id_records = TrafficReader::FilterById(records, config_.traffic.can_id);
    LogDebug("Kept " + std::to_string(id_records.size()) + " of " +
             std::to_string(records.size()) + " records for ID " + config_.traffic.can_id);

    ReshapeResult reshaped = CreateTestSequences(id_records,
                                                 config_.traffic.sampling_period,
                                                 config_.traffic.duration);

    PipelineResult result;
    result.sequences_shape = reshaped.sequences.Shape();
    result.discarded_words = reshaped.discarded_words;
    LogDebug("Test sequences " + result.sequences_shape.ToString() + ", discarded " +
             std::to_string(result.discarded_words) + " trailing words");

    if (reshaped.sequences.NumSequences() == 0) {
        throw std::runtime_error("ID " + config_.traffic.can_id + " has fewer than " +
                                 std::to_string(reshaped.words_per_sequence) +
                                 " messages; no complete sequence can be built");
    }
    if (reshaped.sequences.WordLength() == 0) {
        throw std::runtime_error("ID " + config_.traffic.can_id +
                                 " carries empty payloads; words have no bits to mutate");
    }

    std::vector<Field> fields = ResolveFields(reshaped.sequences);
    std::vector<AnomalyResult> anomalies = Generate(reshaped.sequences, fields, result);

    const bool write = !config_.output.directory.empty();
    if (write) {
        std::filesystem::create_directories(config_.output.directory);
    }

    for (const auto& anomaly : anomalies) {
        GeneratedAnomaly generated;
        generated.label = anomaly.label;
        generated.shape = anomaly.sequences.Shape();
        if (write) {
            generated.output_path = WriteAnomaly(anomaly, fields);
        }
        result.anomalies.push_back(generated);
    }

    return result;
}

std::vector<Field> AnomalyPipeline::ResolveFields(const SequenceTensor& sequences) {
    const std::string& can_id = config_.traffic.can_id;

    if (auto stored = repository_.Retrieve(can_id)) {
        LogDebug("Loaded " + std::to_string(stored->size()) + " fields for ID " + can_id);
        return *stored;
    }

    if (!config_.fields.classify_if_missing) {
        throw std::runtime_error("No field classification stored for ID " + can_id);
    }

    FieldClassifier::Config classifier_config;
    classifier_config.max_multi_value_cardinality = config_.classifier.max_multi_value_cardinality;
    classifier_config.high_var_threshold = config_.classifier.high_var_threshold;
    classifier_config.mid_var_threshold = config_.classifier.mid_var_threshold;

    FieldClassifier classifier(classifier_config);
    std::vector<Field> fields = classifier.Classify(sequences);

    if (!repository_.Upsert(can_id, fields)) {
        throw std::runtime_error("Failed to store field classification for ID " + can_id);
    }
    LogDebug("Classified and stored " + std::to_string(fields.size()) + " fields for ID " + can_id);
    return fields;
}

std::vector<AnomalyResult> AnomalyPipeline::Generate(const SequenceTensor& sequences,
                                                     const std::vector<Field>& fields,
                                                     PipelineResult& result) {
    std::vector<AnomalyResult> anomalies;

    // Structural anomalies
    anomalies.push_back(CreateInterleaveSequences(sequences));
    anomalies.push_back(CreateDiscontinuitySequences(sequences));
    anomalies.push_back(CreateReverseSequences(sequences));
    anomalies.push_back(CreateDropSequences(sequences, config_.anomaly.drop_length));

    // Field anomalies
    result.target_field = GetTargetField(fields, config_.anomaly.target_category, rng_);
    if (!result.target_field.has_value()) {
        result.field_anomalies_skipped = true;
        LogDebug(std::string("No fields of variability ") +
                 ToString(config_.anomaly.target_category) + " exist for ID " +
                 config_.traffic.can_id);
        return anomalies;
    }

    LogDebug("Target field " + result.target_field->ToString());
    const size_t anomaly_word_count = config_.AnomalyWordCount();
    for (MutationStrategy strategy : config_.anomaly.strategies) {
        anomalies.push_back(engine_.CreateFieldAnomaly(sequences, *result.target_field,
                                                       anomaly_word_count, strategy));
    }

    return anomalies;
}

std::string AnomalyPipeline::WriteAnomaly(const AnomalyResult& anomaly,
                                          const std::vector<Field>& fields) {
    std::filesystem::path path = std::filesystem::path(config_.output.directory) /
                                 (config_.traffic.can_id + "_" + anomaly.label + ".csv");

    const SequenceTensor& tensor = config_.output.strip_constant_bits
        ? RemoveBits(anomaly.sequences, fields)
        : anomaly.sequences;

    if (!SaveTensorCsv(tensor, path.string())) {
        throw std::runtime_error("Failed to write anomaly file: " + path.string());
    }
    LogDebug("Wrote " + anomaly.label + " to " + path.string());
    return path.string();
}

void AnomalyPipeline::LogDebug(const std::string& message) const {
    if (config_.output.verbose) {
        std::cout << "[AnomalyPipeline] " << message << std::endl;
    }
}

} // namespace canforge
