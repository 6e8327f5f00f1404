// File: examples/generate_anomalies.cpp
//
// Anomaly generation example using canforge.
// Demonstrates:
// - Building traffic records for one identifier
// - Classifying the payload into fields
// - Running the pipeline with an in-memory field store
// - Applying a single field mutation and inspecting the result

#include "anomaly/field_anomaly_engine.hpp"
#include "fields/field_classifier.hpp"
#include "io/traffic_reader.hpp"
#include "pipeline/anomaly_pipeline.hpp"
#include "sequence/sequence_reshaper.hpp"
#include "storage/memory_field_repository.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

using namespace canforge;

/// Generate traffic for one identifier: a fixed header byte, a rolling
/// counter, a slowly changing sensor byte and a zero padding byte
std::vector<TrafficRecord> GenerateTraffic(const std::string& can_id, size_t messages,
                                           double period) {
    std::vector<TrafficRecord> records;
    records.reserve(messages);

    for (size_t i = 0; i < messages; ++i) {
        unsigned counter = static_cast<unsigned>(i % 16);
        unsigned sensor = static_cast<unsigned>(0x40 + (i / 25) % 8);

        std::ostringstream hex;
        hex << std::hex << std::uppercase << std::setfill('0')
            << "A5" << std::setw(2) << counter << std::setw(2) << sensor << "00";

        TrafficRecord record;
        record.timestamp = static_cast<double>(i) * period;
        record.id = can_id;
        record.dlc = 4;
        record.data_hex = hex.str();
        record.data_bin = TrafficReader::HexToBinary(record.data_hex, record.dlc);
        records.push_back(record);
    }

    return records;
}

int main() {
    std::cout << "=== canforge Anomaly Generation Example ===\n\n";

    const double period = 0.01;
    const double duration = 1.0;

    // Step 1: Synthetic traffic
    std::cout << "Step 1: Generating traffic...\n";
    std::vector<TrafficRecord> records = GenerateTraffic("1A0", 650, period);
    std::cout << "  ✓ " << records.size() << " messages for ID 1A0\n\n";

    // Step 2: Test sequences and field layout
    std::cout << "Step 2: Building test sequences and classifying fields...\n";
    ReshapeResult reshaped = CreateTestSequences(records, period, duration);
    std::cout << "  Shape " << reshaped.sequences.Shape().ToString()
              << ", " << reshaped.discarded_words << " words discarded\n";

    FieldClassifier classifier(FieldClassifier::Config{});
    std::vector<Field> fields = classifier.Classify(reshaped.sequences);
    for (const auto& field : fields) {
        std::cout << "  " << field.ToString() << "\n";
    }
    std::cout << "\n";

    // Step 3: Full pipeline, nothing written to disk
    std::cout << "Step 3: Running the anomaly pipeline...\n";
    GeneratorConfig config = GeneratorConfig::Default();
    config.traffic.can_id = "1A0";
    config.traffic.sampling_period = period;
    config.traffic.duration = duration;
    config.anomaly.anomaly_duration = 0.2;
    config.anomaly.seed = 7;
    config.output.directory.clear();

    MemoryFieldRepository repository;
    AnomalyPipeline pipeline(config, repository);
    PipelineResult result = pipeline.Run(records);

    for (const auto& anomaly : result.anomalies) {
        std::cout << "  " << std::left << std::setw(16) << anomaly.label
                  << anomaly.shape.ToString() << "\n";
    }
    if (result.field_anomalies_skipped) {
        std::cout << "  (no HIGH_VAR field, field anomalies skipped)\n";
    }
    std::cout << "\n";

    // Step 4: One mutation up close
    if (result.target_field) {
        std::cout << "Step 4: Forcing " << result.target_field->ToString() << " to its maximum...\n";

        FieldAnomalyEngine::Config engine_config;
        engine_config.seed = 7;
        FieldAnomalyEngine engine(engine_config);
        AnomalyResult maxed = engine.CreateFieldAnomaly(reshaped.sequences, *result.target_field,
                                                        20, MutationStrategy::MAX);

        size_t onset = engine.LastOnset();
        for (size_t word = onset - 2; word < onset + 3; ++word) {
            std::cout << "  word " << std::setw(3) << word << ": "
                      << WordToBitString(reshaped.sequences.GetWord(0, word)) << " -> "
                      << WordToBitString(maxed.sequences.GetWord(0, word)) << "\n";
        }
    }

    std::cout << "\n=== Example Complete ===\n";
    return 0;
}
