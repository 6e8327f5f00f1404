// File: src/anomaly/field_anomaly_engine.cpp
#include "anomaly/field_anomaly_engine.hpp"
#include "anomaly/donor_rotation.hpp"
#include "core/random.hpp"
#include <iostream>
#include <optional>
#include <stdexcept>
#include <vector>

namespace canforge {

FieldAnomalyEngine::FieldAnomalyEngine() : FieldAnomalyEngine(Config{}) {}

FieldAnomalyEngine::FieldAnomalyEngine(const Config& config)
    : config_(config), rng_(CreateRandomEngine(config.seed)) {}

std::pair<size_t, size_t> FieldAnomalyEngine::OnsetRange(size_t words_per_sequence,
                                                         size_t anomaly_word_count) {
    const size_t earliest = words_per_sequence / 3;
    if (anomaly_word_count + 1 > words_per_sequence ||
        words_per_sequence - anomaly_word_count - 1 < earliest) {
        throw std::invalid_argument("A run of " + std::to_string(anomaly_word_count) +
                                    " anomalous words does not fit after the first third of " +
                                    std::to_string(words_per_sequence) + "-word sequences");
    }
    return {earliest, words_per_sequence - anomaly_word_count - 1};
}

AnomalyResult FieldAnomalyEngine::CreateFieldAnomaly(const SequenceTensor& sequences,
                                                     const Field& field,
                                                     size_t anomaly_word_count,
                                                     MutationStrategy strategy) {
    auto range = OnsetRange(sequences.WordsPerSequence(), anomaly_word_count);
    std::uniform_int_distribution<size_t> pick(range.first, range.second);
    return CreateFieldAnomalyAt(sequences, field, anomaly_word_count, strategy, pick(rng_));
}

AnomalyResult FieldAnomalyEngine::CreateFieldAnomalyAt(const SequenceTensor& sequences,
                                                       const Field& field,
                                                       size_t anomaly_word_count,
                                                       MutationStrategy strategy,
                                                       size_t onset) {
    const size_t num_sequences = sequences.NumSequences();
    const size_t run_words = anomaly_word_count + 1;

    if (onset + run_words > sequences.WordsPerSequence()) {
        throw std::invalid_argument("Anomaly starting at word " + std::to_string(onset) +
                                    " with " + std::to_string(run_words) +
                                    " words exceeds sequences of " +
                                    std::to_string(sequences.WordsPerSequence()) + " words");
    }
    if (!field.FitsIn(sequences.WordLength())) {
        throw std::invalid_argument("Field " + field.ToString() + " does not fit " +
                                    std::to_string(sequences.WordLength()) + "-bit words");
    }

    last_onset_ = onset;
    LogDebug("Anomaly will start at " + std::to_string(onset) +
             ", with length " + std::to_string(anomaly_word_count));
    LogDebug("The data for the chosen field is: Start bit: " + std::to_string(field.start_bit) +
             " | Length: " + std::to_string(field.length));

    SequenceTensor result = sequences;
    std::string label = MutationLabel(strategy);
    if (num_sequences == 0) {
        return {result, label};
    }

    // New session per run: the random constant starts undrawn
    MutationSession session(rng_);

    // Replay donors rotate once per affected word, across all sequences
    std::vector<size_t> donors;
    if (strategy == MutationStrategy::REPLAY) {
        donors = DonorIndices(static_cast<int64_t>(num_sequences / 3),
                              num_sequences * run_words, num_sequences);
    }

    size_t step = 0;
    for (size_t seq = 0; seq < num_sequences; ++seq) {
        for (size_t word = onset; word < onset + run_words; ++word, ++step) {
            std::optional<Word> donor;
            if (strategy == MutationStrategy::REPLAY) {
                donor = sequences.GetWord(donors[step], word);
            }

            MutationResult mutated = ApplyMutation(strategy, field, sequences.GetWord(seq, word),
                                                   donor, session);
            result.SetWord(seq, word, mutated.word);
            label = mutated.label;
        }
    }

    return {result, label};
}

void FieldAnomalyEngine::LogDebug(const std::string& message) const {
    if (config_.verbose) {
        std::cout << "[FieldAnomalyEngine] " << message << std::endl;
    }
}

} // namespace canforge
