// File: src/anomaly/field_anomaly_engine.hpp
#pragma once

#include "anomaly/field_mutation.hpp"
#include "anomaly/structural_anomalies.hpp"
#include "core/sequence_tensor.hpp"
#include "fields/field.hpp"
#include <cstdint>
#include <random>
#include <string>
#include <utility>

namespace canforge {

/// FieldAnomalyEngine - corrupts one field over a contiguous run of words
///
/// One onset word index is drawn per call from
/// [P / 3, P - anomaly_word_count - 1] and shared by every sequence, so the
/// anomaly never starts in the first third of a sequence and always ends
/// before the last word. Words onset .. onset + anomaly_word_count
/// (inclusive) of every sequence are rewritten by the chosen strategy
/// inside the target field only.
class FieldAnomalyEngine {
public:
    /// Configuration for the engine
    struct Config {
        /// Seed of the random source; 0 seeds from std::random_device
        uint32_t seed{0};

        /// Print onset and field geometry of every run
        bool verbose{false};
    };

    FieldAnomalyEngine();
    explicit FieldAnomalyEngine(const Config& config);

    /// Create a field anomaly at a random onset
    ///
    /// @param sequences Source tensor, left unchanged
    /// @param field Target field
    /// @param anomaly_word_count Run length; anomaly_word_count + 1 words change
    /// @param strategy Mutation applied to every affected word
    /// @return Tensor of the input shape and the strategy label
    /// @throws std::invalid_argument if the onset range is empty or the
    ///         field does not fit the word length
    AnomalyResult CreateFieldAnomaly(const SequenceTensor& sequences,
                                     const Field& field,
                                     size_t anomaly_word_count,
                                     MutationStrategy strategy);

    /// Create a field anomaly at a given onset
    /// @throws std::invalid_argument if the run does not fit the sequences
    AnomalyResult CreateFieldAnomalyAt(const SequenceTensor& sequences,
                                       const Field& field,
                                       size_t anomaly_word_count,
                                       MutationStrategy strategy,
                                       size_t onset);

    /// Inclusive range of valid onsets for sequences of `words_per_sequence`
    /// @throws std::invalid_argument if the range is empty
    static std::pair<size_t, size_t> OnsetRange(size_t words_per_sequence,
                                                size_t anomaly_word_count);

    /// Onset chosen by the last call
    size_t LastOnset() const { return last_onset_; }

    /// Get current configuration
    const Config& GetConfig() const { return config_; }

    /// Enable or disable verbose output
    void SetVerbose(bool verbose) { config_.verbose = verbose; }

private:
    Config config_;
    std::mt19937 rng_;
    size_t last_onset_{0};

    void LogDebug(const std::string& message) const;
};

} // namespace canforge
