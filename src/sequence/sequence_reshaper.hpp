// File: src/sequence/sequence_reshaper.hpp
#pragma once

#include "core/sequence_tensor.hpp"
#include "core/traffic_record.hpp"
#include <string>
#include <vector>

namespace canforge {

/// Result of windowing a word stream into sequences
struct ReshapeResult {
    /// Tensor of shape (split, words_per_sequence, word_length)
    SequenceTensor sequences;

    /// Words per window, floor(duration / sampling_period)
    size_t words_per_sequence{0};

    /// Trailing words that did not fill a complete window
    size_t discarded_words{0};
};

/// Number of words in one window of the given duration
/// @throws std::invalid_argument unless both values are positive and the
///         window holds at least one word
size_t WordsPerSequence(double sampling_period, double duration);

/// Cut an ordered stream of binary words into non-overlapping windows
///
/// Every window covers `duration` seconds of traffic sent every
/// `sampling_period` seconds. The stream is truncated to a whole number of
/// windows; the size of the dropped tail is reported in the result.
///
/// @param binary_words Words as '0'/'1' strings, in arrival order
/// @param sampling_period Message period in seconds (e.g. 0.01)
/// @param duration Window length in seconds (e.g. 3)
/// @throws std::invalid_argument on words of different lengths, non-binary
///         characters or invalid timing parameters
ReshapeResult CreateTestSequences(const std::vector<std::string>& binary_words,
                                  double sampling_period,
                                  double duration);

// Same as above, reading the binary payload of each record
ReshapeResult CreateTestSequences(const std::vector<TrafficRecord>& records,
                                  double sampling_period,
                                  double duration);

} // namespace canforge
