// File: src/anomaly/structural_anomalies.hpp
#pragma once

#include "core/sequence_tensor.hpp"
#include <string>

namespace canforge {

/// A generated anomalous tensor and the name of the anomaly
struct AnomalyResult {
    SequenceTensor sequences;
    std::string label;
};

// Labels of the structural anomalies
inline constexpr const char* kInterleaveLabel = "interleave";
inline constexpr const char* kDiscontinuityLabel = "discontinuity";
inline constexpr const char* kReverseLabel = "reverse";
inline constexpr const char* kDropLabel = "drop";

// Default number of words removed by the drop anomaly
inline constexpr size_t kDefaultDropLength = 10;

/// Interleave the first and second half of the word stream
///
/// All words are flattened in sequence-major order and split by count into
/// halves x and y, then rebuilt as x1, y1, x2, y2, ... and reshaped to the
/// input shape. With an odd word count the middle word belongs to neither
/// half and is placed last.
///
/// @return Tensor of the input shape, label "interleave"
AnomalyResult CreateInterleaveSequences(const SequenceTensor& sequences);

/// Replace the second half of every sequence with that of another sequence
///
/// Sequence i receives words [P/2, P) of donor sequence N/2 - 1 + i,
/// wrapping to 0 at N. The first half of every sequence is untouched.
///
/// @return Tensor of the input shape, label "discontinuity"
AnomalyResult CreateDiscontinuitySequences(const SequenceTensor& sequences);

/// Reverse the flattened word stream, then reverse the sequence order
///
/// @return Tensor of the input shape, label "reverse"
AnomalyResult CreateReverseSequences(const SequenceTensor& sequences);

/// Remove a block of words around the middle of every sequence
///
/// Removes word indices [P/2 - length/2, P/2 + length/2) with integer
/// division, so an odd length removes length - 1 words.
///
/// @param length Number of words to remove, must be less than P
/// @return Tensor of shape (N, P - 2 * (length / 2), W), label "drop"
/// @throws std::invalid_argument if length >= P
AnomalyResult CreateDropSequences(const SequenceTensor& sequences,
                                  size_t length = kDefaultDropLength);

} // namespace canforge
