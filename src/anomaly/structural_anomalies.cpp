// File: src/anomaly/structural_anomalies.cpp
#include "anomaly/structural_anomalies.hpp"
#include "anomaly/donor_rotation.hpp"
#include <algorithm>
#include <stdexcept>

namespace canforge {

// ============================================================================
// Interleave
// ============================================================================

AnomalyResult CreateInterleaveSequences(const SequenceTensor& sequences) {
    std::vector<Word> rows = sequences.Flatten();

    const size_t half = rows.size() / 2;
    const size_t second_begin = rows.size() - half;

    std::vector<Word> interleaved;
    interleaved.reserve(rows.size());
    for (size_t i = 0; i < half; ++i) {
        interleaved.push_back(rows[i]);
        interleaved.push_back(rows[second_begin + i]);
    }

    // Odd count: the middle row is in neither half
    if (rows.size() % 2 != 0) {
        interleaved.push_back(rows[half]);
    }

    return {SequenceTensor::FromRows(interleaved, sequences.Shape()), kInterleaveLabel};
}

// ============================================================================
// Discontinuity
// ============================================================================

AnomalyResult CreateDiscontinuitySequences(const SequenceTensor& sequences) {
    SequenceTensor result = sequences;

    const size_t num_sequences = sequences.NumSequences();
    if (num_sequences == 0) {
        return {result, kDiscontinuityLabel};
    }

    const size_t midpoint = sequences.WordsPerSequence() / 2;
    const int64_t first_donor = static_cast<int64_t>(num_sequences / 2) - 1;
    std::vector<size_t> donors = DonorIndices(first_donor, num_sequences, num_sequences);

    for (size_t seq = 0; seq < num_sequences; ++seq) {
        for (size_t word = midpoint; word < sequences.WordsPerSequence(); ++word) {
            result.SetWord(seq, word, sequences.GetWord(donors[seq], word));
        }
    }

    return {result, kDiscontinuityLabel};
}

// ============================================================================
// Reverse
// ============================================================================

AnomalyResult CreateReverseSequences(const SequenceTensor& sequences) {
    const TensorShape& shape = sequences.Shape();

    // Reverse the whole word stream
    std::vector<Word> rows = sequences.Flatten();
    std::reverse(rows.begin(), rows.end());

    // Reshape into sequences, then reverse the sequence order
    std::vector<Word> reordered;
    reordered.reserve(rows.size());
    for (size_t seq = shape.sequences; seq-- > 0;) {
        auto begin = rows.begin() + seq * shape.words;
        reordered.insert(reordered.end(), begin, begin + shape.words);
    }

    return {SequenceTensor::FromRows(reordered, shape), kReverseLabel};
}

// ============================================================================
// Drop
// ============================================================================

AnomalyResult CreateDropSequences(const SequenceTensor& sequences, size_t length) {
    if (length >= sequences.WordsPerSequence()) {
        throw std::invalid_argument("Cannot drop " + std::to_string(length) +
                                    " words from sequences of " +
                                    std::to_string(sequences.WordsPerSequence()) + " words");
    }

    const size_t midpoint = sequences.WordsPerSequence() / 2;
    const size_t half = length / 2;

    std::vector<size_t> words_to_drop;
    for (size_t word = midpoint - half; word < midpoint + half; ++word) {
        words_to_drop.push_back(word);
    }

    return {sequences.DeleteWords(words_to_drop), kDropLabel};
}

} // namespace canforge
