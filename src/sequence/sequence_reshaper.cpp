// File: src/sequence/sequence_reshaper.cpp
#include "sequence/sequence_reshaper.hpp"
#include <cmath>
#include <stdexcept>

namespace canforge {

size_t WordsPerSequence(double sampling_period, double duration) {
    if (!(sampling_period > 0.0)) {
        throw std::invalid_argument("sampling_period must be greater than 0");
    }
    if (!(duration > 0.0)) {
        throw std::invalid_argument("duration must be greater than 0");
    }

    double words = std::floor(duration / sampling_period);
    if (words < 1.0) {
        throw std::invalid_argument("duration must cover at least one sampling period");
    }
    return static_cast<size_t>(words);
}

ReshapeResult CreateTestSequences(const std::vector<std::string>& binary_words,
                                  double sampling_period,
                                  double duration) {
    ReshapeResult result;
    result.words_per_sequence = WordsPerSequence(sampling_period, duration);

    const size_t word_length = binary_words.empty() ? 0 : binary_words.front().size();

    std::vector<Word> words;
    words.reserve(binary_words.size());
    for (size_t i = 0; i < binary_words.size(); ++i) {
        if (binary_words[i].size() != word_length) {
            throw std::invalid_argument("Word " + std::to_string(i) + " has " +
                                        std::to_string(binary_words[i].size()) +
                                        " bits, expected " + std::to_string(word_length) +
                                        "; all words of an identifier must have equal length");
        }
        words.push_back(BitStringToWord(binary_words[i]));
    }

    const size_t split = words.size() / result.words_per_sequence;
    const size_t kept = split * result.words_per_sequence;
    result.discarded_words = words.size() - kept;
    words.resize(kept);

    result.sequences = SequenceTensor::FromRows(
        words, TensorShape{split, result.words_per_sequence, word_length});
    return result;
}

ReshapeResult CreateTestSequences(const std::vector<TrafficRecord>& records,
                                  double sampling_period,
                                  double duration) {
    std::vector<std::string> binary_words;
    binary_words.reserve(records.size());
    for (const auto& record : records) {
        binary_words.push_back(record.data_bin);
    }
    return CreateTestSequences(binary_words, sampling_period, duration);
}

} // namespace canforge
