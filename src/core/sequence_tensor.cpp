// File: src/core/sequence_tensor.cpp
#include "core/sequence_tensor.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace canforge {

std::string TensorShape::ToString() const {
    std::ostringstream oss;
    oss << "(" << sequences << ", " << words << ", " << bits << ")";
    return oss.str();
}

// ============================================================================
// Construction
// ============================================================================

SequenceTensor::SequenceTensor(const TensorShape& shape)
    : shape_(shape), data_(shape.TotalBits(), 0) {}

SequenceTensor::SequenceTensor(size_t sequences, size_t words, size_t bits)
    : SequenceTensor(TensorShape{sequences, words, bits}) {}

SequenceTensor SequenceTensor::FromWords(const std::vector<Word>& words,
                                         size_t sequences,
                                         size_t words_per_sequence) {
    size_t width = words.empty() ? 0 : words.front().size();
    return FromRows(words, TensorShape{sequences, words_per_sequence, width});
}

SequenceTensor SequenceTensor::FromRows(const std::vector<Word>& rows, const TensorShape& shape) {
    if (rows.size() != shape.TotalWords()) {
        throw std::invalid_argument("Cannot reshape " + std::to_string(rows.size()) +
                                    " words into shape " + shape.ToString());
    }

    SequenceTensor tensor(shape);
    auto out = tensor.data_.begin();
    for (size_t i = 0; i < rows.size(); ++i) {
        if (rows[i].size() != shape.bits) {
            throw std::invalid_argument("Word " + std::to_string(i) + " has " +
                                        std::to_string(rows[i].size()) + " bits, expected " +
                                        std::to_string(shape.bits));
        }
        out = std::copy(rows[i].begin(), rows[i].end(), out);
    }
    return tensor;
}

// ============================================================================
// Element Access
// ============================================================================

void SequenceTensor::CheckIndex(size_t seq, size_t word) const {
    if (seq >= shape_.sequences || word >= shape_.words) {
        throw std::out_of_range("Word index (" + std::to_string(seq) + ", " +
                                std::to_string(word) + ") outside shape " + shape_.ToString());
    }
}

uint8_t SequenceTensor::At(size_t seq, size_t word, size_t bit) const {
    CheckIndex(seq, word);
    if (bit >= shape_.bits) {
        throw std::out_of_range("Bit index " + std::to_string(bit) +
                                " outside shape " + shape_.ToString());
    }
    return data_[Offset(seq, word, bit)];
}

Word SequenceTensor::GetWord(size_t seq, size_t word) const {
    CheckIndex(seq, word);
    auto begin = data_.begin() + Offset(seq, word, 0);
    return Word(begin, begin + shape_.bits);
}

void SequenceTensor::SetWord(size_t seq, size_t word, const Word& value) {
    CheckIndex(seq, word);
    if (value.size() != shape_.bits) {
        throw std::invalid_argument("Word has " + std::to_string(value.size()) +
                                    " bits, tensor expects " + std::to_string(shape_.bits));
    }
    std::copy(value.begin(), value.end(), data_.begin() + Offset(seq, word, 0));
}

std::vector<Word> SequenceTensor::GetSequence(size_t seq) const {
    std::vector<Word> words;
    words.reserve(shape_.words);
    for (size_t w = 0; w < shape_.words; ++w) {
        words.push_back(GetWord(seq, w));
    }
    return words;
}

std::vector<Word> SequenceTensor::Flatten() const {
    std::vector<Word> rows;
    rows.reserve(shape_.TotalWords());
    for (size_t i = 0; i < shape_.TotalWords(); ++i) {
        auto begin = data_.begin() + i * shape_.bits;
        rows.emplace_back(begin, begin + shape_.bits);
    }
    return rows;
}

// ============================================================================
// Axis Deletion
// ============================================================================

namespace {

// Boolean keep-mask for an axis of the given size, clearing every listed index
std::vector<bool> BuildKeepMask(size_t axis_size, const std::vector<size_t>& indices,
                                const char* axis_name) {
    std::vector<bool> keep(axis_size, true);
    for (size_t idx : indices) {
        if (idx >= axis_size) {
            throw std::out_of_range(std::string(axis_name) + " index " + std::to_string(idx) +
                                    " out of range for size " + std::to_string(axis_size));
        }
        keep[idx] = false;
    }
    return keep;
}

} // anonymous namespace

SequenceTensor SequenceTensor::DeleteBits(const std::vector<size_t>& bit_indices) const {
    std::vector<bool> keep = BuildKeepMask(shape_.bits, bit_indices, "Bit");
    size_t kept = static_cast<size_t>(std::count(keep.begin(), keep.end(), true));

    SequenceTensor result(shape_.sequences, shape_.words, kept);
    auto out = result.data_.begin();
    for (size_t row = 0; row < shape_.TotalWords(); ++row) {
        for (size_t b = 0; b < shape_.bits; ++b) {
            if (keep[b]) {
                *out++ = data_[row * shape_.bits + b];
            }
        }
    }
    return result;
}

SequenceTensor SequenceTensor::DeleteWords(const std::vector<size_t>& word_indices) const {
    std::vector<bool> keep = BuildKeepMask(shape_.words, word_indices, "Word");
    size_t kept = static_cast<size_t>(std::count(keep.begin(), keep.end(), true));

    SequenceTensor result(shape_.sequences, kept, shape_.bits);
    for (size_t s = 0; s < shape_.sequences; ++s) {
        size_t out_word = 0;
        for (size_t w = 0; w < shape_.words; ++w) {
            if (!keep[w]) {
                continue;
            }
            auto begin = data_.begin() + Offset(s, w, 0);
            std::copy(begin, begin + shape_.bits,
                      result.data_.begin() + result.Offset(s, out_word, 0));
            ++out_word;
        }
    }
    return result;
}

} // namespace canforge
