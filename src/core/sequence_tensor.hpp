// File: src/core/sequence_tensor.hpp
#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace canforge {

// TensorShape: (sequences x words per sequence x bits per word)
struct TensorShape {
    size_t sequences{0};
    size_t words{0};
    size_t bits{0};

    size_t TotalWords() const { return sequences * words; }
    size_t TotalBits() const { return sequences * words * bits; }

    bool operator==(const TensorShape& other) const {
        return sequences == other.sequences && words == other.words && bits == other.bits;
    }
    bool operator!=(const TensorShape& other) const { return !(*this == other); }

    std::string ToString() const;
};

/// SequenceTensor - 3-D bit tensor of shape (N, P, W)
///
/// Holds N sequences of P words of W bits each in one contiguous,
/// row-major buffer (sequence-major, then word order, then bit order).
/// Copies are deep; transforms build their result on a copy and never
/// touch the source tensor.
class SequenceTensor {
public:
    // Default constructor creates an empty (0, 0, 0) tensor
    SequenceTensor() = default;

    // Zero-filled tensor of the given shape
    explicit SequenceTensor(const TensorShape& shape);
    SequenceTensor(size_t sequences, size_t words, size_t bits);

    /// Build a tensor from a flat list of equal-width words
    /// @param words Words in sequence-major order, exactly sequences * words_per_sequence
    /// @throws std::invalid_argument on ragged widths or a count mismatch
    static SequenceTensor FromWords(const std::vector<Word>& words,
                                    size_t sequences,
                                    size_t words_per_sequence);

    // Shape accessors
    const TensorShape& Shape() const { return shape_; }
    size_t NumSequences() const { return shape_.sequences; }
    size_t WordsPerSequence() const { return shape_.words; }
    size_t WordLength() const { return shape_.bits; }
    bool IsEmpty() const { return data_.empty(); }

    // Unchecked bit access
    uint8_t operator()(size_t seq, size_t word, size_t bit) const {
        return data_[Offset(seq, word, bit)];
    }
    uint8_t& operator()(size_t seq, size_t word, size_t bit) {
        return data_[Offset(seq, word, bit)];
    }

    // Checked bit access
    // @throws std::out_of_range
    uint8_t At(size_t seq, size_t word, size_t bit) const;

    // Copy of one word
    // @throws std::out_of_range
    Word GetWord(size_t seq, size_t word) const;

    // Overwrite one word
    // @throws std::out_of_range, std::invalid_argument on width mismatch
    void SetWord(size_t seq, size_t word, const Word& value);

    // Copy of one sequence as a list of words
    std::vector<Word> GetSequence(size_t seq) const;

    /// Flatten to a 2-D list of rows (all words of all sequences, sequence-major)
    std::vector<Word> Flatten() const;

    /// Rebuild from rows produced by Flatten (or a permutation of them)
    /// @throws std::invalid_argument if rows do not fill the shape exactly
    static SequenceTensor FromRows(const std::vector<Word>& rows, const TensorShape& shape);

    /// Delete the given bit columns from every word
    /// Duplicate indices are tolerated; out-of-range indices throw std::out_of_range
    SequenceTensor DeleteBits(const std::vector<size_t>& bit_indices) const;

    /// Delete the given word positions from every sequence
    /// Duplicate indices are tolerated; out-of-range indices throw std::out_of_range
    SequenceTensor DeleteWords(const std::vector<size_t>& word_indices) const;

    // Raw buffer access
    const std::vector<uint8_t>& Data() const { return data_; }

    bool operator==(const SequenceTensor& other) const {
        return shape_ == other.shape_ && data_ == other.data_;
    }
    bool operator!=(const SequenceTensor& other) const { return !(*this == other); }

private:
    size_t Offset(size_t seq, size_t word, size_t bit) const {
        return (seq * shape_.words + word) * shape_.bits + bit;
    }

    void CheckIndex(size_t seq, size_t word) const;

    TensorShape shape_;
    std::vector<uint8_t> data_;
};

} // namespace canforge
