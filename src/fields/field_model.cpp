// File: src/fields/field_model.cpp
#include "fields/field_model.hpp"
#include <stdexcept>

namespace canforge {

// ============================================================================
// Constant Bit Detection
// ============================================================================

namespace {

void ClearDifferingBits(const Word& reference_word, const Word& word, std::vector<bool>& mask) {
    if (word.size() > mask.size()) {
        throw std::invalid_argument("Sample word has " + std::to_string(word.size()) +
                                    " bits, mask covers " + std::to_string(mask.size()));
    }
    for (size_t bit = 0; bit < word.size(); ++bit) {
        if (reference_word[bit] != word[bit]) {
            mask[bit] = false;
        }
    }
}

void CheckReference(const Word& reference_word, size_t word_length) {
    if (reference_word.size() < word_length) {
        throw std::invalid_argument("Reference word has " + std::to_string(reference_word.size()) +
                                    " bits, expected at least " + std::to_string(word_length));
    }
}

} // anonymous namespace

std::vector<bool> FindConstantBits(const Word& reference_word,
                                   const std::vector<std::optional<Word>>& sample,
                                   size_t word_length) {
    CheckReference(reference_word, word_length);

    std::vector<bool> mask(word_length, true);
    for (const auto& word : sample) {
        if (word.has_value()) {
            ClearDifferingBits(reference_word, *word, mask);
        }
    }
    return mask;
}

std::vector<bool> FindConstantBits(const Word& reference_word,
                                   const std::vector<Word>& sample,
                                   size_t word_length) {
    CheckReference(reference_word, word_length);

    std::vector<bool> mask(word_length, true);
    for (const auto& word : sample) {
        ClearDifferingBits(reference_word, word, mask);
    }
    return mask;
}

// ============================================================================
// Constant Field Removal
// ============================================================================

std::vector<size_t> GetConstantFields(const std::vector<Field>& fields) {
    std::vector<size_t> indices;
    for (const auto& field : fields) {
        if (field.type == FieldType::CONST) {
            for (size_t bit = field.start_bit; bit <= field.EndBit(); ++bit) {
                indices.push_back(bit);
            }
        }
    }
    return indices;
}

SequenceTensor RemoveBits(const SequenceTensor& sequences, const std::vector<Field>& fields) {
    return sequences.DeleteBits(GetConstantFields(fields));
}

// ============================================================================
// Field Values
// ============================================================================

uint64_t ReadFieldValue(const Field& field, const Word& word) {
    if (!field.FitsIn(word.size())) {
        throw std::out_of_range("Field ending at bit " + std::to_string(field.EndBit()) +
                                " does not fit a " + std::to_string(word.size()) + "-bit word");
    }
    if (field.BitCount() > 64) {
        throw std::invalid_argument("Field of " + std::to_string(field.BitCount()) +
                                    " bits does not fit a 64-bit value");
    }

    // Most significant bit first
    uint64_t value = 0;
    for (size_t bit = field.start_bit; bit <= field.EndBit(); ++bit) {
        value = (value << 1) | word[bit];
    }
    return value;
}

std::vector<uint64_t> GetFieldValues(const std::vector<Field>& fields, const std::string& data_bin) {
    Word word = BitStringToWord(data_bin);

    std::vector<uint64_t> values;
    for (const auto& field : fields) {
        if (field.type != FieldType::CONST) {
            values.push_back(ReadFieldValue(field, word));
        }
    }
    return values;
}

} // namespace canforge
