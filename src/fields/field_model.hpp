// File: src/fields/field_model.hpp
#pragma once

#include "core/sequence_tensor.hpp"
#include "fields/field.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace canforge {

/// Build the constant-bit mask of a word sample
///
/// Starts from an all-true mask of word_length entries and clears an entry
/// as soon as any word of the sample differs from the reference word at
/// that bit. A cleared entry is never restored within the scan.
///
/// @param reference_word Word every sample word is compared against
/// @param sample Sample words; std::nullopt entries are skipped
/// @param word_length Length of the mask
/// @return mask[b] is true if bit b never differs from the reference
/// @throws std::invalid_argument if the reference is shorter than word_length
///         or a sample word is longer than the reference
std::vector<bool> FindConstantBits(const Word& reference_word,
                                   const std::vector<std::optional<Word>>& sample,
                                   size_t word_length);

// Overload for a sample with no absent entries
std::vector<bool> FindConstantBits(const Word& reference_word,
                                   const std::vector<Word>& sample,
                                   size_t word_length);

/// Expand every CONST field into its inclusive bit range
/// @return Bit indices in field-list order; overlapping fields repeat indices
std::vector<size_t> GetConstantFields(const std::vector<Field>& fields);

/// Delete all constant bits from a tensor along the bit axis
/// @return Tensor of shape (N, P, W - distinct constant indices)
/// @throws std::out_of_range if a CONST field lies outside the word
SequenceTensor RemoveBits(const SequenceTensor& sequences, const std::vector<Field>& fields);

/// Integer values of the non-CONST fields of one word
/// @param fields Field layout of the word's identifier
/// @param data_bin Binary-string representation of the word
/// @return One unsigned value per non-CONST field, in field-list order
/// @throws std::out_of_range if a field does not fit the string
/// @throws std::invalid_argument on non-binary characters
std::vector<uint64_t> GetFieldValues(const std::vector<Field>& fields, const std::string& data_bin);

/// Unsigned value of one field read from a word
/// @throws std::out_of_range if the field does not fit the word
uint64_t ReadFieldValue(const Field& field, const Word& word);

} // namespace canforge
