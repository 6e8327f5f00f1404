// File: src/fields/field.hpp
#pragma once

#include "core/types.hpp"
#include <cstddef>
#include <string>

namespace canforge {

/// Field - one bit range of a message word
///
/// The range is [start_bit, start_bit + length] inclusive: a field of
/// length L covers L + 1 bits. Every consumer of Field uses this
/// convention, so a single-bit field has length 0.
struct Field {
    /// Number of distinct values observed for the field
    size_t n_values{0};

    /// Bit-level behaviour across observed traffic
    FieldType type{FieldType::CONST};

    /// First bit of the field
    size_t start_bit{0};

    /// Inclusive extent; the field spans length + 1 bits
    size_t length{0};

    /// Variability class used for anomaly targeting
    FieldVariability category{FieldVariability::LOW_VAR};

    // Last bit covered by the field
    size_t EndBit() const { return start_bit + length; }

    // Number of bits covered by the field
    size_t BitCount() const { return length + 1; }

    // True if the whole field lies inside a word of the given width
    bool FitsIn(size_t word_length) const { return EndBit() < word_length; }

    bool operator==(const Field& other) const {
        return n_values == other.n_values && type == other.type &&
               start_bit == other.start_bit && length == other.length &&
               category == other.category;
    }
    bool operator!=(const Field& other) const { return !(*this == other); }

    std::string ToString() const;
};

} // namespace canforge
