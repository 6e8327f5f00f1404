// File: src/core/types.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace canforge {

// Word: one fixed-width message payload, one element per bit (0 or 1)
using Word = std::vector<uint8_t>;

// FieldType: Bit-level behaviour of a field across observed traffic
enum class FieldType : uint8_t {
    CONST = 0,        // Every bit identical in all observed words
    MULTI_VALUE = 1,  // Few distinct values (flags, modes, counters)
    SENSOR = 2,       // Many distinct values (measurements)
};

// Convert FieldType to string
const char* ToString(FieldType type);

// Parse FieldType from string
FieldType ParseFieldType(const std::string& str);

// FieldVariability: How often a field's value changes, used for targeting
enum class FieldVariability : uint8_t {
    HIGH_VAR = 1,
    MID_VAR = 2,
    LOW_VAR = 3,
};

// Convert FieldVariability to string
const char* ToString(FieldVariability category);

// Parse FieldVariability from string
FieldVariability ParseFieldVariability(const std::string& str);

// MutationStrategy: How a field is rewritten by a field anomaly
enum class MutationStrategy : uint8_t {
    MAX = 0,              // All field bits set to 1
    MIN = 1,              // All field bits set to 0
    RANDOM_CONSTANT = 2,  // One random value reused for the whole run
    RANDOM_VALUE = 3,     // Fresh random value for every word
    REPLAY = 4,           // Bits copied from a donor word
};

// Convert MutationStrategy to its configuration name ("max", "replay", ...)
const char* ToString(MutationStrategy strategy);

// Parse MutationStrategy from its configuration name
MutationStrategy ParseMutationStrategy(const std::string& str);

// All strategies, in declaration order
const std::vector<MutationStrategy>& AllMutationStrategies();

// Convert a binary string ("0110") into a word
// @throws std::invalid_argument on characters other than '0' and '1'
Word BitStringToWord(const std::string& bits);

// Convert a word into a binary string
std::string WordToBitString(const Word& word);

} // namespace canforge
