// File: src/core/types.cpp
#include "core/types.hpp"
#include <stdexcept>

namespace canforge {

// Enum implementations

const char* ToString(FieldType type) {
    switch (type) {
        case FieldType::CONST: return "CONST";
        case FieldType::MULTI_VALUE: return "MULTI-VALUE";
        case FieldType::SENSOR: return "SENSOR";
        default: return "UNKNOWN";
    }
}

FieldType ParseFieldType(const std::string& str) {
    if (str == "CONST") return FieldType::CONST;
    if (str == "MULTI-VALUE" || str == "MULTI_VALUE") return FieldType::MULTI_VALUE;
    if (str == "SENSOR") return FieldType::SENSOR;
    throw std::invalid_argument("Unknown FieldType: " + str);
}

const char* ToString(FieldVariability category) {
    switch (category) {
        case FieldVariability::HIGH_VAR: return "HIGH_VAR";
        case FieldVariability::MID_VAR: return "MID_VAR";
        case FieldVariability::LOW_VAR: return "LOW_VAR";
        default: return "UNKNOWN";
    }
}

FieldVariability ParseFieldVariability(const std::string& str) {
    if (str == "HIGH_VAR") return FieldVariability::HIGH_VAR;
    if (str == "MID_VAR") return FieldVariability::MID_VAR;
    if (str == "LOW_VAR") return FieldVariability::LOW_VAR;
    throw std::invalid_argument("Unknown FieldVariability: " + str);
}

const char* ToString(MutationStrategy strategy) {
    switch (strategy) {
        case MutationStrategy::MAX: return "max";
        case MutationStrategy::MIN: return "min";
        case MutationStrategy::RANDOM_CONSTANT: return "random_constant";
        case MutationStrategy::RANDOM_VALUE: return "random_value";
        case MutationStrategy::REPLAY: return "replay";
        default: return "unknown";
    }
}

MutationStrategy ParseMutationStrategy(const std::string& str) {
    if (str == "max") return MutationStrategy::MAX;
    if (str == "min") return MutationStrategy::MIN;
    if (str == "random_constant") return MutationStrategy::RANDOM_CONSTANT;
    if (str == "random_value") return MutationStrategy::RANDOM_VALUE;
    if (str == "replay") return MutationStrategy::REPLAY;
    throw std::invalid_argument("Unknown MutationStrategy: " + str);
}

const std::vector<MutationStrategy>& AllMutationStrategies() {
    static const std::vector<MutationStrategy> kAll = {
        MutationStrategy::MAX,
        MutationStrategy::MIN,
        MutationStrategy::RANDOM_CONSTANT,
        MutationStrategy::RANDOM_VALUE,
        MutationStrategy::REPLAY,
    };
    return kAll;
}

// Word conversions

Word BitStringToWord(const std::string& bits) {
    Word word;
    word.reserve(bits.size());
    for (size_t i = 0; i < bits.size(); ++i) {
        char c = bits[i];
        if (c != '0' && c != '1') {
            throw std::invalid_argument("Invalid bit character '" + std::string(1, c) +
                                        "' at position " + std::to_string(i));
        }
        word.push_back(static_cast<uint8_t>(c - '0'));
    }
    return word;
}

std::string WordToBitString(const Word& word) {
    std::string bits;
    bits.reserve(word.size());
    for (uint8_t bit : word) {
        bits.push_back(bit ? '1' : '0');
    }
    return bits;
}

} // namespace canforge
