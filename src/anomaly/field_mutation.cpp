// File: src/anomaly/field_mutation.cpp
#include "anomaly/field_mutation.hpp"
#include <stdexcept>
#include <utility>

namespace canforge {

const char* MutationLabel(MutationStrategy strategy) {
    switch (strategy) {
        case MutationStrategy::MAX: return kMaxValueLabel;
        case MutationStrategy::MIN: return kMinValueLabel;
        case MutationStrategy::RANDOM_CONSTANT: return kConstantValueLabel;
        case MutationStrategy::RANDOM_VALUE: return kRandomValueLabel;
        case MutationStrategy::REPLAY: return kReplayFieldLabel;
        default: return "unknown";
    }
}

// ============================================================================
// MutationSession
// ============================================================================

Word MutationSession::RandomBits(size_t bit_count) {
    std::uniform_int_distribution<int> bit(0, 1);
    Word bits(bit_count);
    for (auto& b : bits) {
        b = static_cast<uint8_t>(bit(rng_));
    }
    return bits;
}

const Word& MutationSession::Constant(size_t bit_count) {
    if (!constant_.has_value()) {
        constant_ = RandomBits(bit_count);
    }
    return *constant_;
}

// ============================================================================
// Strategies
// ============================================================================

namespace {

void CheckFieldFits(const Field& field, const Word& word) {
    if (!field.FitsIn(word.size())) {
        throw std::invalid_argument("Field " + field.ToString() + " does not fit a " +
                                    std::to_string(word.size()) + "-bit word");
    }
}

} // anonymous namespace

MutationResult SetFieldToMax(const Field& field, Word word) {
    CheckFieldFits(field, word);
    for (size_t i = 0; i < field.length + 1; ++i) {
        word[field.start_bit + i] = 1;
    }
    return {std::move(word), kMaxValueLabel};
}

MutationResult SetFieldToMin(const Field& field, Word word) {
    CheckFieldFits(field, word);
    for (size_t i = 0; i < field.length + 1; ++i) {
        word[field.start_bit + i] = 0;
    }
    return {std::move(word), kMinValueLabel};
}

MutationResult SetFieldToRandomConstant(const Field& field, Word word, MutationSession& session) {
    CheckFieldFits(field, word);
    const Word& constant = session.Constant(field.length + 2);

    // A constant drawn for a wider field still covers this one
    for (size_t i = 0; i < field.length && i < constant.size(); ++i) {
        word[field.start_bit + i] = constant[i];
    }
    return {std::move(word), kConstantValueLabel};
}

MutationResult SetFieldToRandomValue(const Field& field, Word word, MutationSession& session) {
    CheckFieldFits(field, word);
    Word random_word = session.RandomBits(field.length + 2);

    for (size_t i = 0; i < field.length + 1; ++i) {
        word[field.start_bit + i] = random_word[i];
    }
    return {std::move(word), kRandomValueLabel};
}

MutationResult ReplayField(const Field& field, Word word, const Word& replayed_word) {
    CheckFieldFits(field, word);
    if (replayed_word.size() != word.size()) {
        throw std::invalid_argument("Replayed word has " + std::to_string(replayed_word.size()) +
                                    " bits, target word has " + std::to_string(word.size()));
    }

    for (size_t i = 0; i < field.length + 1; ++i) {
        word[field.start_bit + i] = replayed_word[field.start_bit + i];
    }
    return {std::move(word), kReplayFieldLabel};
}

MutationResult ApplyMutation(MutationStrategy strategy,
                             const Field& field,
                             Word word,
                             const std::optional<Word>& donor,
                             MutationSession& session) {
    switch (strategy) {
        case MutationStrategy::MAX:
            return SetFieldToMax(field, std::move(word));
        case MutationStrategy::MIN:
            return SetFieldToMin(field, std::move(word));
        case MutationStrategy::RANDOM_CONSTANT:
            return SetFieldToRandomConstant(field, std::move(word), session);
        case MutationStrategy::RANDOM_VALUE:
            return SetFieldToRandomValue(field, std::move(word), session);
        case MutationStrategy::REPLAY:
            if (!donor.has_value()) {
                throw std::invalid_argument("Replay mutation requires a donor word");
            }
            return ReplayField(field, std::move(word), *donor);
        default:
            throw std::invalid_argument("Unsupported mutation strategy");
    }
}

} // namespace canforge
