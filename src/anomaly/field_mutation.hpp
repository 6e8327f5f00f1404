// File: src/anomaly/field_mutation.hpp
#pragma once

#include "core/types.hpp"
#include "fields/field.hpp"
#include <optional>
#include <random>
#include <string>

namespace canforge {

// Labels of the field anomalies
inline constexpr const char* kMaxValueLabel = "max_value";
inline constexpr const char* kMinValueLabel = "min_value";
inline constexpr const char* kConstantValueLabel = "constant_value";
inline constexpr const char* kRandomValueLabel = "random_value";
inline constexpr const char* kReplayFieldLabel = "replay_field";

// Label produced by a mutation strategy
const char* MutationLabel(MutationStrategy strategy);

/// A mutated word and the name of the mutation
struct MutationResult {
    Word word;
    std::string label;
};

/// MutationSession - state shared by the mutations of one anomaly run
///
/// Holds the random source and the random constant drawn by the first
/// RANDOM_CONSTANT mutation of the run. A new session starts undrawn, so
/// a constant never leaks from one run into another.
class MutationSession {
public:
    explicit MutationSession(std::mt19937& rng) : rng_(rng) {}

    std::mt19937& Rng() { return rng_; }

    /// Random constant of this run, drawn on first use
    /// @param bit_count Number of random bits to draw on first use
    const Word& Constant(size_t bit_count);

    bool HasConstant() const { return constant_.has_value(); }

    /// Draw `bit_count` independent uniform random bits
    Word RandomBits(size_t bit_count);

private:
    std::mt19937& rng_;
    std::optional<Word> constant_;
};

// Set all length + 1 field bits to 1
MutationResult SetFieldToMax(const Field& field, Word word);

// Set all length + 1 field bits to 0
MutationResult SetFieldToMin(const Field& field, Word word);

// Write the run's random constant into the first `length` field bits.
// The constant holds length + 2 random bits; the last field bit is kept.
MutationResult SetFieldToRandomConstant(const Field& field, Word word, MutationSession& session);

// Write length + 1 fresh random bits into the field
MutationResult SetFieldToRandomValue(const Field& field, Word word, MutationSession& session);

// Copy the length + 1 field bits of the donor word
MutationResult ReplayField(const Field& field, Word word, const Word& replayed_word);

/// Apply one mutation strategy to a copy of a word
///
/// Every strategy goes through this single entry point. REPLAY requires a
/// donor word; the other strategies ignore it.
///
/// @param strategy Mutation to apply
/// @param field Target field; bits outside it are never changed
/// @param word Word to mutate (taken by value)
/// @param donor Donor word for REPLAY
/// @param session Per-run random state
/// @throws std::invalid_argument if the field does not fit the word or
///         REPLAY is requested without a donor of the same width
MutationResult ApplyMutation(MutationStrategy strategy,
                             const Field& field,
                             Word word,
                             const std::optional<Word>& donor,
                             MutationSession& session);

} // namespace canforge
