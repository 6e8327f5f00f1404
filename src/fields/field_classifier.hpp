// File: src/fields/field_classifier.hpp
#pragma once

#include "core/sequence_tensor.hpp"
#include "fields/field.hpp"
#include <vector>

namespace canforge {

/// FieldClassifier - derives the field layout of one identifier from traffic
///
/// Bits are first split into constant and varying positions with
/// FindConstantBits. Each maximal run of constant bits becomes a CONST
/// field, each maximal run of varying bits becomes one data field. A data
/// field is MULTI_VALUE when it shows few distinct values, SENSOR otherwise,
/// and its variability category follows the fraction of consecutive word
/// pairs in which its value changes.
class FieldClassifier {
public:
    /// Configuration for field classification
    struct Config {
        /// Largest distinct-value count still classified as MULTI_VALUE
        size_t max_multi_value_cardinality{16};

        /// Change rate at or above which a field is HIGH_VAR
        float high_var_threshold{0.5f};

        /// Change rate at or above which a field is MID_VAR
        float mid_var_threshold{0.1f};
    };

    /// Constructor
    /// @param config Classification thresholds
    /// @throws std::invalid_argument on thresholds outside [0, 1] or
    ///         mid_var_threshold > high_var_threshold
    explicit FieldClassifier(const Config& config);

    /// Classify the bits of a tensor of traffic for one identifier
    /// @param sequences Sample traffic; words are read in sequence-major order
    /// @return Fields ordered by start bit, covering every bit exactly once
    /// @throws std::invalid_argument if the tensor holds no words
    std::vector<Field> Classify(const SequenceTensor& sequences) const;

    /// Classify a flat list of equal-width words
    std::vector<Field> Classify(const std::vector<Word>& words) const;

    /// Fraction of consecutive word pairs whose field value differs
    static float ChangeRate(const Field& field, const std::vector<Word>& words);

    /// Get current configuration
    const Config& GetConfig() const { return config_; }

private:
    Config config_;

    FieldVariability Categorize(float change_rate) const;
};

} // namespace canforge
