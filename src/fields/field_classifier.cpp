// File: src/fields/field_classifier.cpp
#include "fields/field_classifier.hpp"
#include "fields/field_model.hpp"
#include <stdexcept>
#include <unordered_set>

namespace canforge {

FieldClassifier::FieldClassifier(const Config& config) : config_(config) {
    if (config_.high_var_threshold < 0.0f || config_.high_var_threshold > 1.0f) {
        throw std::invalid_argument("high_var_threshold must be in range [0.0, 1.0]");
    }
    if (config_.mid_var_threshold < 0.0f || config_.mid_var_threshold > 1.0f) {
        throw std::invalid_argument("mid_var_threshold must be in range [0.0, 1.0]");
    }
    if (config_.mid_var_threshold > config_.high_var_threshold) {
        throw std::invalid_argument("mid_var_threshold cannot exceed high_var_threshold");
    }
}

std::vector<Field> FieldClassifier::Classify(const SequenceTensor& sequences) const {
    return Classify(sequences.Flatten());
}

std::vector<Field> FieldClassifier::Classify(const std::vector<Word>& words) const {
    if (words.empty()) {
        throw std::invalid_argument("Cannot classify fields without sample words");
    }

    const Word& reference = words.front();
    const size_t word_length = reference.size();
    std::vector<bool> constant = FindConstantBits(reference, words, word_length);

    std::vector<Field> fields;
    size_t run_start = 0;
    for (size_t bit = 1; bit <= word_length; ++bit) {
        // Close the current run at the end of the word or when constancy flips
        if (bit < word_length && constant[bit] == constant[run_start]) {
            continue;
        }

        Field field;
        field.start_bit = run_start;
        field.length = bit - run_start - 1;

        if (constant[run_start]) {
            field.type = FieldType::CONST;
            field.n_values = 1;
            field.category = FieldVariability::LOW_VAR;
        } else {
            std::unordered_set<uint64_t> values;
            for (const auto& word : words) {
                values.insert(ReadFieldValue(field, word));
            }
            field.n_values = values.size();
            field.type = field.n_values <= config_.max_multi_value_cardinality
                ? FieldType::MULTI_VALUE
                : FieldType::SENSOR;
            field.category = Categorize(ChangeRate(field, words));
        }

        fields.push_back(field);
        run_start = bit;
    }

    return fields;
}

float FieldClassifier::ChangeRate(const Field& field, const std::vector<Word>& words) {
    if (words.size() < 2) {
        return 0.0f;
    }

    size_t changes = 0;
    uint64_t previous = ReadFieldValue(field, words.front());
    for (size_t i = 1; i < words.size(); ++i) {
        uint64_t current = ReadFieldValue(field, words[i]);
        if (current != previous) {
            ++changes;
        }
        previous = current;
    }
    return static_cast<float>(changes) / static_cast<float>(words.size() - 1);
}

FieldVariability FieldClassifier::Categorize(float change_rate) const {
    if (change_rate >= config_.high_var_threshold) {
        return FieldVariability::HIGH_VAR;
    }
    if (change_rate >= config_.mid_var_threshold) {
        return FieldVariability::MID_VAR;
    }
    return FieldVariability::LOW_VAR;
}

} // namespace canforge
