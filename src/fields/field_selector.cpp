// File: src/fields/field_selector.cpp
#include "fields/field_selector.hpp"

namespace canforge {

std::vector<Field> FilterByCategory(const std::vector<Field>& fields, FieldVariability category) {
    std::vector<Field> matches;
    for (const auto& field : fields) {
        if (field.category == category) {
            matches.push_back(field);
        }
    }
    return matches;
}

std::optional<Field> GetTargetField(const std::vector<Field>& fields,
                                    FieldVariability category,
                                    std::mt19937& rng) {
    std::vector<Field> matches = FilterByCategory(fields, category);
    if (matches.empty()) {
        return std::nullopt;
    }

    std::uniform_int_distribution<size_t> pick(0, matches.size() - 1);
    return matches[pick(rng)];
}

} // namespace canforge
