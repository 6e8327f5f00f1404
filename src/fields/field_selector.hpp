// File: src/fields/field_selector.hpp
#pragma once

#include "fields/field.hpp"
#include <optional>
#include <random>
#include <vector>

namespace canforge {

/// Pick a random field of the given variability category
///
/// Identifiers without a field of the requested category are common (many
/// have no MID_VAR or LOW_VAR field), so that case is a normal result.
///
/// @param fields Field layout of the target identifier
/// @param category Requested variability category
/// @param rng Random source for the uniform choice among matches
/// @return The chosen field, or std::nullopt if no field matches
std::optional<Field> GetTargetField(const std::vector<Field>& fields,
                                    FieldVariability category,
                                    std::mt19937& rng);

// All fields of the given category, in field-list order
std::vector<Field> FilterByCategory(const std::vector<Field>& fields, FieldVariability category);

} // namespace canforge
