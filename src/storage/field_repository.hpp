// File: src/storage/field_repository.hpp
#pragma once

#include "fields/field.hpp"
#include <optional>
#include <string>
#include <vector>

namespace canforge {

/// Abstract interface for field classification storage
///
/// Maps a message identifier (e.g. "0DE") to the field layout classified
/// for it. Layouts are written once per identifier and read by every
/// anomaly generation run on that identifier.
///
/// Thread Safety: All methods must be thread-safe.
class FieldRepository {
public:
    virtual ~FieldRepository() = default;

    /// Store the field layout of an identifier
    /// @param can_id Message identifier
    /// @param fields Field layout, in field order
    /// @return true if stored, false if the layout is empty or the identifier
    ///         already has one
    virtual bool Store(const std::string& can_id, const std::vector<Field>& fields) = 0;

    /// Retrieve the field layout of an identifier
    /// @return The layout if present, std::nullopt otherwise
    virtual std::optional<std::vector<Field>> Retrieve(const std::string& can_id) const = 0;

    /// Replace the field layout of an identifier, storing it if absent
    /// @return false if the layout is empty or the write failed
    virtual bool Upsert(const std::string& can_id, const std::vector<Field>& fields) = 0;

    /// Remove the layout of an identifier
    /// @return true if removed, false if not found
    virtual bool Remove(const std::string& can_id) = 0;

    /// Check whether an identifier has a layout
    virtual bool Exists(const std::string& can_id) const = 0;

    /// All identifiers with a stored layout, sorted
    virtual std::vector<std::string> ListIds() const = 0;

    /// Number of identifiers with a stored layout
    virtual size_t Count() const = 0;

    /// Remove all layouts
    virtual void Clear() = 0;
};

} // namespace canforge
