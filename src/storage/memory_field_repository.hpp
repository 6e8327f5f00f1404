// File: src/storage/memory_field_repository.hpp
#pragma once

#include "storage/field_repository.hpp"
#include <shared_mutex>
#include <unordered_map>

namespace canforge {

/// In-memory field repository backed by a hash map
///
/// Thread-safe with shared_mutex for concurrent read access.
class MemoryFieldRepository : public FieldRepository {
public:
    MemoryFieldRepository() = default;
    ~MemoryFieldRepository() override = default;

    bool Store(const std::string& can_id, const std::vector<Field>& fields) override;
    std::optional<std::vector<Field>> Retrieve(const std::string& can_id) const override;
    bool Upsert(const std::string& can_id, const std::vector<Field>& fields) override;
    bool Remove(const std::string& can_id) override;
    bool Exists(const std::string& can_id) const override;
    std::vector<std::string> ListIds() const override;
    size_t Count() const override;
    void Clear() override;

private:
    std::unordered_map<std::string, std::vector<Field>> layouts_;
    mutable std::shared_mutex mutex_;
};

} // namespace canforge
