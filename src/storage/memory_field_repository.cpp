// File: src/storage/memory_field_repository.cpp
#include "storage/memory_field_repository.hpp"
#include <algorithm>
#include <mutex>

namespace canforge {

bool MemoryFieldRepository::Store(const std::string& can_id, const std::vector<Field>& fields) {
    if (fields.empty()) {
        return false;
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return layouts_.emplace(can_id, fields).second;
}

std::optional<std::vector<Field>> MemoryFieldRepository::Retrieve(const std::string& can_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = layouts_.find(can_id);
    if (it == layouts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryFieldRepository::Upsert(const std::string& can_id, const std::vector<Field>& fields) {
    if (fields.empty()) {
        return false;
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    layouts_[can_id] = fields;
    return true;
}

bool MemoryFieldRepository::Remove(const std::string& can_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return layouts_.erase(can_id) > 0;
}

bool MemoryFieldRepository::Exists(const std::string& can_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return layouts_.find(can_id) != layouts_.end();
}

std::vector<std::string> MemoryFieldRepository::ListIds() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<std::string> ids;
    ids.reserve(layouts_.size());
    for (const auto& [id, _] : layouts_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

size_t MemoryFieldRepository::Count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return layouts_.size();
}

void MemoryFieldRepository::Clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    layouts_.clear();
}

} // namespace canforge
