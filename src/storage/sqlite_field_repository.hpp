// File: src/storage/sqlite_field_repository.hpp
#pragma once

#include "storage/field_repository.hpp"
#include <mutex>
#include <sqlite3.h>
#include <string>

namespace canforge {

/// Persistent field repository using SQLite
///
/// Stores one row per field:
///   fields(can_id, field_index, start_bit, length, type, category, n_values)
/// keyed by (can_id, field_index). The layout of an identifier is written
/// and replaced inside a single transaction, so readers never observe a
/// partially written layout.
class SqliteFieldRepository : public FieldRepository {
public:
    /// Configuration for SqliteFieldRepository
    struct Config {
        /// Path to the SQLite database file (":memory:" for a private in-memory database)
        std::string db_path;

        /// Enable Write-Ahead Logging
        bool enable_wal{true};

        /// Synchronous mode: FULL, NORMAL, or OFF
        std::string synchronous{"NORMAL"};
    };

    /// Open (and create if needed) the field database
    /// @param config Configuration options
    /// @throws std::runtime_error if the database cannot be opened or initialized
    explicit SqliteFieldRepository(const Config& config);

    /// Destructor - closes database connection
    ~SqliteFieldRepository() override;

    // Prevent copying (SQLite connection is not copyable)
    SqliteFieldRepository(const SqliteFieldRepository&) = delete;
    SqliteFieldRepository& operator=(const SqliteFieldRepository&) = delete;

    // ========================================================================
    // FieldRepository Interface Implementation
    // ========================================================================

    bool Store(const std::string& can_id, const std::vector<Field>& fields) override;
    std::optional<std::vector<Field>> Retrieve(const std::string& can_id) const override;
    bool Upsert(const std::string& can_id, const std::vector<Field>& fields) override;
    bool Remove(const std::string& can_id) override;
    bool Exists(const std::string& can_id) const override;
    std::vector<std::string> ListIds() const override;
    size_t Count() const override;
    void Clear() override;

private:
    Config config_;

    // SQLite database handle
    sqlite3* db_{nullptr};

    mutable std::mutex mutex_;

    /// Apply pragmas and create the schema
    void InitializeDatabase();

    /// Execute a SQL statement without results
    /// @return true if successful, false otherwise
    bool ExecuteSQL(const std::string& sql);

    bool ExistsUnlocked(const std::string& can_id) const;
    bool DeleteUnlocked(const std::string& can_id);

    /// Insert every field of a layout; caller owns the transaction
    bool InsertFieldsUnlocked(const std::string& can_id, const std::vector<Field>& fields);

    /// Run `body` inside a transaction, rolling back when it returns false
    template<typename Body>
    bool InTransaction(Body body);
};

} // namespace canforge
