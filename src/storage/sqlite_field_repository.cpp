// File: src/storage/sqlite_field_repository.cpp
#include "storage/sqlite_field_repository.hpp"
#include <iostream>
#include <stdexcept>

namespace canforge {

// ============================================================================
// Constructor and Destructor
// ============================================================================

SqliteFieldRepository::SqliteFieldRepository(const Config& config)
    : config_(config) {

    int rc = sqlite3_open(config_.db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open field database: " + error);
    }

    try {
        InitializeDatabase();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteFieldRepository::~SqliteFieldRepository() {
    if (db_) {
        if (sqlite3_close_v2(db_) != SQLITE_OK) {
            std::cerr << "Failed to close field database: " << sqlite3_errmsg(db_) << std::endl;
        }
        db_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

void SqliteFieldRepository::InitializeDatabase() {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_busy_timeout(db_, 5000);

    if (config_.enable_wal && !ExecuteSQL("PRAGMA journal_mode=WAL;")) {
        throw std::runtime_error("Failed to enable WAL on field database");
    }
    if (!ExecuteSQL("PRAGMA synchronous=" + config_.synchronous + ";")) {
        throw std::runtime_error("Invalid synchronous mode: " + config_.synchronous);
    }

    std::string create_table = R"(
        CREATE TABLE IF NOT EXISTS fields (
            can_id TEXT NOT NULL,
            field_index INTEGER NOT NULL,
            start_bit INTEGER NOT NULL,
            length INTEGER NOT NULL,
            type INTEGER NOT NULL,
            category INTEGER NOT NULL,
            n_values INTEGER NOT NULL,
            PRIMARY KEY (can_id, field_index)
        );
    )";

    if (!ExecuteSQL(create_table)) {
        throw std::runtime_error("Failed to create fields table");
    }
}

bool SqliteFieldRepository::ExecuteSQL(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        if (error_msg) {
            std::cerr << "SQLite error: " << error_msg << std::endl;
            sqlite3_free(error_msg);
        }
        return false;
    }

    return true;
}

template<typename Body>
bool SqliteFieldRepository::InTransaction(Body body) {
    if (!ExecuteSQL("BEGIN TRANSACTION;")) {
        return false;
    }
    if (!body() || !ExecuteSQL("COMMIT;")) {
        if (!ExecuteSQL("ROLLBACK;")) {
            std::cerr << "Failed to roll back field database transaction" << std::endl;
        }
        return false;
    }
    return true;
}

// ============================================================================
// Unlocked Helpers
// ============================================================================

bool SqliteFieldRepository::ExistsUnlocked(const std::string& can_id) const {
    const char* sql = "SELECT 1 FROM fields WHERE can_id = ? LIMIT 1;";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    sqlite3_bind_text(stmt, 1, can_id.c_str(), -1, SQLITE_TRANSIENT);
    bool exists = sqlite3_step(stmt) == SQLITE_ROW;
    sqlite3_finalize(stmt);

    return exists;
}

bool SqliteFieldRepository::DeleteUnlocked(const std::string& can_id) {
    const char* sql = "DELETE FROM fields WHERE can_id = ?;";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    sqlite3_bind_text(stmt, 1, can_id.c_str(), -1, SQLITE_TRANSIENT);
    bool done = sqlite3_step(stmt) == SQLITE_DONE;
    sqlite3_finalize(stmt);

    return done;
}

bool SqliteFieldRepository::InsertFieldsUnlocked(const std::string& can_id,
                                                 const std::vector<Field>& fields) {
    const char* sql =
        "INSERT INTO fields (can_id, field_index, start_bit, length, type, category, n_values) "
        "VALUES (?, ?, ?, ?, ?, ?, ?);";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    bool ok = true;
    for (size_t i = 0; i < fields.size() && ok; ++i) {
        const Field& field = fields[i];
        sqlite3_bind_text(stmt, 1, can_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(i));
        sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(field.start_bit));
        sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(field.length));
        sqlite3_bind_int(stmt, 5, static_cast<int>(field.type));
        sqlite3_bind_int(stmt, 6, static_cast<int>(field.category));
        sqlite3_bind_int64(stmt, 7, static_cast<sqlite3_int64>(field.n_values));

        ok = sqlite3_step(stmt) == SQLITE_DONE;
        sqlite3_reset(stmt);
    }

    sqlite3_finalize(stmt);
    return ok;
}

// ============================================================================
// FieldRepository Operations
// ============================================================================

bool SqliteFieldRepository::Store(const std::string& can_id, const std::vector<Field>& fields) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (fields.empty() || ExistsUnlocked(can_id)) {
        return false;
    }
    return InTransaction([&]() { return InsertFieldsUnlocked(can_id, fields); });
}

std::optional<std::vector<Field>> SqliteFieldRepository::Retrieve(const std::string& can_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql =
        "SELECT start_bit, length, type, category, n_values FROM fields "
        "WHERE can_id = ? ORDER BY field_index;";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, can_id.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<Field> fields;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        Field field;
        field.start_bit = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
        field.length = static_cast<size_t>(sqlite3_column_int64(stmt, 1));
        field.type = static_cast<FieldType>(sqlite3_column_int(stmt, 2));
        field.category = static_cast<FieldVariability>(sqlite3_column_int(stmt, 3));
        field.n_values = static_cast<size_t>(sqlite3_column_int64(stmt, 4));
        fields.push_back(field);
    }

    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE || fields.empty()) {
        return std::nullopt;
    }
    return fields;
}

bool SqliteFieldRepository::Upsert(const std::string& can_id, const std::vector<Field>& fields) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (fields.empty()) {
        return false;
    }
    return InTransaction([&]() {
        return DeleteUnlocked(can_id) && InsertFieldsUnlocked(can_id, fields);
    });
}

bool SqliteFieldRepository::Remove(const std::string& can_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!DeleteUnlocked(can_id)) {
        return false;
    }
    return sqlite3_changes(db_) > 0;
}

bool SqliteFieldRepository::Exists(const std::string& can_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ExistsUnlocked(can_id);
}

std::vector<std::string> SqliteFieldRepository::ListIds() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> ids;

    const char* sql = "SELECT DISTINCT can_id FROM fields ORDER BY can_id;";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return ids;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const unsigned char* text = sqlite3_column_text(stmt, 0);
        ids.emplace_back(reinterpret_cast<const char*>(text));
    }

    sqlite3_finalize(stmt);
    return ids;
}

size_t SqliteFieldRepository::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql = "SELECT COUNT(DISTINCT can_id) FROM fields;";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }

    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }

    sqlite3_finalize(stmt);
    return count;
}

void SqliteFieldRepository::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!ExecuteSQL("DELETE FROM fields;")) {
        throw std::runtime_error("Failed to clear fields table");
    }
}

} // namespace canforge
