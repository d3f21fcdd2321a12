// File: src/storage/sqlite_case_store.hpp
#pragma once

#include "core/case_base.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <sqlite3.h>

namespace cinecbr {

/// Persistent case base storage using SQLite
///
/// Keeps one case base per database file: a `cases` table holding titles
/// by insertion position and a `case_attributes` table holding one row per
/// scalar value or list item. Storing replaces the previous content in a
/// single transaction, so a failed import leaves the old base intact.
class SqliteCaseStore {
public:
    /// Configuration for SqliteCaseStore
    struct Config {
        /// Path to the SQLite database file
        std::string db_path;

        /// Enable Write-Ahead Logging
        bool enable_wal{true};

        /// Synchronous mode: FULL, NORMAL, or OFF
        std::string synchronous{"NORMAL"};
    };

    /// Open (or create) the database
    /// @throws std::runtime_error if database cannot be opened
    explicit SqliteCaseStore(const Config& config);

    /// Destructor - closes database connection
    ~SqliteCaseStore();

    SqliteCaseStore(const SqliteCaseStore&) = delete;
    SqliteCaseStore& operator=(const SqliteCaseStore&) = delete;

    /// Replace the stored case base
    /// @return Number of cases stored, or std::nullopt if the transaction failed
    std::optional<size_t> StoreAll(const CaseBase& base);

    /// Load the stored case base in insertion order
    /// @return Case base, or std::nullopt on a database error
    std::optional<CaseBase> LoadAll() const;

    /// Number of stored cases
    size_t Count() const;

    /// Remove all cases
    bool Clear();

    const std::string& GetPath() const { return config_.db_path; }

private:
    Config config_;
    sqlite3* db_{nullptr};
    mutable std::mutex mutex_;

    void InitializeDatabase();
    void CreateTables();

    /// Execute a SQL statement
    /// @return true if successful, false otherwise
    bool ExecuteSQL(const std::string& sql) const;

    bool InsertCase(size_t position, const CaseRecord& record);
    bool InsertAttributeRow(size_t position, const std::string& name, int value_type,
                            int item_index, const std::string* text, const double* number);
};

} // namespace cinecbr
