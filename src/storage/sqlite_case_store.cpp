// File: src/storage/sqlite_case_store.cpp
#include "storage/sqlite_case_store.hpp"
#include <iostream>
#include <map>
#include <stdexcept>

namespace cinecbr {

namespace {

// case_attributes.value_type
constexpr int kNumberValue = 0;
constexpr int kTextValue = 1;
constexpr int kListValue = 2;

// item_index of the placeholder row of an empty list
constexpr int kEmptyListIndex = -1;

std::string ColumnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    if (!text) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt, column)));
}

} // anonymous namespace

// ============================================================================
// Constructor and Destructor
// ============================================================================

SqliteCaseStore::SqliteCaseStore(const Config& config)
    : config_(config) {

    int rc = sqlite3_open(config_.db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database: " + error);
    }

    InitializeDatabase();
}

SqliteCaseStore::~SqliteCaseStore() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

void SqliteCaseStore::InitializeDatabase() {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_busy_timeout(db_, 5000);

    if (config_.enable_wal) {
        ExecuteSQL("PRAGMA journal_mode=WAL;");
    }
    ExecuteSQL("PRAGMA synchronous=" + config_.synchronous + ";");

    CreateTables();
}

void SqliteCaseStore::CreateTables() {
    const char* create_cases = R"(
        CREATE TABLE IF NOT EXISTS cases (
            position INTEGER PRIMARY KEY,
            title TEXT NOT NULL
        );
    )";

    const char* create_attributes = R"(
        CREATE TABLE IF NOT EXISTS case_attributes (
            position INTEGER NOT NULL,
            name TEXT NOT NULL,
            value_type INTEGER NOT NULL,
            item_index INTEGER NOT NULL,
            text_value TEXT,
            number_value REAL,
            PRIMARY KEY (position, name, item_index)
        );
    )";

    if (!ExecuteSQL(create_cases) || !ExecuteSQL(create_attributes)) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to create case tables");
    }
}

bool SqliteCaseStore::ExecuteSQL(const std::string& sql) const {
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

// ============================================================================
// Store / Load
// ============================================================================

std::optional<size_t> SqliteCaseStore::StoreAll(const CaseBase& base) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!ExecuteSQL("BEGIN TRANSACTION;")) {
        return std::nullopt;
    }

    bool ok = ExecuteSQL("DELETE FROM case_attributes;") && ExecuteSQL("DELETE FROM cases;");

    for (size_t i = 0; ok && i < base.Size(); ++i) {
        ok = InsertCase(i, base[i]);
    }

    if (!ok) {
        ExecuteSQL("ROLLBACK;");
        return std::nullopt;
    }

    if (!ExecuteSQL("COMMIT;")) {
        ExecuteSQL("ROLLBACK;");
        return std::nullopt;
    }

    return base.Size();
}

bool SqliteCaseStore::InsertCase(size_t position, const CaseRecord& record) {
    const char* sql = "INSERT INTO cases (position, title) VALUES (?, ?);";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(position));
    sqlite3_bind_text(stmt, 2, record.GetTitle().c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return false;
    }

    for (const auto& [name, value] : record.GetAttributes()) {
        bool ok = true;

        if (const double* number = std::get_if<double>(&value)) {
            ok = InsertAttributeRow(position, name, kNumberValue, 0, nullptr, number);
        } else if (const std::string* text = std::get_if<std::string>(&value)) {
            ok = InsertAttributeRow(position, name, kTextValue, 0, text, nullptr);
        } else {
            const auto& items = std::get<std::vector<std::string>>(value);
            if (items.empty()) {
                ok = InsertAttributeRow(position, name, kListValue, kEmptyListIndex,
                                        nullptr, nullptr);
            }
            for (size_t i = 0; ok && i < items.size(); ++i) {
                ok = InsertAttributeRow(position, name, kListValue, static_cast<int>(i),
                                        &items[i], nullptr);
            }
        }

        if (!ok) {
            return false;
        }
    }

    return true;
}

bool SqliteCaseStore::InsertAttributeRow(size_t position, const std::string& name,
                                         int value_type, int item_index,
                                         const std::string* text, const double* number) {
    const char* sql =
        "INSERT INTO case_attributes "
        "(position, name, value_type, item_index, text_value, number_value) "
        "VALUES (?, ?, ?, ?, ?, ?);";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(position));
    sqlite3_bind_text(stmt, 2, name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 3, value_type);
    sqlite3_bind_int(stmt, 4, item_index);

    if (text) {
        sqlite3_bind_text(stmt, 5, text->c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, 5);
    }

    if (number) {
        sqlite3_bind_double(stmt, 6, *number);
    } else {
        sqlite3_bind_null(stmt, 6);
    }

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    return rc == SQLITE_DONE;
}

std::optional<CaseBase> SqliteCaseStore::LoadAll() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<CaseRecord> records;
    std::map<sqlite3_int64, size_t> slot_by_position;

    sqlite3_stmt* stmt;
    const char* cases_sql = "SELECT position, title FROM cases ORDER BY position;";
    if (sqlite3_prepare_v2(db_, cases_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        slot_by_position[sqlite3_column_int64(stmt, 0)] = records.size();
        records.emplace_back(ColumnText(stmt, 1));
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return std::nullopt;
    }

    const char* attributes_sql =
        "SELECT position, name, value_type, item_index, text_value, number_value "
        "FROM case_attributes ORDER BY position, name, item_index;";
    if (sqlite3_prepare_v2(db_, attributes_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        auto slot = slot_by_position.find(sqlite3_column_int64(stmt, 0));
        if (slot == slot_by_position.end()) {
            continue;  // Orphaned attribute row
        }

        CaseRecord& record = records[slot->second];
        std::string name = ColumnText(stmt, 1);
        int value_type = sqlite3_column_int(stmt, 2);
        int item_index = sqlite3_column_int(stmt, 3);

        switch (value_type) {
            case kNumberValue:
                record.Set(name, sqlite3_column_double(stmt, 5));
                break;
            case kTextValue:
                record.Set(name, ColumnText(stmt, 4));
                break;
            case kListValue: {
                // Rows arrive ordered by item_index
                std::vector<std::string> list;
                if (const AttributeValue* existing = record.Find(name)) {
                    if (const auto* items = std::get_if<std::vector<std::string>>(existing)) {
                        list = *items;
                    }
                }
                if (item_index != kEmptyListIndex) {
                    list.push_back(ColumnText(stmt, 4));
                }
                record.Set(name, std::move(list));
                break;
            }
            default:
                break;
        }
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return std::nullopt;
    }

    return CaseBase(std::move(records));
}

size_t SqliteCaseStore::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql = "SELECT COUNT(*) FROM cases;";
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

bool SqliteCaseStore::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    return ExecuteSQL("DELETE FROM case_attributes;") && ExecuteSQL("DELETE FROM cases;");
}

} // namespace cinecbr
