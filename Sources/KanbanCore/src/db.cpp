#include "kanban/db.hpp"
#include "kanban/log.hpp"
#include <algorithm>
#include <chrono>
#include <sstream>
#include <thread>
#include <type_traits>

namespace kanban {

namespace {

bool is_file_path(const std::string& path) {
    return !path.empty() && path != ":memory:";
}

/// Prepared statement owned for the length of one call.
class statement {
public:
    statement(sqlite3* db, const std::string& sql) : db_(db), sql_(sql) {
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            std::string error = sqlite3_errmsg(db_);
            LOG_ERROR("db", "Failed to prepare: %s (SQL: %s)", error.c_str(), sql.c_str());
            throw store_error("Failed to prepare statement: " + error);
        }
    }

    ~statement() { sqlite3_finalize(stmt_); }

    statement(const statement&) = delete;
    statement& operator=(const statement&) = delete;

    void bind_all(const std::vector<column_value_t>& params) {
        int index = 1;
        for (const auto& param : params) {
            bind(index++, param);
        }
    }

    /// True while rows remain; throws on anything but ROW or DONE.
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        std::string error = sqlite3_errmsg(db_);
        LOG_ERROR("db", "Step failed: %s (SQL: %s)", error.c_str(), sql_.c_str());
        throw store_error("Statement failed: " + error);
    }

    database::row_t row() const {
        database::row_t values;
        int count = sqlite3_column_count(stmt_);
        for (int i = 0; i < count; ++i) {
            values[sqlite3_column_name(stmt_, i)] = column(i);
        }
        return values;
    }

private:
    void bind(int index, const column_value_t& value) {
        std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                sqlite3_bind_null(stmt_, index);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                sqlite3_bind_int64(stmt_, index, v);
            } else if constexpr (std::is_same_v<T, double>) {
                sqlite3_bind_double(stmt_, index, v);
            } else {
                sqlite3_bind_text(stmt_, index, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
            }
        }, value);
    }

    column_value_t column(int index) const {
        switch (sqlite3_column_type(stmt_, index)) {
            case SQLITE_INTEGER:
                return static_cast<int64_t>(sqlite3_column_int64(stmt_, index));
            case SQLITE_FLOAT:
                return sqlite3_column_double(stmt_, index);
            case SQLITE_TEXT: {
                auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, index));
                if (!text) return std::string();
                return std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt_, index)));
            }
            default:
                return nullptr;
        }
    }

    sqlite3* db_;
    const std::string& sql_;
    sqlite3_stmt* stmt_ = nullptr;
};

std::string column_list(const std::vector<std::string>& columns) {
    std::ostringstream out;
    for (size_t i = 0; i < columns.size(); ++i) {
        out << (i ? ", " : "") << columns[i];
    }
    return out.str();
}

const char* sql_type(column_type type) {
    switch (type) {
        case column_type::integer: return "INTEGER";
        case column_type::real: return "REAL";
        case column_type::text: return "TEXT";
    }
    return "TEXT";
}

} // namespace

// ============================================================================
// Connection
// ============================================================================

database::database(const std::string& path, int busy_timeout_ms) : path_(path) {
    // Serialized mode: the store shares this one connection across threads
    int flags = SQLITE_OPEN_FULLMUTEX | SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("db", "Failed to open database %s: %s", path.c_str(), error.c_str());
        throw store_error("Failed to open database: " + error);
    }

    sqlite3_busy_timeout(db_, busy_timeout_ms);
    if (is_file_path(path)) {
        execute("PRAGMA journal_mode = WAL");
        execute("PRAGMA synchronous = NORMAL");
    }
    LOG_DEBUG("db", "Opened %s", path.c_str());
}

database::~database() {
    if (!db_) return;
    if (is_file_path(path_)) {
        sqlite3_wal_checkpoint_v2(db_, nullptr, SQLITE_CHECKPOINT_TRUNCATE, nullptr, nullptr);
    }
    sqlite3_close(db_);
}

// ============================================================================
// Schema
// ============================================================================

void database::ensure_table(const table_schema& schema) {
    std::ostringstream sql;
    sql << "CREATE TABLE IF NOT EXISTS " << schema.name << " (";
    std::vector<std::string> parts;
    if (schema.autoincrement_id) {
        parts.emplace_back("id INTEGER PRIMARY KEY AUTOINCREMENT");
    }
    for (const auto& col : schema.columns) {
        std::string part = col.name + " " + sql_type(col.type);
        if (!col.nullable) part += " NOT NULL";
        if (col.default_sql) part += " DEFAULT " + *col.default_sql;
        parts.push_back(std::move(part));
    }
    if (!schema.primary_key.empty()) {
        parts.push_back("PRIMARY KEY (" + column_list(schema.primary_key) + ")");
    }
    sql << column_list(parts) << ")";
    execute(sql.str());

    for (const auto& index : schema.indexes) {
        execute(std::string("CREATE ") + (index.unique ? "UNIQUE " : "") + "INDEX IF NOT EXISTS " +
                index.name + " ON " + schema.name + " (" + column_list(index.columns) + ")");
    }
}

int database::user_version() const {
    auto rows = query("PRAGMA user_version");
    return rows.empty() ? 0 : detail::get<int>(rows[0], "user_version");
}

void database::set_user_version(int version) {
    execute("PRAGMA user_version = " + std::to_string(version));
}

// ============================================================================
// Statements
// ============================================================================

int database::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    statement stmt(db_, sql);
    stmt.bind_all(params);
    while (stmt.step()) {
        // PRAGMA journal_mode answers with a row; nothing to collect
    }
    return sqlite3_changes(db_);
}

std::vector<database::row_t> database::query(const std::string& sql,
                                             const std::vector<column_value_t>& params) const {
    statement stmt(db_, sql);
    stmt.bind_all(params);
    std::vector<row_t> rows;
    while (stmt.step()) {
        rows.push_back(stmt.row());
    }
    return rows;
}

int64_t database::insert(const std::string& table,
                         const std::vector<std::pair<std::string, column_value_t>>& values) {
    std::vector<std::string> columns;
    std::vector<std::string> placeholders;
    std::vector<column_value_t> params;
    for (const auto& [name, value] : values) {
        columns.push_back(name);
        placeholders.emplace_back("?");
        params.push_back(value);
    }
    execute("INSERT INTO " + table + " (" + column_list(columns) + ") VALUES (" +
            column_list(placeholders) + ")", params);
    return sqlite3_last_insert_rowid(db_);
}

int database::update_where(const std::string& table,
                           const std::vector<std::pair<std::string, column_value_t>>& values,
                           const std::string& where_sql,
                           const std::vector<column_value_t>& where_params) {
    if (values.empty()) return 0;

    std::vector<std::string> assignments;
    std::vector<column_value_t> params;
    for (const auto& [name, value] : values) {
        assignments.push_back(name + " = ?");
        params.push_back(value);
    }
    params.insert(params.end(), where_params.begin(), where_params.end());
    return execute("UPDATE " + table + " SET " + column_list(assignments) + " WHERE " + where_sql, params);
}

// ============================================================================
// Transactions
// ============================================================================

void database::begin_transaction(bool exclusive) {
    // IMMEDIATE takes the write lock up front, so every read in the unit sees
    // the state its writes are based on
    const char* sql = exclusive ? "BEGIN EXCLUSIVE" : "BEGIN IMMEDIATE";
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, nullptr);

    // Another connection to the same file may hold the write lock
    int backoff_ms = 1;
    int waited_ms = 0;
    while ((rc == SQLITE_BUSY || rc == SQLITE_LOCKED) && waited_ms < 10000) {
        std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
        waited_ms += backoff_ms;
        backoff_ms = std::min(backoff_ms * 2, 200);
        rc = sqlite3_exec(db_, sql, nullptr, nullptr, nullptr);
    }

    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        LOG_ERROR("db", "Failed to begin transaction after %d ms: %s", waited_ms, error.c_str());
        throw store_error("Failed to begin transaction: " + error);
    }
}

void database::commit() {
    execute("COMMIT");
}

void database::rollback() {
    execute("ROLLBACK");
}

transaction::transaction(database& db, bool exclusive) : db_(db) {
    db_.begin_transaction(exclusive);
}

transaction::~transaction() {
    if (committed_) return;
    try {
        db_.rollback();
    } catch (const store_error& e) {
        LOG_ERROR("db", "Rollback failed: %s", e.what());
    }
}

void transaction::commit() {
    db_.commit();
    committed_ = true;
}

} // namespace kanban
