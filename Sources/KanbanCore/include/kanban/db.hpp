#pragma once

#include "types.hpp"
#include "errors.hpp"
#include <sqlite3.h>
#include <string>
#include <unordered_map>
#include <vector>

namespace kanban {

/// One SQLite connection opened in serialized mode. Statements are prepared
/// per call; rows come back as column-name maps.
class database {
public:
    explicit database(const std::string& path, int busy_timeout_ms = 5000);
    ~database();

    database(const database&) = delete;
    database& operator=(const database&) = delete;

    /// CREATE TABLE and its indexes, each IF NOT EXISTS.
    void ensure_table(const table_schema& schema);
    int user_version() const;
    void set_user_version(int version);

    // INSERT INTO <table>; returns the new rowid
    int64_t insert(const std::string& table,
                   const std::vector<std::pair<std::string, column_value_t>>& values);

    // UPDATE <table> SET ... WHERE <where_sql>; returns the number of rows changed
    int update_where(const std::string& table,
                     const std::vector<std::pair<std::string, column_value_t>>& values,
                     const std::string& where_sql,
                     const std::vector<column_value_t>& where_params);

    using row_t = std::unordered_map<std::string, column_value_t>;
    std::vector<row_t> query(const std::string& sql,
                             const std::vector<column_value_t>& params = {}) const;

    // Returns the number of rows changed
    int execute(const std::string& sql,
                const std::vector<column_value_t>& params = {});

    void begin_transaction(bool exclusive = false);
    void commit();
    void rollback();

    const std::string& path() const { return path_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
};

// Rolls back unless committed
class transaction {
public:
    explicit transaction(database& db, bool exclusive = false);
    ~transaction();

    transaction(const transaction&) = delete;
    transaction& operator=(const transaction&) = delete;

    void commit();

private:
    database& db_;
    bool committed_ = false;
};

// Row access helpers
namespace detail {
    inline const column_value_t& column(const database::row_t& row, const std::string& name) {
        static const column_value_t null_value = nullptr;
        auto it = row.find(name);
        return it == row.end() ? null_value : it->second;
    }

    template<typename T>
    T get(const database::row_t& row, const std::string& name) {
        return from_column_value<T>(column(row, name));
    }

    template<typename T>
    std::optional<T> get_optional(const database::row_t& row, const std::string& name) {
        return optional_from_column_value<T>(column(row, name));
    }
} // namespace detail

} // namespace kanban
