#pragma once

#ifdef __cplusplus

#include "errors.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace kinship {

// SQL-level value bound to or read from a statement
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string
>;

// ============================================================================
// statement - one prepared sqlite3 statement, finalized on destruction
// ============================================================================

class statement {
public:
    statement(sqlite3* conn, const std::string& sql);
    ~statement();

    statement(const statement&) = delete;
    statement& operator=(const statement&) = delete;

    void bind(const std::vector<column_value_t>& params);

    /// True while a row is available, false once the statement is done.
    bool step();

    int column_count() const { return sqlite3_column_count(stmt_); }
    const char* column_name(int i) const { return sqlite3_column_name(stmt_, i); }
    column_value_t column(int i) const;

private:
    sqlite3* conn_;
    sqlite3_stmt* stmt_ = nullptr;
    std::string sql_;
};

// ============================================================================
// database - RAII owner of the sqlite3 connection behind a datastore
// ============================================================================

class database {
public:
    explicit database(const std::string& path);
    ~database();

    database(const database&) = delete;
    database& operator=(const database&) = delete;

    bool table_exists(const std::string& name);

    using row_t = std::unordered_map<std::string, column_value_t>;
    std::vector<row_t> query(const std::string& sql,
                             const std::vector<column_value_t>& params = {});

    /// Streams rows to `visit` until it returns false or the result is exhausted.
    void for_each_row(const std::string& sql,
                      const std::vector<column_value_t>& params,
                      const std::function<bool(const row_t&)>& visit);

    void execute(const std::string& sql,
                 const std::vector<column_value_t>& params = {});

    /// Rows touched by the last statement.
    int changes() const { return sqlite3_changes(conn_); }

    void begin_transaction();
    void commit();
    void rollback();
    bool is_in_transaction() const { return sqlite3_get_autocommit(conn_) == 0; }

    const std::string& path() const { return path_; }

private:
    sqlite3* conn_ = nullptr;
    std::string path_;

    void exec_script(const char* sql, const char* what);
};

// RAII transaction guard. A transaction already open on the connection is
// joined rather than nested; only the outermost guard commits.
class transaction {
public:
    explicit transaction(database& db);
    ~transaction();

    void commit();
    void rollback();

private:
    database& db_;
    bool owner_ = false;
    bool completed_ = false;
};

} // namespace kinship

#endif // __cplusplus
