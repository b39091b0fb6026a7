#include "kinship/db.hpp"
#include "kinship/log.hpp"
#include <type_traits>

namespace kinship {

// ============================================================================
// statement
// ============================================================================

statement::statement(sqlite3* conn, const std::string& sql) : conn_(conn), sql_(sql) {
    if (sqlite3_prepare_v2(conn_, sql_.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
        std::string error = sqlite3_errmsg(conn_);
        sqlite3_finalize(stmt_);
        LOG_ERROR("db", "prepare failed: %s (SQL: %s)", error.c_str(), sql_.c_str());
        throw db_error("Cannot prepare " + sql_ + ": " + error);
    }
}

statement::~statement() {
    sqlite3_finalize(stmt_);
}

void statement::bind(const std::vector<column_value_t>& params) {
    int index = 1;
    for (const auto& param : params) {
        int rc = std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                return sqlite3_bind_null(stmt_, index);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return sqlite3_bind_int64(stmt_, index, v);
            } else if constexpr (std::is_same_v<T, double>) {
                return sqlite3_bind_double(stmt_, index, v);
            } else {
                return sqlite3_bind_text(stmt_, index, v.c_str(), static_cast<int>(v.size()),
                                         SQLITE_TRANSIENT);
            }
        }, param);
        if (rc != SQLITE_OK) {
            throw db_error("Cannot bind parameter " + std::to_string(index) + " of " + sql_);
        }
        ++index;
    }
}

bool statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;

    std::string error = sqlite3_errmsg(conn_);
    LOG_ERROR("db", "step failed: %s (SQL: %s)", error.c_str(), sql_.c_str());
    throw db_error("Statement failed: " + error + " (SQL: " + sql_ + ")");
}

column_value_t statement::column(int i) const {
    switch (sqlite3_column_type(stmt_, i)) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt_, i));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt_, i);
        case SQLITE_TEXT:
        case SQLITE_BLOB: {
            const auto* bytes = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, i));
            return std::string(bytes ? bytes : "", static_cast<size_t>(sqlite3_column_bytes(stmt_, i)));
        }
        default:
            return nullptr;
    }
}

// ============================================================================
// database
// ============================================================================

database::database(const std::string& path) : path_(path) {
    int flags = SQLITE_OPEN_FULLMUTEX | SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    if (sqlite3_open_v2(path.c_str(), &conn_, flags, nullptr) != SQLITE_OK) {
        std::string error = conn_ ? sqlite3_errmsg(conn_) : "out of memory";
        sqlite3_close(conn_);
        conn_ = nullptr;
        LOG_ERROR("db", "Failed to open datastore %s: %s", path.c_str(), error.c_str());
        throw db_error("Failed to open datastore " + path + ": " + error);
    }

    if (path != ":memory:") {
        exec_script("PRAGMA journal_mode = WAL", "journal mode");
    }
    exec_script("PRAGMA temp_store = MEMORY", "temp store");
    sqlite3_busy_timeout(conn_, 5000);
}

database::~database() {
    sqlite3_close(conn_);
}

void database::exec_script(const char* sql, const char* what) {
    char* errmsg = nullptr;
    if (sqlite3_exec(conn_, sql, nullptr, nullptr, &errmsg) != SQLITE_OK) {
        std::string error = errmsg ? errmsg : "unknown error";
        sqlite3_free(errmsg);
        LOG_ERROR("db", "%s failed: %s", what, error.c_str());
        throw db_error(std::string(what) + " failed: " + error);
    }
}

bool database::table_exists(const std::string& name) {
    statement stmt(conn_, "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?");
    stmt.bind({name});
    return stmt.step();
}

void database::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    statement stmt(conn_, sql);
    stmt.bind(params);
    while (stmt.step()) {
    }
}

void database::for_each_row(const std::string& sql,
                            const std::vector<column_value_t>& params,
                            const std::function<bool(const row_t&)>& visit) {
    statement stmt(conn_, sql);
    stmt.bind(params);
    const int columns = stmt.column_count();
    while (stmt.step()) {
        row_t row;
        for (int i = 0; i < columns; ++i) {
            row[stmt.column_name(i)] = stmt.column(i);
        }
        if (!visit(row)) break;
    }
}

std::vector<database::row_t> database::query(const std::string& sql,
                                             const std::vector<column_value_t>& params) {
    std::vector<row_t> rows;
    for_each_row(sql, params, [&](const row_t& row) {
        rows.push_back(row);
        return true;
    });
    return rows;
}

// Takes the write lock up front.
void database::begin_transaction() {
    exec_script("BEGIN IMMEDIATE", "begin transaction");
}

void database::commit() {
    exec_script("COMMIT", "commit");
}

void database::rollback() {
    exec_script("ROLLBACK", "rollback");
}

// ============================================================================
// transaction
// ============================================================================

transaction::transaction(database& db) : db_(db) {
    if (!db_.is_in_transaction()) {
        db_.begin_transaction();
        owner_ = true;
    }
}

transaction::~transaction() {
    if (owner_ && !completed_) {
        try {
            db_.rollback();
        } catch (const db_error& e) {
            LOG_ERROR("db", "Rollback failed: %s", e.what());
        }
    }
}

void transaction::commit() {
    if (owner_) {
        db_.commit();
    }
    completed_ = true;
}

void transaction::rollback() {
    if (owner_) {
        db_.rollback();
    }
    completed_ = true;
}

} // namespace kinship
