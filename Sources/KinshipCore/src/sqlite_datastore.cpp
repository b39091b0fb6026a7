#include "kinship/sqlite_datastore.hpp"
#include "kinship/log.hpp"

namespace kinship {

namespace {

const std::string& text_column(const database::row_t& row, const char* name) {
    auto it = row.find(name);
    if (it == row.end() || !std::holds_alternative<std::string>(it->second)) {
        throw db_error(std::string("Entities row is missing column ") + name);
    }
    return std::get<std::string>(it->second);
}

} // namespace

sqlite_datastore::sqlite_datastore(const std::string& path)
    : db_(std::make_unique<database>(path)) {
    ensure_tables();
    LOG_DEBUG("datastore", "Opened %s", path.c_str());
}

void sqlite_datastore::ensure_tables() {
    if (!db_->table_exists("Entities")) {
        db_->execute(
            "CREATE TABLE Entities ("
            "path TEXT PRIMARY KEY NOT NULL, "
            "kind TEXT NOT NULL, "
            "parentPath TEXT, "
            "rootPath TEXT NOT NULL, "
            "properties TEXT NOT NULL)");
        db_->execute("CREATE INDEX idx_Entities_kind ON Entities(kind)");
        db_->execute("CREATE INDEX idx_Entities_parentPath ON Entities(parentPath)");
    }
    if (!db_->table_exists("IdSequences")) {
        db_->execute(
            "CREATE TABLE IdSequences ("
            "kind TEXT PRIMARY KEY NOT NULL, "
            "nextId INTEGER NOT NULL)");
    }
}

int64_t sqlite_datastore::allocate_id(const std::string& kind) {
    auto rows = db_->query("SELECT nextId FROM IdSequences WHERE kind = ?", {kind});
    int64_t id = 1;
    if (!rows.empty()) {
        id = std::get<int64_t>(rows[0]["nextId"]);
    }
    db_->execute(
        "INSERT INTO IdSequences (kind, nextId) VALUES (?, ?) "
        "ON CONFLICT (kind) DO UPDATE SET nextId = excluded.nextId",
        {kind, id + 1});
    return id;
}

void sqlite_datastore::reserve_id(const std::string& kind, int64_t id) {
    // Application-assigned ids push the sequence past them.
    db_->execute(
        "INSERT INTO IdSequences (kind, nextId) VALUES (?, ?) "
        "ON CONFLICT (kind) DO UPDATE SET nextId = MAX(nextId, excluded.nextId)",
        {kind, id + 1});
}

key sqlite_datastore::put(entity& record) {
    const key& k = record.get_key();
    if (!k.is_valid()) {
        throw kinship_error("Cannot put a record without a kind");
    }

    transaction tx(*db_);

    if (!k.is_complete()) {
        record.set_key(k.with_id(allocate_id(k.kind())));
    } else if (!k.has_name()) {
        reserve_id(k.kind(), k.id());
    }

    const key& final_key = record.get_key();
    column_value_t parent_path = nullptr;
    if (final_key.parent()) {
        parent_path = final_key.parent()->to_path();
    }

    db_->execute(
        "INSERT INTO Entities (path, kind, parentPath, rootPath, properties) "
        "VALUES (?, ?, ?, ?, ?) "
        "ON CONFLICT (path) DO UPDATE SET properties = excluded.properties",
        {final_key.to_path(), final_key.kind(), parent_path, final_key.root().to_path(),
         properties_to_json(record.properties())});

    tx.commit();

    LOG_DEBUG("datastore", "put %s", final_key.to_string().c_str());
    return final_key;
}

entity sqlite_datastore::entity_from_row(const database::row_t& row) {
    return entity(key::from_path(text_column(row, "path")),
                  properties_from_json(text_column(row, "properties")));
}

std::optional<entity> sqlite_datastore::get(const key& k) {
    if (!k.is_complete()) {
        return std::nullopt;
    }
    auto rows = db_->query("SELECT path, properties FROM Entities WHERE path = ?", {k.to_path()});
    if (rows.empty()) {
        return std::nullopt;
    }
    return entity_from_row(rows[0]);
}

void sqlite_datastore::scan(const std::string& kind, const key& ancestor,
                            const std::function<bool(const entity&)>& visit) {
    if (!ancestor.is_complete()) {
        throw kinship_error("Ancestor query needs a complete key, got " + ancestor.to_string());
    }

    std::string path = ancestor.to_path();
    std::string prefix = path + "/";

    std::string sql = "SELECT path, properties FROM Entities WHERE ";
    std::vector<column_value_t> params;
    if (!kind.empty()) {
        sql += "kind = ? AND ";
        params.push_back(kind);
    }
    sql += "(path = ? OR substr(path, 1, length(?)) = ?) ORDER BY path";
    params.push_back(path);
    params.push_back(prefix);
    params.push_back(prefix);

    db_->for_each_row(sql, params, [&](const database::row_t& row) {
        return visit(entity_from_row(row));
    });
}

bool sqlite_datastore::remove(const key& k) {
    if (!k.is_complete()) {
        return false;
    }
    db_->execute("DELETE FROM Entities WHERE path = ?", {k.to_path()});
    bool removed = db_->changes() > 0;
    if (removed) {
        LOG_DEBUG("datastore", "removed %s", k.to_string().c_str());
    }
    return removed;
}

size_t sqlite_datastore::size() {
    auto rows = db_->query("SELECT COUNT(*) AS n FROM Entities");
    return static_cast<size_t>(std::get<int64_t>(rows[0]["n"]));
}

} // namespace kinship
