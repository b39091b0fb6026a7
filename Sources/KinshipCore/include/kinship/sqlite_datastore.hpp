#pragma once

#ifdef __cplusplus

#include "datastore.hpp"
#include "db.hpp"
#include <memory>
#include <string>

namespace kinship {

// ============================================================================
// sqlite_datastore - datastore over a single SQLite database
// ============================================================================
//
// Records live in one table keyed by their canonical key path, so an
// ancestor-scoped query is a prefix range on the primary key.

class sqlite_datastore : public datastore {
public:
    explicit sqlite_datastore(const std::string& path = ":memory:");

    key put(entity& record) override;
    std::optional<entity> get(const key& k) override;
    void scan(const std::string& kind, const key& ancestor,
              const std::function<bool(const entity&)>& visit) override;
    bool remove(const key& k) override;

    /// Total number of stored records.
    size_t size();

    database& db() { return *db_; }

private:
    std::unique_ptr<database> db_;

    void ensure_tables();
    int64_t allocate_id(const std::string& kind);
    void reserve_id(const std::string& kind, int64_t id);
    static entity entity_from_row(const database::row_t& row);
};

} // namespace kinship

#endif // __cplusplus
