#pragma once

#ifdef __cplusplus

#include "configuration.hpp"
#include "datastore.hpp"
#include "key_registry.hpp"
#include "mapping_callbacks.hpp"
#include "object.hpp"
#include "relation_fetch_resolver.hpp"
#include "relation_field_manager.hpp"
#include "relation_writer.hpp"
#include "schema.hpp"
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>

namespace kinship {

// ============================================================================
// persistence_manager - object graph <-> datastore
// ============================================================================
//
// Usage:
//   kinship::persistence_manager pm(kinship::configuration("app.db"));
//   pm.register_class(kinship::class_builder("Book")
//                         .scalar("title")
//                         .relation("chapter", "Chapter", kinship::relation_type::one_to_one_uni)
//                         .build());
//   auto book = kinship::persistent_object::make("Book");
//   book->set("title", std::string("Dune"));
//   auto k = pm.make_persistent(book);

class persistence_manager : public relation_writer, public object_materializer {
public:
    persistence_manager(std::shared_ptr<datastore> store, schema_registry& schema,
                        configuration config = {});

    /// Opens a sqlite_datastore at config.path with the process-wide registry.
    explicit persistence_manager(const configuration& config = {});

    const class_metadata& register_class(class_metadata meta);

    /// Inserts or updates `obj` and everything reachable through its owned
    /// relations. Returns the object's key.
    key make_persistent(const object_ptr& obj);

    /// Throws object_not_found_error if nothing is stored under `k`.
    object_ptr get_object(const key& k);
    object_ptr get_object(const std::string& kind, int64_t id);
    object_ptr get_object(const std::string& kind, const std::string& name);
    /// nullptr if nothing is stored under `k`.
    object_ptr find_object(const key& k);

    /// Loads a relation field from the store and keeps the result on `obj`.
    related_value fetch_relation_field(persistent_object& obj, const std::string& field);

    void delete_persistent(const object_ptr& obj);

    /// Forgets every cached object; the next get reads from the store.
    void evict_all() { object_cache_.clear(); }

    /// Cache entries whose object is still referenced outside the manager.
    size_t cached_objects();

    const configuration& config() const { return config_; }

    // relation_writer
    key_resolution persist_owned(persistent_object& child, const key& parent_key,
                                 key_registry& registry) override;
    key_resolution persist_unowned(persistent_object& target, key_registry& registry) override;
    void remove_owned(const key& k) override;
    datastore& store() override { return *store_; }
    const schema_registry& schema() const override { return schema_; }
    callback_registry& callbacks() override { return callbacks_; }

    // object_materializer
    object_ptr materialize(const entity& record) override;
    object_ptr load(const key& k) override;
    related_value load_derived(const entity& owner, const field_metadata& field) override;

private:
    std::shared_ptr<datastore> store_;
    schema_registry& schema_;
    configuration config_;
    callback_registry callbacks_;
    std::set<std::string> callbacks_installed_;
    // Identity map by key path. Entries do not own their objects; expired
    // ones are dropped on lookup and by periodic sweeps.
    std::unordered_map<std::string, std::weak_ptr<persistent_object>> object_cache_;
    size_t sweep_at_ = 64;

    const class_metadata& metadata_for(const std::string& kind);

    key insert_object(persistent_object& obj, const std::optional<key>& forced_parent,
                      key_registry& registry);
    key update_object(persistent_object& obj, key_registry& registry);

    std::optional<key> establish_parent(persistent_object& obj, const class_metadata& meta,
                                        const std::optional<key>& forced_parent,
                                        key_registry& registry);
    void validate_update(persistent_object& obj, const class_metadata& meta, const key& k,
                         key_registry& registry);

    void store_record(persistent_object& obj, entity& record, key_registry& registry);
    void write_again(persistent_object& obj, entity& record,
                     const relation_field_manager& relations, key_registry& registry);
    void relocate_descendants(const key& old_root, const key& new_root, key_registry& registry);
    void process_pending_patches(persistent_object& related, key_registry& registry);

    void remember(persistent_object& obj);
    object_ptr cached(const std::string& path);
    void sweep_cache();
};

} // namespace kinship

#endif // __cplusplus
