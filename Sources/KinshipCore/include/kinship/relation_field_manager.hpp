#pragma once

#ifdef __cplusplus

#include "entity.hpp"
#include "object.hpp"
#include "relation_writer.hpp"
#include "schema.hpp"
#include <optional>
#include <vector>

namespace kinship {

class key_registry;

/// A relation field seen while translating an object into its record,
/// applied once the record has its final key.
struct deferred_relation_event {
    const field_metadata* field = nullptr;
    related_value value;
    bool is_insert = true;
};

// ============================================================================
// relation_field_manager - relation writes for one owner record
// ============================================================================
//
// Lives for one insert or update of one object. The owner's record is put
// first, then apply_deferred_relations() writes every queued relation in
// the order it was seen. A true return means the record changed and must be
// put again; if owner_recreated() is also true the record now has a new key
// and the one at previous_key() is stale.

class relation_field_manager {
public:
    relation_field_manager(persistent_object& owner, entity& record,
                           const class_metadata& meta, relation_writer& writer);

    void defer_relation_store(const field_metadata& field, related_value value, bool is_insert);

    /// Throws kinship_error if the owner record has no complete key yet.
    bool apply_deferred_relations(key_registry& registry);

    bool owner_recreated() const { return recreated_; }
    const std::optional<key>& previous_key() const { return previous_key_; }
    size_t pending_events() const { return events_.size(); }

private:
    persistent_object& owner_;
    entity& record_;
    const class_metadata& meta_;
    relation_writer& writer_;

    std::vector<deferred_relation_event> events_;
    bool recreated_ = false;
    std::optional<key> previous_key_;

    bool apply_event(const deferred_relation_event& event, const key& owner_key,
                     key_registry& registry);

    bool store_parent_link(const field_metadata& field, persistent_object* parent,
                           bool is_insert, key_registry& registry);
    bool store_foreign_key(const field_metadata& field, persistent_object* target,
                           key_registry& registry);
    bool store_owned_child(const field_metadata& field, persistent_object* child,
                           const key& owner_key, key_registry& registry);

    key_resolution resolve_related_key(persistent_object& related, key_registry& registry);
    void handle_pending(const field_metadata& field, const pending_flush& pending,
                        key_registry& registry);
    bool consume_parent_marker();
};

} // namespace kinship

#endif // __cplusplus
