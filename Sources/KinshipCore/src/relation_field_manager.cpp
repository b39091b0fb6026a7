#include "kinship/relation_field_manager.hpp"
#include "kinship/errors.hpp"
#include "kinship/inline_mapping.hpp"
#include "kinship/key_registry.hpp"
#include "kinship/log.hpp"
#include "kinship/mapping_callbacks.hpp"
#include "kinship/parent_key_resolver.hpp"

namespace kinship {

namespace {

persistent_object* single_object(const related_value& value) {
    if (const auto* obj = std::get_if<object_ptr>(&value)) {
        return obj->get();
    }
    return nullptr;
}

} // namespace

relation_field_manager::relation_field_manager(persistent_object& owner, entity& record,
                                               const class_metadata& meta, relation_writer& writer)
    : owner_(owner), record_(record), meta_(meta), writer_(writer) {}

void relation_field_manager::defer_relation_store(const field_metadata& field, related_value value,
                                                  bool is_insert) {
    if (meta_.field(field.name) != &field) {
        throw kinship_error("Field " + field.name + " does not belong to " + meta_.kind);
    }
    events_.push_back({&field, std::move(value), is_insert});
}

bool relation_field_manager::apply_deferred_relations(key_registry& registry) {
    const key owner_key = record_.get_key();
    if (!owner_key.is_complete()) {
        throw kinship_error("Relations of " + owner_.kind() +
                            " can only be stored after the owner has a complete key");
    }

    // The queue is emptied before anything runs so that a failing event
    // leaves nothing behind to replay.
    auto events = std::move(events_);
    events_.clear();

    bool modified = false;
    for (const auto& event : events) {
        modified |= apply_event(event, owner_key, registry);
    }

    if (consume_parent_marker()) {
        modified = true;
    }

    if (registry.parent_needs_update(owner_key)) {
        registry.clear_modified_parent(owner_key);
        modified = true;
    }

    if (modified) {
        LOG_DEBUG("relations", "%s needs to be written again", owner_key.to_string().c_str());
    }
    return modified;
}

bool relation_field_manager::apply_event(const deferred_relation_event& event, const key& owner_key,
                                         key_registry& registry) {
    const field_metadata& field = *event.field;
    persistent_object* related = single_object(event.value);

    switch (field.mapping) {
        case mapping_kind::embedded:
        case mapping_kind::serialized:
            return write_inline(record_, field, related);

        case mapping_kind::persistent_reference:
        case mapping_kind::interface:
            switch (field.role) {
                case relation_role::parent_key_provider:
                    return store_parent_link(field, related, event.is_insert, registry);
                case relation_role::foreign_key_provider:
                    return store_foreign_key(field, related, registry);
                case relation_role::derived:
                    return store_owned_child(field, related, owner_key, registry);
                case relation_role::none:
                    break;
            }
            throw kinship_error("Reference field " + meta_.kind + "." + field.name + " has no relation role");

        case mapping_kind::plain: {
            mapping_callbacks* callbacks = writer_.callbacks().find(meta_.kind, field.name);
            if (!callbacks) {
                LOG_DEBUG("relations", "No callbacks for %s.%s", meta_.kind.c_str(), field.name.c_str());
                return false;
            }
            mapping_context ctx{owner_, owner_key, field, event.value, writer_, registry};
            return event.is_insert ? callbacks->post_insert(ctx) : callbacks->post_update(ctx);
        }
    }
    return false;
}

bool relation_field_manager::store_parent_link(const field_metadata& field, persistent_object* parent,
                                               bool is_insert, key_registry& registry) {
    // Clearing the parent of a stored record cannot move it out of its group.
    if (!parent) {
        return false;
    }

    auto resolution = resolve_related_key(*parent, registry);
    if (auto* pending = std::get_if<pending_flush>(&resolution)) {
        handle_pending(field, *pending, registry);
        return false;
    }
    const key& parent_key = std::get<key>(resolution);

    if (const key* ancestor = record_.parent()) {
        if (*ancestor == parent_key) {
            return false;
        }
        throw child_with_wrong_parent_error(parent_key, record_.get_key());
    }
    if (!is_insert) {
        throw child_without_parent_error(parent_key, record_.get_key());
    }

    // First write happened before the parent had a key.
    record_.set_property(parent_key_marker, parent_key);
    return true;
}

bool relation_field_manager::store_foreign_key(const field_metadata& field, persistent_object* target,
                                               key_registry& registry) {
    if (!target) {
        return record_.remove_property(field.key_property());
    }

    auto resolution = resolve_related_key(*target, registry);
    if (auto* pending = std::get_if<pending_flush>(&resolution)) {
        handle_pending(field, *pending, registry);
        return false;
    }
    return record_.set_property(field.key_property(), std::get<key>(resolution));
}

bool relation_field_manager::store_owned_child(const field_metadata& field, persistent_object* child,
                                               const key& owner_key, key_registry& registry) {
    if (!child) {
        return record_.remove_property(field.key_property());
    }

    check_for_parent_switch(child, owner_key, registry);

    auto resolution = writer_.persist_owned(*child, owner_key, registry);
    if (auto* pending = std::get_if<pending_flush>(&resolution)) {
        handle_pending(field, *pending, registry);
        return false;
    }

    if (record_.set_property(field.key_property(), std::get<key>(resolution))) {
        registry.register_modified_parent(owner_key);
    }
    return false;
}

key_resolution relation_field_manager::resolve_related_key(persistent_object& related,
                                                           key_registry& registry) {
    if (auto k = known_key(related, registry)) {
        return *k;
    }
    if (registry.is_in_flight(&related)) {
        return pending_flush{&related};
    }
    return writer_.persist_unowned(related, registry);
}

void relation_field_manager::handle_pending(const field_metadata& field, const pending_flush& pending,
                                            key_registry& registry) {
    if (field.nulls == null_policy::exception) {
        LOG_ERROR("relations", "%s.%s refers to an unflushed %s", meta_.kind.c_str(),
                  field.name.c_str(), pending.object->kind().c_str());
        throw not_yet_flushed_error(meta_.kind + "." + field.name, pending.object->kind());
    }
    LOG_DEBUG("relations", "%s.%s waits for %s to be stored", record_.get_key().to_string().c_str(),
              field.name.c_str(), pending.object->kind().c_str());
    registry.register_pending_patch(pending.object, {&owner_, &field});
}

bool relation_field_manager::consume_parent_marker() {
    const property_value* marker = record_.property(parent_key_marker);
    if (!marker) {
        return false;
    }
    const auto* parent_key = std::get_if<key>(marker);
    if (!parent_key) {
        throw kinship_error("Parent key marker on " + record_.get_key().to_string() + " is not a key");
    }

    key parent = *parent_key;
    previous_key_ = record_.get_key();
    record_.remove_property(parent_key_marker);
    record_.recreate_with_parent(parent);
    recreated_ = true;

    LOG_INFO("relations", "Recreating %s under %s", previous_key_->to_string().c_str(),
             parent.to_string().c_str());
    return true;
}

} // namespace kinship
