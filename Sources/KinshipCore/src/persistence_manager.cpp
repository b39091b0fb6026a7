#include "kinship/persistence_manager.hpp"
#include "kinship/errors.hpp"
#include "kinship/inline_mapping.hpp"
#include "kinship/log.hpp"
#include "kinship/parent_key_resolver.hpp"
#include "kinship/sqlite_datastore.hpp"
#include <algorithm>

namespace kinship {

// Global log level - defaults to off
std::atomic<log_level> g_log_level{log_level::off};

namespace {

// Marks an object in flight for the duration of its write. An insert that
// fails before the record was stored leaves the object transient.
class write_scope {
public:
    write_scope(key_registry& registry, persistent_object& obj) : registry_(registry), obj_(obj) {
        registry_.begin_insert(&obj_);
    }

    ~write_scope() {
        registry_.end_insert(&obj_);
        if (!done_ && !obj_.object_key()) {
            obj_.set_state(object_state::transient);
        }
    }

    void done() {
        registry_.end_insert(&obj_);
        done_ = true;
    }

private:
    key_registry& registry_;
    persistent_object& obj_;
    bool done_ = false;
};

// Moves key-valued properties that point into a relocated subtree.
bool rebase_properties(entity& record, const key& old_root, const key& new_root) {
    bool changed = false;
    for (const auto& [name, value] : property_map(record.properties())) {
        if (const auto* k = std::get_if<key>(&value)) {
            if (auto moved = rebase_key(*k, old_root, new_root)) {
                changed |= record.set_property(name, *moved);
            }
        } else if (const auto* list = std::get_if<std::vector<scalar_value>>(&value)) {
            auto rebased = *list;
            bool list_changed = false;
            for (auto& item : rebased) {
                if (const auto* ik = std::get_if<key>(&item)) {
                    if (auto moved = rebase_key(*ik, old_root, new_root)) {
                        item = *moved;
                        list_changed = true;
                    }
                }
            }
            if (list_changed) {
                changed |= record.set_property(name, std::move(rebased));
            }
        }
    }
    return changed;
}

} // namespace

persistence_manager::persistence_manager(std::shared_ptr<datastore> store, schema_registry& schema,
                                         configuration config)
    : store_(std::move(store)), schema_(schema), config_(std::move(config)) {
    if (!store_) {
        throw kinship_error("persistence_manager needs a datastore");
    }
    set_log_level(config_.logging);
}

persistence_manager::persistence_manager(const configuration& config)
    : persistence_manager(std::make_shared<sqlite_datastore>(config.path),
                          schema_registry::instance(), config) {}

const class_metadata& persistence_manager::register_class(class_metadata meta) {
    return schema_.register_class(std::move(meta));
}

const class_metadata& persistence_manager::metadata_for(const std::string& kind) {
    const class_metadata& meta = schema_.get(kind);
    if (callbacks_installed_.insert(kind).second) {
        for (const auto& f : meta.fields) {
            if (f.kind == field_kind::collection && f.mapping == mapping_kind::plain &&
                !callbacks_.find(kind, f.name)) {
                callbacks_.register_callbacks(kind, f.name, std::make_shared<owned_collection_callbacks>());
            }
        }
    }
    return meta;
}

void persistence_manager::remember(persistent_object& obj) {
    if (!obj.object_key()) return;
    auto self = obj.weak_from_this();
    if (self.expired()) return;
    object_cache_[obj.object_key()->to_path()] = std::move(self);
    if (object_cache_.size() >= sweep_at_) {
        sweep_cache();
    }
}

object_ptr persistence_manager::cached(const std::string& path) {
    auto it = object_cache_.find(path);
    if (it == object_cache_.end()) {
        return nullptr;
    }
    if (auto obj = it->second.lock()) {
        return obj;
    }
    object_cache_.erase(it);
    return nullptr;
}

void persistence_manager::sweep_cache() {
    for (auto it = object_cache_.begin(); it != object_cache_.end();) {
        if (it->second.expired()) {
            it = object_cache_.erase(it);
        } else {
            ++it;
        }
    }
    sweep_at_ = std::max<size_t>(64, object_cache_.size() * 2);
}

size_t persistence_manager::cached_objects() {
    sweep_cache();
    return object_cache_.size();
}

// ============================================================================
// Writes
// ============================================================================

key persistence_manager::make_persistent(const object_ptr& obj) {
    if (!obj) {
        throw kinship_error("Cannot persist a null object");
    }
    if (obj->state() == object_state::deleted) {
        throw kinship_error("Cannot persist a deleted " + obj->kind());
    }

    key_registry registry;
    key k = obj->is_new()
        ? insert_object(*obj, std::nullopt, registry)
        : update_object(*obj, registry);

    if (size_t unresolved = registry.pending_patch_count()) {
        LOG_WARN("persist", "%zu relation writes are still waiting for a key after storing %s",
                 unresolved, k.to_string().c_str());
    }
    return k;
}

std::optional<key> persistence_manager::establish_parent(persistent_object& obj, const class_metadata& meta,
                                                         const std::optional<key>& forced_parent,
                                                         key_registry& registry) {
    const field_metadata* provider = meta.parent_key_provider();
    if (!provider) {
        return forced_parent;
    }
    object_ptr parent_obj = obj.object(provider->name);
    if (!parent_obj) {
        return forced_parent;
    }

    std::optional<key> declared = known_key(*parent_obj, registry);
    if (!declared) {
        if (registry.is_in_flight(parent_obj.get())) {
            if (provider->nulls == null_policy::exception) {
                throw not_yet_flushed_error(meta.kind + "." + provider->name, parent_obj->kind());
            }
            // Written without an ancestor for now; the deferred parent link
            // relocates the record once the parent has its key.
            LOG_DEBUG("persist", "%s is written before its parent %s has a key",
                      meta.kind.c_str(), parent_obj->kind().c_str());
            return forced_parent;
        }
        auto resolution = persist_unowned(*parent_obj, registry);
        if (const auto* k = std::get_if<key>(&resolution)) {
            declared = *k;
        } else {
            return forced_parent;
        }
    }

    if (forced_parent && *forced_parent != *declared) {
        throw child_with_wrong_parent_error(*declared, compute_child_key(meta, obj, forced_parent));
    }
    return declared;
}

void persistence_manager::store_record(persistent_object& obj, entity& record, key_registry& registry) {
    key k = store_->put(record);
    obj.set_object_key(k);
    registry.register_key(&obj, k);
    remember(obj);
}

key persistence_manager::insert_object(persistent_object& obj, const std::optional<key>& forced_parent,
                                       key_registry& registry) {
    const class_metadata& meta = metadata_for(obj.kind());
    if (obj.state() == object_state::deleted) {
        throw kinship_error("Cannot insert a deleted " + obj.kind());
    }

    write_scope scope(registry, obj);
    obj.set_state(object_state::persistent_new);

    std::optional<key> parent = establish_parent(obj, meta, forced_parent, registry);

    entity record(compute_child_key(meta, obj, parent));
    relation_field_manager relations(obj, record, meta, *this);

    for (const auto& f : meta.fields) {
        if (f.kind == field_kind::scalar) {
            if (const property_value* v = obj.get(f.name)) {
                record.set_property(f.name, *v);
            }
        } else if (f.is_inline()) {
            write_inline(record, f, obj.object(f.name).get());
        } else {
            relations.defer_relation_store(f, obj.related(f.name), true);
        }
    }

    store_record(obj, record, registry);
    LOG_DEBUG("persist", "inserted %s", record.get_key().to_string().c_str());

    if (relations.apply_deferred_relations(registry)) {
        write_again(obj, record, relations, registry);
    }

    obj.set_state(object_state::persistent_clean);
    scope.done();

    process_pending_patches(obj, registry);
    return *obj.object_key();
}

void persistence_manager::validate_update(persistent_object& obj, const class_metadata& meta, const key& k,
                                          key_registry& registry) {
    for (const auto& f : meta.fields) {
        if (!obj.is_loaded(f.name) || f.is_inline()) continue;

        if (f.role == relation_role::parent_key_provider) {
            object_ptr parent = obj.object(f.name);
            if (!parent) continue;
            auto parent_key = known_key(*parent, registry);
            if (!parent_key) {
                // A parent without a key cannot be the stored ancestor.
                key unsaved(parent->kind());
                if (!k.parent()) {
                    throw child_without_parent_error(unsaved, k);
                }
                throw child_with_wrong_parent_error(unsaved, k);
            }
            check_stored_ancestor(k, *parent_key);
        } else if (f.role == relation_role::derived) {
            if (f.kind == field_kind::collection) {
                for (const auto& element : obj.collection(f.name)) {
                    check_for_parent_switch(element.get(), k, registry);
                }
            } else {
                check_for_parent_switch(obj.object(f.name).get(), k, registry);
            }
        }
    }
}

key persistence_manager::update_object(persistent_object& obj, key_registry& registry) {
    const class_metadata& meta = metadata_for(obj.kind());
    if (!obj.object_key() || !obj.object_key()->is_complete()) {
        throw kinship_error("Cannot update " + obj.kind() + " without a stored key");
    }
    const key k = *obj.object_key();
    if (registry.is_in_flight(&obj)) {
        return k;
    }

    validate_update(obj, meta, k, registry);

    write_scope scope(registry, obj);
    registry.register_key(&obj, k);

    auto stored = store_->get(k);
    if (!stored) {
        throw object_not_found_error(k);
    }
    entity record = std::move(*stored);
    relation_field_manager relations(obj, record, meta, *this);

    for (const auto& f : meta.fields) {
        if (f.kind == field_kind::scalar) {
            if (const property_value* v = obj.get(f.name)) {
                record.set_property(f.name, *v);
            }
        } else if (!obj.is_loaded(f.name)) {
            continue;
        } else if (f.is_inline()) {
            write_inline(record, f, obj.object(f.name).get());
        } else {
            relations.defer_relation_store(f, obj.related(f.name), false);
        }
    }

    store_->put(record);
    remember(obj);
    LOG_DEBUG("persist", "updated %s", k.to_string().c_str());

    if (relations.apply_deferred_relations(registry)) {
        write_again(obj, record, relations, registry);
    }

    obj.set_state(object_state::persistent_clean);
    scope.done();
    return *obj.object_key();
}

void persistence_manager::write_again(persistent_object& obj, entity& record,
                                      const relation_field_manager& relations, key_registry& registry) {
    if (!relations.owner_recreated()) {
        store_->put(record);
        return;
    }

    const key old_key = *relations.previous_key();
    key new_key = store_->put(record);

    relocate_descendants(old_key, new_key, registry);
    if (rebase_properties(record, old_key, new_key)) {
        store_->put(record);
    }
    store_->remove(old_key);

    object_cache_.erase(old_key.to_path());
    registry.rebase(old_key, new_key);
    obj.set_object_key(new_key);
    registry.register_key(&obj, new_key);
    remember(obj);

    // Records stored earlier in this write may already refer to the old key.
    // The moved subtree itself was rebased above.
    for (const auto& k : registry.stored_keys()) {
        if (rebase_key(k, new_key, new_key)) continue;
        auto other = store_->get(k);
        if (other && rebase_properties(*other, old_key, new_key)) {
            store_->put(*other);
        }
    }

    LOG_INFO("persist", "%s moved to %s", old_key.to_string().c_str(), new_key.to_string().c_str());
}

void persistence_manager::relocate_descendants(const key& old_root, const key& new_root,
                                               key_registry& registry) {
    std::vector<entity> descendants;
    store_->scan("", old_root, [&](const entity& e) {
        if (e.get_key() != old_root) {
            descendants.push_back(e);
        }
        return true;
    });

    // Path order puts every record after its ancestors.
    for (auto& e : descendants) {
        const key old_key = e.get_key();
        auto moved = rebase_key(old_key, old_root, new_root);
        if (!moved) continue;

        entity copy(*moved, e.properties());
        rebase_properties(copy, old_root, new_root);
        store_->put(copy);
        store_->remove(old_key);

        if (object_ptr obj = cached(old_key.to_path())) {
            object_cache_.erase(old_key.to_path());
            obj->set_object_key(*moved);
            remember(*obj);
        }
    }
    registry.rebase(old_root, new_root);
}

void persistence_manager::process_pending_patches(persistent_object& related, key_registry& registry) {
    for (const auto& patch : registry.take_pending_patches(&related)) {
        persistent_object& owner = *patch.owner;
        auto owner_key = known_key(owner, registry);
        if (!owner_key) {
            LOG_WARN("persist", "%s.%s was never stored, dropping its pending relation",
                     owner.kind().c_str(), patch.field->name.c_str());
            continue;
        }

        const class_metadata& meta = metadata_for(owner.kind());
        auto stored = store_->get(*owner_key);
        if (!stored) {
            throw object_not_found_error(*owner_key);
        }
        entity record = std::move(*stored);

        LOG_DEBUG("persist", "patching %s.%s", owner_key->to_string().c_str(), patch.field->name.c_str());
        relation_field_manager relations(owner, record, meta, *this);
        relations.defer_relation_store(*patch.field, owner.related(patch.field->name), true);
        if (relations.apply_deferred_relations(registry)) {
            write_again(owner, record, relations, registry);
        }
    }
}

key_resolution persistence_manager::persist_owned(persistent_object& child, const key& parent_key,
                                                  key_registry& registry) {
    if (registry.is_in_flight(&child)) {
        if (auto k = known_key(child, registry)) {
            return *k;
        }
        return pending_flush{&child};
    }
    if (child.state() == object_state::deleted) {
        throw kinship_error("Cannot store a deleted " + child.kind() + " under " + parent_key.to_string());
    }
    if (child.is_new() && !known_key(child, registry)) {
        return insert_object(child, parent_key, registry);
    }
    if (child.is_dirty()) {
        return update_object(child, registry);
    }
    if (auto k = known_key(child, registry)) {
        return *k;
    }
    throw kinship_error("Owned " + child.kind() + " has no key and is not new");
}

key_resolution persistence_manager::persist_unowned(persistent_object& target, key_registry& registry) {
    if (auto k = known_key(target, registry)) {
        return *k;
    }
    if (registry.is_in_flight(&target)) {
        return pending_flush{&target};
    }
    if (target.state() == object_state::deleted) {
        throw kinship_error("Cannot refer to a deleted " + target.kind());
    }
    return insert_object(target, std::nullopt, registry);
}

// ============================================================================
// Deletes
// ============================================================================

void persistence_manager::remove_owned(const key& k) {
    std::vector<key> doomed{k};
    if (config_.cascade_delete) {
        store_->scan("", k, [&](const entity& e) {
            if (e.get_key() != k) {
                doomed.push_back(e.get_key());
            }
            return true;
        });
    }

    // Children first.
    std::reverse(doomed.begin(), doomed.end());
    for (const auto& victim : doomed) {
        store_->remove(victim);
        if (object_ptr obj = cached(victim.to_path())) {
            obj->set_state(object_state::deleted);
            object_cache_.erase(victim.to_path());
        }
    }
    LOG_DEBUG("persist", "deleted %s (%zu records)", k.to_string().c_str(), doomed.size());
}

void persistence_manager::delete_persistent(const object_ptr& obj) {
    if (!obj || !obj->object_key() || !obj->object_key()->is_complete()) {
        throw kinship_error("Cannot delete an object that was never stored");
    }
    remove_owned(*obj->object_key());
    obj->set_state(object_state::deleted);
}

// ============================================================================
// Reads
// ============================================================================

object_ptr persistence_manager::materialize(const entity& record) {
    const std::string path = record.get_key().to_path();
    if (auto obj = cached(path)) {
        return obj;
    }

    const class_metadata& meta = metadata_for(record.kind());
    auto obj = persistent_object::make(record.kind());

    for (const auto& f : meta.fields) {
        if (f.kind == field_kind::scalar) {
            if (const property_value* v = record.property(f.name)) {
                obj->set(f.name, *v);
            }
        } else if (f.is_inline()) {
            object_ptr value = read_inline(record, f);
            obj->store_fetched(f.name, value ? related_value(value) : related_value(std::monostate{}));
        }
    }

    const key& k = record.get_key();
    if (k.has_name()) {
        obj->set_name(k.name());
    } else {
        obj->set_id(k.id());
    }
    obj->set_object_key(k);
    obj->set_state(object_state::persistent_clean);

    remember(*obj);
    return obj;
}

object_ptr persistence_manager::find_object(const key& k) {
    if (auto obj = cached(k.to_path())) {
        return obj;
    }
    auto record = store_->get(k);
    if (!record) {
        return nullptr;
    }
    return materialize(*record);
}

object_ptr persistence_manager::load(const key& k) {
    return find_object(k);
}

object_ptr persistence_manager::get_object(const key& k) {
    auto obj = find_object(k);
    if (!obj) {
        throw object_not_found_error(k);
    }
    return obj;
}

object_ptr persistence_manager::get_object(const std::string& kind, int64_t id) {
    return get_object(key::from_id(kind, id));
}

object_ptr persistence_manager::get_object(const std::string& kind, const std::string& name) {
    return get_object(key::from_name(kind, name));
}

related_value persistence_manager::load_derived(const entity& owner, const field_metadata& field) {
    if (field.kind != field_kind::collection) {
        LOG_DEBUG("fetch", "Nothing to load for %s", field.name.c_str());
        return std::monostate{};
    }

    const key& owner_key = owner.get_key();
    object_list children;
    for (const auto& kind : field.related_kinds()) {
        store_->scan(kind, owner_key, [&](const entity& e) {
            const key* parent = e.parent();
            if (parent && *parent == owner_key) {
                children.push_back(materialize(e));
            }
            return true;
        });
    }
    return children;
}

related_value persistence_manager::fetch_relation_field(persistent_object& obj, const std::string& field) {
    const class_metadata& meta = metadata_for(obj.kind());
    const field_metadata* f = meta.field(field);
    if (!f) {
        throw metadata_error("Kind " + meta.kind + " has no field " + field);
    }
    if (f->kind == field_kind::scalar) {
        throw kinship_error("Field " + meta.kind + "." + field + " is not a relation");
    }
    if (!obj.object_key() || !obj.object_key()->is_complete()) {
        throw kinship_error("Cannot fetch " + field + " of an unsaved " + obj.kind());
    }

    auto record = store_->get(*obj.object_key());
    if (!record) {
        throw object_not_found_error(*obj.object_key());
    }

    relation_fetch_resolver resolver(*store_, *this, config_.strict_one_to_one);
    related_value value = resolver.resolve(*record, meta, *f);
    obj.store_fetched(field, value);
    return value;
}

} // namespace kinship
