#include "kinship/parent_key_resolver.hpp"
#include "kinship/errors.hpp"
#include "kinship/key_registry.hpp"
#include "kinship/log.hpp"
#include "kinship/object.hpp"

namespace kinship {

std::optional<key> known_key(const persistent_object& obj, const key_registry& registry) {
    if (obj.object_key() && obj.object_key()->is_complete()) {
        return obj.object_key();
    }
    return registry.key_for(&obj);
}

void check_stored_ancestor(const key& child_key, const key& parent_key) {
    const key* ancestor = child_key.parent();
    if (!ancestor) {
        LOG_ERROR("relations", "%s has no parent, refusing %s",
                  child_key.to_string().c_str(), parent_key.to_string().c_str());
        throw child_without_parent_error(parent_key, child_key);
    }
    if (*ancestor != parent_key) {
        LOG_ERROR("relations", "%s already belongs to %s, refusing %s",
                  child_key.to_string().c_str(), ancestor->to_string().c_str(),
                  parent_key.to_string().c_str());
        throw child_with_wrong_parent_error(parent_key, child_key);
    }
}

void check_for_parent_switch(const persistent_object* child, const key& parent_key,
                             const key_registry& registry) {
    if (!child) {
        return;
    }
    if (child->is_new() && !registry.is_associated(child)) {
        return;
    }
    auto child_key = known_key(*child, registry);
    if (!child_key || !child_key->is_complete()) {
        return;
    }
    check_stored_ancestor(*child_key, parent_key);
}

std::optional<key> rebase_key(const key& k, const key& old_root, const key& new_root) {
    if (!k.is_complete()) {
        return std::nullopt;
    }
    const std::string path = k.to_path();
    const std::string old_path = old_root.to_path();
    if (path == old_path) {
        return new_root;
    }
    if (path.size() > old_path.size() + 1 && path.compare(0, old_path.size(), old_path) == 0 &&
        path[old_path.size()] == '/') {
        return key::from_path(new_root.to_path() + path.substr(old_path.size()));
    }
    return std::nullopt;
}

key compute_child_key(const class_metadata& meta, const persistent_object& obj,
                      const std::optional<key>& parent) {
    switch (meta.strategy) {
        case key_strategy::app_assigned_name:
            if (obj.name().empty()) {
                throw kinship_error("Instance of " + meta.kind + " needs an application-assigned name");
            }
            return parent ? key::from_name(meta.kind, obj.name(), *parent)
                          : key::from_name(meta.kind, obj.name());
        case key_strategy::app_assigned_id:
            if (obj.id() <= 0) {
                throw kinship_error("Instance of " + meta.kind + " needs an application-assigned id");
            }
            return parent ? key::from_id(meta.kind, obj.id(), *parent)
                          : key::from_id(meta.kind, obj.id());
        case key_strategy::generated_id:
            break;
    }
    return parent ? key(meta.kind, *parent) : key(meta.kind);
}

} // namespace kinship
