#pragma once

#ifdef __cplusplus

#include "key.hpp"
#include "schema.hpp"
#include <optional>

namespace kinship {

class key_registry;
class persistent_object;

// ============================================================================
// Ancestor key rules
// ============================================================================

/// Throws child_without_parent_error or child_with_wrong_parent_error if
/// `child` is already stored under an ancestor other than `parent_key`.
/// Children that are new in this write, or have no key, are accepted.
void check_for_parent_switch(const persistent_object* child, const key& parent_key,
                             const key_registry& registry);

/// Same check against a known stored key.
void check_stored_ancestor(const key& child_key, const key& parent_key);

/// The key a new object of `meta` gets, placed under `parent` when given.
/// Incomplete for generated ids; the datastore assigns the id on put.
key compute_child_key(const class_metadata& meta, const persistent_object& obj,
                      const std::optional<key>& parent);

/// `k` moved from below `old_root` to below `new_root`, or nullopt if `k` is
/// neither `old_root` nor one of its descendants.
std::optional<key> rebase_key(const key& k, const key& old_root, const key& new_root);

/// The object's key if it has one, else the key registered during this write.
std::optional<key> known_key(const persistent_object& obj, const key_registry& registry);

} // namespace kinship

#endif // __cplusplus
