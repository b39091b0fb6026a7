#pragma once

#ifdef __cplusplus

#include "key.hpp"
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace kinship {

class persistent_object;
struct field_metadata;

/// An owner whose relation field could not be written because the related
/// object had no key yet. Replayed once the related object is stored.
struct pending_patch {
    persistent_object* owner = nullptr;
    const field_metadata* field = nullptr;
};

// ============================================================================
// key_registry - bookkeeping for one top-level write
// ============================================================================
//
// Created by the persistence manager for each make_persistent call and passed
// down the call tree. Never shared between writes.

class key_registry {
public:
    key_registry() = default;

    key_registry(const key_registry&) = delete;
    key_registry& operator=(const key_registry&) = delete;

    // Objects whose insert has started but whose key is not final yet
    void begin_insert(const persistent_object* obj) { in_flight_.insert(obj); }
    void end_insert(const persistent_object* obj) { in_flight_.erase(obj); }
    bool is_in_flight(const persistent_object* obj) const { return in_flight_.count(obj) > 0; }

    /// Associates an object with the key its record was stored under.
    void register_key(const persistent_object* obj, const key& k);
    std::optional<key> key_for(const persistent_object* obj) const;
    /// True if the object was stored during this write.
    bool is_associated(const persistent_object* obj) const { return keys_.count(obj) > 0; }

    /// Every key stored during this write.
    std::vector<key> stored_keys() const;

    /// Moves every registered key at or below `old_root` to `new_root`.
    void rebase(const key& old_root, const key& new_root);

    void register_pending_patch(const persistent_object* related, pending_patch patch);
    /// Removes and returns the patches waiting for `related`.
    std::vector<pending_patch> take_pending_patches(const persistent_object* related);
    size_t pending_patch_count() const;

    // Parents that had a child key recorded on them and must be re-put
    void register_modified_parent(const key& parent) { modified_parents_.insert(parent); }
    bool parent_needs_update(const key& parent) const { return modified_parents_.count(parent) > 0; }
    void clear_modified_parent(const key& parent) { modified_parents_.erase(parent); }

private:
    std::unordered_set<const persistent_object*> in_flight_;
    std::unordered_map<const persistent_object*, key> keys_;
    std::unordered_map<const persistent_object*, std::vector<pending_patch>> pending_;
    std::unordered_set<key, key_hash> modified_parents_;
};

} // namespace kinship

#endif // __cplusplus
