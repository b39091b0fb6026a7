#pragma once

#ifdef __cplusplus

#include "key.hpp"
#include <variant>

namespace kinship {

class callback_registry;
class datastore;
class key_registry;
class persistent_object;
class schema_registry;

/// The related object is being inserted higher up the same call tree and has
/// no key yet.
struct pending_flush {
    const persistent_object* object = nullptr;
};

using key_resolution = std::variant<key, pending_flush>;

// ============================================================================
// relation_writer - the write cycle the relation layer calls back into
// ============================================================================

class relation_writer {
public:
    virtual ~relation_writer() = default;

    /// Stores `child` as a descendant of `parent_key`: inserted if new,
    /// rewritten if dirty, otherwise left alone.
    virtual key_resolution persist_owned(persistent_object& child, const key& parent_key,
                                         key_registry& registry) = 0;

    /// Makes sure `target` has a key, inserting it as a root record if needed.
    virtual key_resolution persist_unowned(persistent_object& target, key_registry& registry) = 0;

    /// Removes an owned record and, if configured, its descendants.
    virtual void remove_owned(const key& k) = 0;

    virtual datastore& store() = 0;
    virtual const schema_registry& schema() const = 0;
    virtual callback_registry& callbacks() = 0;
};

} // namespace kinship

#endif // __cplusplus
