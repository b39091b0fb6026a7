#pragma once

#ifdef __cplusplus

#include "entity.hpp"
#include "object.hpp"
#include "schema.hpp"

namespace kinship {

class datastore;

/// Turns stored records into objects for the fetch resolver.
class object_materializer {
public:
    virtual ~object_materializer() = default;

    virtual object_ptr materialize(const entity& record) = 0;
    /// Loads the object stored under `k`; nullptr if there is none.
    virtual object_ptr load(const key& k) = 0;
    /// Collection fields and anything else answered by a query.
    virtual related_value load_derived(const entity& owner, const field_metadata& field) = 0;
};

// ============================================================================
// relation_fetch_resolver - read side of relation fields
// ============================================================================

class relation_fetch_resolver {
public:
    relation_fetch_resolver(datastore& store, object_materializer& materializer,
                            bool strict_one_to_one = false);

    related_value resolve(const entity& owner, const class_metadata& meta, const field_metadata& field);

    /// Direct child of `owner_key` of one of the field's target kinds; first
    /// match in key order. nullptr if there is none.
    object_ptr lookup_one_to_one_child(const key& owner_key, const field_metadata& field);

    /// Owner's ancestor. Throws missing_parent_key_error for root records.
    object_ptr lookup_parent(const entity& owner, const class_metadata& meta, const field_metadata& field);

private:
    datastore& store_;
    object_materializer& materializer_;
    bool strict_one_to_one_;
};

} // namespace kinship

#endif // __cplusplus
