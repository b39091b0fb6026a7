#pragma once

#ifdef __cplusplus

#include "entity.hpp"
#include "object.hpp"
#include "schema.hpp"

namespace kinship {

// ============================================================================
// Inline mappings - values stored inside the owner's record
// ============================================================================
//
// embedded:   each scalar of the value becomes a property named
//             <prefix><field>, e.g. "addr_" + "city".
// serialized: the value becomes one JSON string property named after the
//             field: {"kind": "...", "fields": {...}}.
//
// Only scalar fields of the inline value are stored.

/// Returns true if the owner's properties changed.
bool write_inline(entity& owner, const field_metadata& field, const persistent_object* value);

/// nullptr if the owner holds no value for the field.
object_ptr read_inline(const entity& owner, const field_metadata& field);

} // namespace kinship

#endif // __cplusplus
