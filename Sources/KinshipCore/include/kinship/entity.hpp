#pragma once

#ifdef __cplusplus

#include "key.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace kinship {

// Values that may appear inside a list property
using scalar_value = std::variant<
    std::nullptr_t,
    bool,
    int64_t,
    double,
    std::string,
    key
>;

// Supported property types
using property_value = std::variant<
    std::nullptr_t,
    bool,
    int64_t,
    double,
    std::string,
    key,
    std::vector<scalar_value>  // list
>;

using property_map = std::map<std::string, property_value>;

/// Set on a record when a relation discovered, after the record's first
/// write, the key its ancestor path has to start with.
inline constexpr const char* parent_key_marker = "__kinship_parent_key__";

// ============================================================================
// entity - the datastore's unit of storage
// ============================================================================

class entity {
public:
    entity() = default;
    explicit entity(key k) : key_(std::move(k)) {}
    entity(key k, property_map properties)
        : key_(std::move(k)), properties_(std::move(properties)) {}

    const key& get_key() const { return key_; }
    void set_key(key k) { key_ = std::move(k); }

    const key* parent() const { return key_.parent(); }
    const std::string& kind() const { return key_.kind(); }

    /// Returns true if the stored value changed.
    bool set_property(const std::string& name, property_value value);
    bool remove_property(const std::string& name);
    bool has_property(const std::string& name) const;
    /// nullptr if absent.
    const property_value* property(const std::string& name) const;

    const property_map& properties() const { return properties_; }

    /// Rebuilds the record under `parent`. A name is kept; an allocated id is
    /// dropped since ids are only unique below a given parent.
    void recreate_with_parent(const key& parent);

private:
    key key_;
    property_map properties_;
};

// ============================================================================
// JSON codec for property maps (stored in the Entities table)
// ============================================================================

std::string properties_to_json(const property_map& properties);
property_map properties_from_json(const std::string& json);

std::string describe(const property_value& value);

} // namespace kinship

#endif // __cplusplus
