#pragma once

#ifdef __cplusplus

#include "entity.hpp"
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace kinship {

class persistent_object;
using object_ptr = std::shared_ptr<persistent_object>;
using object_list = std::vector<object_ptr>;

/// Value of a relation field: unset, a single object, or a collection.
using related_value = std::variant<std::monostate, object_ptr, object_list>;

enum class object_state {
    transient,         // never persisted
    persistent_new,    // insert in progress
    persistent_clean,
    persistent_dirty,
    deleted
};

// ============================================================================
// persistent_object - a dynamically typed mapped object
// ============================================================================

class persistent_object : public std::enable_shared_from_this<persistent_object> {
public:
    explicit persistent_object(std::string kind);

    static object_ptr make(std::string kind) {
        return std::make_shared<persistent_object>(std::move(kind));
    }

    const std::string& kind() const { return kind_; }

    // Scalar fields
    void set(const std::string& field, property_value value);
    const property_value* get(const std::string& field) const;
    const std::map<std::string, property_value>& scalars() const { return scalars_; }

    // Single-valued object fields
    void set_object(const std::string& field, object_ptr value);
    object_ptr object(const std::string& field) const;

    // Collection fields
    void set_collection(const std::string& field, object_list values);
    void add_to(const std::string& field, object_ptr value);
    const object_list& collection(const std::string& field) const;

    /// Current value of any relation field as a related_value.
    related_value related(const std::string& field) const;
    /// Stores a fetched value and marks the field loaded without dirtying.
    void store_fetched(const std::string& field, related_value value);

    bool has_field(const std::string& field) const;
    bool is_loaded(const std::string& field) const { return loaded_.count(field) > 0; }
    void mark_loaded(const std::string& field) { loaded_.insert(field); }

    // Identity and lifecycle
    const std::optional<key>& object_key() const { return key_; }
    void set_object_key(key k) { key_ = std::move(k); }
    void clear_object_key() { key_.reset(); }

    /// Application-assigned identity, used by the matching key strategy.
    void set_name(std::string name) { name_ = std::move(name); }
    const std::string& name() const { return name_; }
    void set_id(int64_t id) { id_ = id; }
    int64_t id() const { return id_; }

    object_state state() const { return state_; }
    void set_state(object_state s) { state_ = s; }
    bool is_new() const {
        return state_ == object_state::transient || state_ == object_state::persistent_new;
    }
    bool is_dirty() const { return state_ == object_state::persistent_dirty; }

private:
    std::string kind_;
    std::map<std::string, property_value> scalars_;
    std::map<std::string, object_ptr> objects_;
    std::map<std::string, object_list> collections_;
    std::set<std::string> loaded_;

    std::optional<key> key_;
    std::string name_;
    int64_t id_ = 0;
    object_state state_ = object_state::transient;

    void touch();
};

} // namespace kinship

#endif // __cplusplus
