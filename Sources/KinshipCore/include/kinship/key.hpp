#pragma once

#ifdef __cplusplus

#include <cstdint>
#include <memory>
#include <string>
#include <functional>

namespace kinship {

// ============================================================================
// key - identity of a record in the datastore
// ============================================================================
//
// A key is a kind, an identifying component (numeric id, string name, or
// nothing yet) and an optional parent key. The chain of parents ends at the
// root key of the entity group. Keys are values: copies share the parent
// chain, which is never mutated.

class key {
public:
    key() = default;

    /// Incomplete key: the datastore allocates an id on first put.
    explicit key(std::string kind);
    key(std::string kind, const key& parent);

    static key from_id(std::string kind, int64_t id);
    static key from_id(std::string kind, int64_t id, const key& parent);
    static key from_name(std::string kind, std::string name);
    static key from_name(std::string kind, std::string name, const key& parent);

    const std::string& kind() const { return kind_; }
    int64_t id() const { return id_; }
    const std::string& name() const { return name_; }

    bool has_name() const { return !name_.empty(); }
    bool is_complete() const { return id_ != 0 || !name_.empty(); }
    bool is_valid() const { return !kind_.empty(); }

    /// nullptr for root keys.
    const key* parent() const { return parent_.get(); }
    bool has_parent() const { return parent_ != nullptr; }
    key root() const;
    size_t depth() const;

    /// Same identity, placed under `parent`.
    key with_parent(const key& parent) const;
    key without_parent() const;
    /// Completes an incomplete key with an allocated id.
    key with_id(int64_t id) const;

    /// Canonical storage path. Prefix-ordered: every descendant's path starts
    /// with its ancestor's path followed by '/'.
    std::string to_path() const;
    static key from_path(const std::string& path);

    /// Human readable form, e.g. Parent(12)/Child("x").
    std::string to_string() const;

    bool operator==(const key& other) const;
    bool operator!=(const key& other) const { return !(*this == other); }

private:
    std::string kind_;
    int64_t id_ = 0;
    std::string name_;
    std::shared_ptr<const key> parent_;
};

struct key_hash {
    size_t operator()(const key& k) const {
        return std::hash<std::string>()(k.to_path());
    }
};

} // namespace kinship

#endif // __cplusplus
