#pragma once

#include "key.hpp"
#include <stdexcept>
#include <string>

namespace kinship {

class kinship_error : public std::runtime_error {
public:
    explicit kinship_error(const std::string& msg) : std::runtime_error(msg) {}
};

class db_error : public kinship_error {
public:
    explicit db_error(const std::string& msg) : kinship_error(msg) {}
};

/// Invalid class or field mapping, raised when metadata is registered.
class metadata_error : public kinship_error {
public:
    explicit metadata_error(const std::string& msg) : kinship_error(msg) {}
};

class object_not_found_error : public kinship_error {
public:
    explicit object_not_found_error(const key& k)
        : kinship_error("No entity found for key " + k.to_string()), key_(k) {}

    const key& missing_key() const { return key_; }

private:
    key key_;
};

/// A relation points at an object whose key is not known yet and the field's
/// null policy does not allow patching it after the insert.
class not_yet_flushed_error : public kinship_error {
public:
    not_yet_flushed_error(const std::string& field, const std::string& pending_kind)
        : kinship_error("Field " + field + " references an instance of " + pending_kind +
                        " that has not been flushed yet, and the field does not tolerate a null value"),
          field_(field) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

// ============================================================================
// Structural violations - fatal, never retried
// ============================================================================

class structural_error : public kinship_error {
public:
    explicit structural_error(const std::string& msg) : kinship_error(msg) {}
};

class child_without_parent_error : public structural_error {
public:
    child_without_parent_error(const key& parent_key, const key& child_key)
        : structural_error("Detected attempt to establish " + parent_key.to_string() +
                           " as the parent of " + child_key.to_string() +
                           " but the entity identified by " + child_key.to_string() +
                           " has already been persisted without a parent. A parent cannot"
                           " be established or changed once an object has been persisted."),
          parent_key_(parent_key), child_key_(child_key) {}

    const key& parent_key() const { return parent_key_; }
    const key& child_key() const { return child_key_; }

private:
    key parent_key_;
    key child_key_;
};

class child_with_wrong_parent_error : public structural_error {
public:
    child_with_wrong_parent_error(const key& parent_key, const key& child_key)
        : structural_error("Detected attempt to establish " + parent_key.to_string() +
                           " as the parent of " + child_key.to_string() +
                           " but the entity identified by " + child_key.to_string() +
                           " is already a child of " +
                           (child_key.parent() ? child_key.parent()->to_string() : std::string("nothing")) +
                           ". A parent cannot be established or changed once an object has been persisted."),
          parent_key_(parent_key), child_key_(child_key) {}

    const key& parent_key() const { return parent_key_; }
    const key& child_key() const { return child_key_; }

private:
    key parent_key_;
    key child_key_;
};

/// A parent-key-provider field was read on a record that has no parent.
class missing_parent_key_error : public structural_error {
public:
    missing_parent_key_error(const std::string& field, const std::string& child_kind,
                             const std::string& parent_kind, const key& child_key)
        : structural_error("Field " + field + " should be able to provide a reference to its parent"
                           " but the entity " + child_key.to_string() + " does not have a parent."
                           " Did you perhaps try to establish an instance of " + child_kind +
                           " as the child of an instance of " + parent_kind +
                           " after the child had already been persisted?"),
          child_key_(child_key) {}

    const key& child_key() const { return child_key_; }

private:
    key child_key_;
};

} // namespace kinship
