#pragma once

#ifdef __cplusplus

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace kinship {

// Value shape of a mapped field
enum class field_kind {
    scalar,      // stored directly as a property
    object,      // single related or inline object
    collection   // list of related objects
};

enum class relation_type {
    none,
    one_to_one_uni,
    one_to_one_bi,
    one_to_many_uni,
    one_to_many_bi,
    many_to_one_bi
};

// How a field's value reaches the datastore, decided once at binding
enum class mapping_kind {
    embedded,              // flattened into the owner's properties
    serialized,            // one JSON property on the owner
    persistent_reference,  // reference to another record
    interface,             // reference whose target kind is polymorphic
    plain                  // collections; handled by mapping callbacks
};

// What a relation field contributes to the owner's key, decided once at binding
enum class relation_role {
    none,
    parent_key_provider,   // the related object is the owner's ancestor
    foreign_key_provider,  // the owner stores the related key as a property
    derived                // the related object is written as the owner's child
};

enum class null_policy {
    none,           // a not-yet-flushed reference is patched after insert
    exception,      // a not-yet-flushed reference is an error
    default_value
};

enum class key_strategy {
    generated_id,
    app_assigned_name,
    app_assigned_id
};

const char* to_string(mapping_kind kind);
const char* to_string(relation_role role);

struct field_metadata {
    std::string name;
    int field_number = 0;
    field_kind kind = field_kind::scalar;

    // Relation description (object and collection fields)
    std::string target_kind;
    std::vector<std::string> interface_kinds;  // polymorphic targets
    relation_type relation = relation_type::none;
    std::string mapped_by;
    bool owned = true;
    null_policy nulls = null_policy::none;

    // Inline mapping request for object fields
    bool embedded = false;
    bool serialized = false;
    std::string embedded_prefix;

    // Bound by schema_registry::register_class
    mapping_kind mapping = mapping_kind::plain;
    relation_role role = relation_role::none;

    bool is_relation() const {
        return kind != field_kind::scalar &&
               (mapping == mapping_kind::persistent_reference ||
                mapping == mapping_kind::interface ||
                mapping == mapping_kind::plain);
    }
    bool is_inline() const {
        return mapping == mapping_kind::embedded || mapping == mapping_kind::serialized;
    }
    bool is_one_to_one() const {
        return relation == relation_type::one_to_one_uni || relation == relation_type::one_to_one_bi;
    }
    /// Property name under which a relation's key is recorded on the owner.
    std::string key_property() const { return name; }
    /// Kinds a related record may have: target_kind first, then interface_kinds.
    std::vector<std::string> related_kinds() const;
};

struct class_metadata {
    std::string kind;
    key_strategy strategy = key_strategy::generated_id;
    std::vector<field_metadata> fields;

    const field_metadata* field(const std::string& name) const;
    /// The field whose value is this class's ancestor, if any.
    const field_metadata* parent_key_provider() const;
};

// ============================================================================
// class_builder - fluent construction of class_metadata
// ============================================================================

class class_builder {
public:
    explicit class_builder(std::string kind, key_strategy strategy = key_strategy::generated_id);

    class_builder& scalar(const std::string& name);

    /// Owned or unowned single-valued relation.
    class_builder& relation(const std::string& name, const std::string& target_kind,
                            relation_type type, const std::string& mapped_by = "",
                            null_policy nulls = null_policy::none);
    class_builder& unowned(const std::string& name, const std::string& target_kind,
                           null_policy nulls = null_policy::none);
    class_builder& polymorphic(const std::string& name, std::vector<std::string> kinds,
                               relation_type type);

    class_builder& collection(const std::string& name, const std::string& element_kind,
                              relation_type type = relation_type::one_to_many_uni,
                              const std::string& mapped_by = "");

    class_builder& embedded(const std::string& name, const std::string& target_kind,
                            const std::string& prefix);
    class_builder& serialized(const std::string& name);

    /// Escape hatch for fields the helpers above do not describe.
    class_builder& field(field_metadata f);

    class_metadata build() const { return meta_; }

private:
    class_metadata meta_;

    field_metadata& add(const std::string& name, field_kind kind);
};

// ============================================================================
// schema_registry - bound metadata by kind
// ============================================================================

class schema_registry {
public:
    schema_registry() = default;

    /// Process-wide default registry.
    static schema_registry& instance();

    /// Binds mapping kinds and relation roles, validates the class and stores
    /// it. Registering a kind again is a no-op that returns the stored class.
    const class_metadata& register_class(class_metadata meta);

    const class_metadata* find(const std::string& kind) const;
    /// Throws metadata_error for unknown kinds.
    const class_metadata& get(const std::string& kind) const;

    std::vector<const class_metadata*> all_classes() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<class_metadata>> classes_;
};

/// Decides mapping kind and relation role for one field. Throws
/// metadata_error for combinations that have no datastore representation.
void bind_field(const class_metadata& owner, field_metadata& field);

/// Class-level checks run after every field is bound.
void validate_class(const class_metadata& meta);

} // namespace kinship

#endif // __cplusplus
