#include "kinship/schema.hpp"
#include "kinship/entity.hpp"
#include "kinship/errors.hpp"
#include "kinship/log.hpp"
#include <set>

namespace kinship {

const char* to_string(mapping_kind kind) {
    switch (kind) {
        case mapping_kind::embedded: return "embedded";
        case mapping_kind::serialized: return "serialized";
        case mapping_kind::persistent_reference: return "persistent_reference";
        case mapping_kind::interface: return "interface";
        case mapping_kind::plain: return "plain";
    }
    return "unknown";
}

const char* to_string(relation_role role) {
    switch (role) {
        case relation_role::none: return "none";
        case relation_role::parent_key_provider: return "parent_key_provider";
        case relation_role::foreign_key_provider: return "foreign_key_provider";
        case relation_role::derived: return "derived";
    }
    return "unknown";
}

std::vector<std::string> field_metadata::related_kinds() const {
    std::vector<std::string> kinds;
    if (!target_kind.empty()) {
        kinds.push_back(target_kind);
    }
    kinds.insert(kinds.end(), interface_kinds.begin(), interface_kinds.end());
    return kinds;
}

const field_metadata* class_metadata::field(const std::string& name) const {
    for (const auto& f : fields) {
        if (f.name == name) return &f;
    }
    return nullptr;
}

const field_metadata* class_metadata::parent_key_provider() const {
    for (const auto& f : fields) {
        if (f.role == relation_role::parent_key_provider) return &f;
    }
    return nullptr;
}

// ============================================================================
// class_builder
// ============================================================================

class_builder::class_builder(std::string kind, key_strategy strategy) {
    meta_.kind = std::move(kind);
    meta_.strategy = strategy;
}

field_metadata& class_builder::add(const std::string& name, field_kind kind) {
    field_metadata f;
    f.name = name;
    f.field_number = static_cast<int>(meta_.fields.size());
    f.kind = kind;
    meta_.fields.push_back(std::move(f));
    return meta_.fields.back();
}

class_builder& class_builder::scalar(const std::string& name) {
    add(name, field_kind::scalar);
    return *this;
}

class_builder& class_builder::relation(const std::string& name, const std::string& target_kind,
                                       relation_type type, const std::string& mapped_by,
                                       null_policy nulls) {
    auto& f = add(name, field_kind::object);
    f.target_kind = target_kind;
    f.relation = type;
    f.mapped_by = mapped_by;
    f.nulls = nulls;
    return *this;
}

class_builder& class_builder::unowned(const std::string& name, const std::string& target_kind,
                                      null_policy nulls) {
    auto& f = add(name, field_kind::object);
    f.target_kind = target_kind;
    f.relation = relation_type::one_to_one_uni;
    f.owned = false;
    f.nulls = nulls;
    return *this;
}

class_builder& class_builder::polymorphic(const std::string& name, std::vector<std::string> kinds,
                                          relation_type type) {
    auto& f = add(name, field_kind::object);
    f.interface_kinds = std::move(kinds);
    f.relation = type;
    return *this;
}

class_builder& class_builder::collection(const std::string& name, const std::string& element_kind,
                                         relation_type type, const std::string& mapped_by) {
    auto& f = add(name, field_kind::collection);
    f.target_kind = element_kind;
    f.relation = type;
    f.mapped_by = mapped_by;
    return *this;
}

class_builder& class_builder::embedded(const std::string& name, const std::string& target_kind,
                                       const std::string& prefix) {
    auto& f = add(name, field_kind::object);
    f.target_kind = target_kind;
    f.embedded = true;
    f.embedded_prefix = prefix;
    return *this;
}

class_builder& class_builder::serialized(const std::string& name) {
    auto& f = add(name, field_kind::object);
    f.serialized = true;
    return *this;
}

class_builder& class_builder::field(field_metadata f) {
    f.field_number = static_cast<int>(meta_.fields.size());
    meta_.fields.push_back(std::move(f));
    return *this;
}

// ============================================================================
// Binding
// ============================================================================

void bind_field(const class_metadata& owner, field_metadata& field) {
    auto where = [&]() { return owner.kind + "." + field.name; };

    field.role = relation_role::none;

    if (field.kind == field_kind::scalar) {
        field.mapping = mapping_kind::plain;
        return;
    }

    if (field.embedded || field.serialized) {
        if (field.embedded && field.serialized) {
            throw metadata_error("Field " + where() + " cannot be both embedded and serialized");
        }
        if (field.kind == field_kind::collection) {
            throw metadata_error("Collection field " + where() + " cannot be stored inline");
        }
        if (field.embedded && field.embedded_prefix.empty()) {
            throw metadata_error("Embedded field " + where() + " needs a column prefix");
        }
        field.mapping = field.embedded ? mapping_kind::embedded : mapping_kind::serialized;
        return;
    }

    if (field.target_kind.empty() && field.interface_kinds.empty()) {
        throw metadata_error("Relation field " + where() + " does not name a target kind");
    }

    if (field.kind == field_kind::collection) {
        if (!field.owned) {
            throw metadata_error("Unowned collection field " + where() + " is not supported");
        }
        if (field.relation != relation_type::one_to_many_uni &&
            field.relation != relation_type::one_to_many_bi) {
            throw metadata_error("Collection field " + where() + " must be one-to-many");
        }
        field.mapping = mapping_kind::plain;
        field.role = relation_role::derived;
        return;
    }

    field.mapping = field.interface_kinds.empty()
        ? mapping_kind::persistent_reference
        : mapping_kind::interface;

    if (!field.owned) {
        field.role = relation_role::foreign_key_provider;
        return;
    }

    switch (field.relation) {
        case relation_type::many_to_one_bi:
            field.role = relation_role::parent_key_provider;
            break;
        case relation_type::one_to_one_bi:
            field.role = field.mapped_by.empty()
                ? relation_role::derived
                : relation_role::parent_key_provider;
            break;
        case relation_type::one_to_one_uni:
            field.role = relation_role::derived;
            break;
        case relation_type::none:
        case relation_type::one_to_many_uni:
        case relation_type::one_to_many_bi:
            throw metadata_error("Object field " + where() + " must be a one-to-one or many-to-one relation");
    }
}

void validate_class(const class_metadata& meta) {
    if (meta.kind.empty()) {
        throw metadata_error("Class metadata needs a kind");
    }

    std::set<std::string> names;
    std::set<std::string> prefixes;
    std::set<std::string> child_kinds;
    int parent_providers = 0;

    for (const auto& f : meta.fields) {
        if (f.name.empty()) {
            throw metadata_error("Class " + meta.kind + " has a field without a name");
        }
        if (!names.insert(f.name).second) {
            throw metadata_error("Class " + meta.kind + " declares field " + f.name + " twice");
        }
        if (f.role == relation_role::parent_key_provider) {
            ++parent_providers;
        }
        // Owned children are found again by kind under the owner's key.
        if (f.role == relation_role::derived) {
            for (const auto& k : f.related_kinds()) {
                if (!child_kinds.insert(k).second) {
                    throw metadata_error("Class " + meta.kind + " owns " + k +
                                         " children through more than one field");
                }
            }
        }
        if (f.mapping == mapping_kind::embedded && !prefixes.insert(f.embedded_prefix).second) {
            throw metadata_error("Class " + meta.kind + " reuses embedded prefix " + f.embedded_prefix);
        }
    }

    if (parent_providers > 1) {
        throw metadata_error("Class " + meta.kind + " has more than one field providing its parent key");
    }
    if (parent_providers == 1 && meta.strategy == key_strategy::app_assigned_id) {
        throw metadata_error("Class " + meta.kind + " has a parent key provider and application-assigned"
                             " ids; use a generated id or a name so the key can be placed under its parent");
    }

    // Embedded columns are recognised by prefix alone, so no other property
    // stored on the record may carry one.
    auto starts_with = [](const std::string& s, const std::string& prefix) {
        return s.compare(0, prefix.size(), prefix) == 0;
    };
    for (const auto& prefix : prefixes) {
        for (const auto& other : prefixes) {
            if (other != prefix && starts_with(other, prefix)) {
                throw metadata_error("Class " + meta.kind + " embedded prefix " + other +
                                     " starts with embedded prefix " + prefix);
            }
        }
        for (const auto& f : meta.fields) {
            if (f.mapping == mapping_kind::embedded) continue;
            if (starts_with(f.key_property(), prefix)) {
                throw metadata_error("Field " + meta.kind + "." + f.name +
                                     " collides with embedded prefix " + prefix);
            }
        }
        if (starts_with(parent_key_marker, prefix)) {
            throw metadata_error("Class " + meta.kind + " embedded prefix " + prefix +
                                 " collides with the reserved parent key property");
        }
    }
}

// ============================================================================
// schema_registry
// ============================================================================

schema_registry& schema_registry::instance() {
    static schema_registry registry;
    return registry;
}

const class_metadata& schema_registry::register_class(class_metadata meta) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = classes_.find(meta.kind);
    if (it != classes_.end()) {
        return *it->second;
    }

    for (auto& f : meta.fields) {
        bind_field(meta, f);
    }
    validate_class(meta);

    if (log_enabled(log_level::debug)) {
        for (const auto& f : meta.fields) {
            if (f.kind == field_kind::scalar) continue;
            LOG_DEBUG("schema", "%s.%s -> %s/%s", meta.kind.c_str(), f.name.c_str(),
                      to_string(f.mapping), to_string(f.role));
        }
    }

    auto stored = std::make_unique<class_metadata>(std::move(meta));
    auto& ref = *stored;
    classes_.emplace(ref.kind, std::move(stored));
    return ref;
}

const class_metadata* schema_registry::find(const std::string& kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = classes_.find(kind);
    return it == classes_.end() ? nullptr : it->second.get();
}

const class_metadata& schema_registry::get(const std::string& kind) const {
    const class_metadata* meta = find(kind);
    if (!meta) {
        throw metadata_error("No metadata registered for kind " + kind);
    }
    return *meta;
}

std::vector<const class_metadata*> schema_registry::all_classes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<const class_metadata*> result;
    result.reserve(classes_.size());
    for (const auto& [_, meta] : classes_) {
        result.push_back(meta.get());
    }
    return result;
}

} // namespace kinship
