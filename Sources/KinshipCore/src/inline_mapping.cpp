#include "kinship/inline_mapping.hpp"
#include "kinship/errors.hpp"
#include <nlohmann/json.hpp>
#include <vector>

namespace kinship {

using json = nlohmann::json;

namespace {

bool has_prefix(const std::string& s, const std::string& prefix) {
    return s.size() > prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool write_embedded(entity& owner, const field_metadata& field, const persistent_object* value) {
    const std::string& prefix = field.embedded_prefix;
    bool changed = false;

    std::vector<std::string> stale;
    for (const auto& [name, _] : owner.properties()) {
        if (!has_prefix(name, prefix)) continue;
        if (!value || !value->get(name.substr(prefix.size()))) {
            stale.push_back(name);
        }
    }
    for (const auto& name : stale) {
        changed |= owner.remove_property(name);
    }

    if (value) {
        for (const auto& [name, v] : value->scalars()) {
            changed |= owner.set_property(prefix + name, v);
        }
    }
    return changed;
}

object_ptr read_embedded(const entity& owner, const field_metadata& field) {
    object_ptr result;
    for (const auto& [name, v] : owner.properties()) {
        if (!has_prefix(name, field.embedded_prefix)) continue;
        if (!result) {
            result = persistent_object::make(field.target_kind);
        }
        result->set(name.substr(field.embedded_prefix.size()), v);
    }
    return result;
}

bool write_serialized(entity& owner, const field_metadata& field, const persistent_object* value) {
    if (!value) {
        return owner.remove_property(field.name);
    }
    json doc = {
        {"kind", value->kind()},
        {"fields", json::parse(properties_to_json(value->scalars()))}
    };
    return owner.set_property(field.name, doc.dump());
}

object_ptr read_serialized(const entity& owner, const field_metadata& field) {
    const property_value* stored = owner.property(field.name);
    if (!stored || std::holds_alternative<std::nullptr_t>(*stored)) {
        return nullptr;
    }
    const auto* text = std::get_if<std::string>(stored);
    if (!text) {
        throw kinship_error("Serialized field " + field.name + " on " +
                            owner.get_key().to_string() + " is not a string");
    }

    json doc;
    try {
        doc = json::parse(*text);
    } catch (const json::parse_error& e) {
        throw kinship_error("Serialized field " + field.name + " is corrupt: " + e.what());
    }
    if (!doc.is_object() || !doc.contains("kind") || !doc.contains("fields")) {
        throw kinship_error("Serialized field " + field.name + " is missing kind or fields");
    }

    auto result = persistent_object::make(doc["kind"].get<std::string>());
    for (auto& [name, v] : properties_from_json(doc["fields"].dump())) {
        result->set(name, std::move(v));
    }
    return result;
}

} // namespace

bool write_inline(entity& owner, const field_metadata& field, const persistent_object* value) {
    switch (field.mapping) {
        case mapping_kind::embedded:
            return write_embedded(owner, field, value);
        case mapping_kind::serialized:
            return write_serialized(owner, field, value);
        default:
            throw kinship_error("Field " + field.name + " is not an inline mapping");
    }
}

object_ptr read_inline(const entity& owner, const field_metadata& field) {
    object_ptr result;
    switch (field.mapping) {
        case mapping_kind::embedded:
            result = read_embedded(owner, field);
            break;
        case mapping_kind::serialized:
            result = read_serialized(owner, field);
            break;
        default:
            throw kinship_error("Field " + field.name + " is not an inline mapping");
    }
    if (result) {
        result->set_state(object_state::persistent_clean);
    }
    return result;
}

} // namespace kinship
