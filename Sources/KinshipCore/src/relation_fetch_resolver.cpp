#include "kinship/relation_fetch_resolver.hpp"
#include "kinship/datastore.hpp"
#include "kinship/errors.hpp"
#include "kinship/inline_mapping.hpp"
#include "kinship/log.hpp"
#include <optional>

namespace kinship {

relation_fetch_resolver::relation_fetch_resolver(datastore& store, object_materializer& materializer,
                                                 bool strict_one_to_one)
    : store_(store), materializer_(materializer), strict_one_to_one_(strict_one_to_one) {}

related_value relation_fetch_resolver::resolve(const entity& owner, const class_metadata& meta,
                                               const field_metadata& field) {
    if (field.is_inline()) {
        if (auto obj = read_inline(owner, field)) {
            return obj;
        }
        return std::monostate{};
    }

    object_ptr result;
    switch (field.role) {
        case relation_role::parent_key_provider:
            result = lookup_parent(owner, meta, field);
            break;

        case relation_role::derived:
            if (field.kind == field_kind::object && field.is_one_to_one()) {
                result = lookup_one_to_one_child(owner.get_key(), field);
                break;
            }
            return materializer_.load_derived(owner, field);

        case relation_role::foreign_key_provider: {
            const property_value* stored = owner.property(field.key_property());
            if (stored) {
                if (const auto* k = std::get_if<key>(stored)) {
                    result = materializer_.load(*k);
                    if (!result) {
                        LOG_WARN("fetch", "%s.%s refers to missing %s", owner.get_key().to_string().c_str(),
                                 field.name.c_str(), k->to_string().c_str());
                    }
                }
            }
            break;
        }

        case relation_role::none:
            return materializer_.load_derived(owner, field);
    }

    if (result) {
        return result;
    }
    return std::monostate{};
}

object_ptr relation_fetch_resolver::lookup_parent(const entity& owner, const class_metadata& meta,
                                                  const field_metadata& field) {
    const key* parent = owner.parent();
    if (!parent) {
        const auto kinds = field.related_kinds();
        throw missing_parent_key_error(meta.kind + "." + field.name, meta.kind,
                                       kinds.empty() ? std::string() : kinds.front(), owner.get_key());
    }
    auto obj = materializer_.load(*parent);
    if (!obj) {
        throw object_not_found_error(*parent);
    }
    return obj;
}

object_ptr relation_fetch_resolver::lookup_one_to_one_child(const key& owner_key,
                                                            const field_metadata& field) {
    const std::vector<std::string> kinds = field.related_kinds();

    std::optional<entity> match;
    size_t direct_children = 0;

    for (const auto& kind : kinds) {
        store_.scan(kind, owner_key, [&](const entity& candidate) {
            const key* parent = candidate.parent();
            if (!parent || *parent != owner_key) {
                return true;
            }
            ++direct_children;
            if (!match) {
                match = candidate;
            }
            return strict_one_to_one_;
        });
        if (match && !strict_one_to_one_) {
            break;
        }
    }

    if (direct_children > 1) {
        throw kinship_error("Expected at most one " + field.name + " child of " +
                            owner_key.to_string() + " but found " + std::to_string(direct_children));
    }
    if (!match) {
        return nullptr;
    }
    return materializer_.materialize(*match);
}

} // namespace kinship
