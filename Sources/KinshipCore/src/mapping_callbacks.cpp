#include "kinship/mapping_callbacks.hpp"
#include "kinship/datastore.hpp"
#include "kinship/key_registry.hpp"
#include "kinship/log.hpp"
#include "kinship/parent_key_resolver.hpp"
#include "kinship/relation_writer.hpp"
#include <vector>

namespace kinship {

void owned_collection_callbacks::persist_elements(const mapping_context& ctx,
                                                  std::set<std::string>& kept_paths) {
    const auto* elements = std::get_if<object_list>(&ctx.value);
    if (!elements) {
        return;
    }

    for (const auto& element : *elements) {
        if (!element) continue;

        check_for_parent_switch(element.get(), ctx.owner_key, ctx.registry);

        // Already being inserted further up; it picks up this owner as its
        // ancestor on its own.
        if (ctx.registry.is_in_flight(element.get()) && !known_key(*element, ctx.registry)) {
            continue;
        }

        auto result = ctx.writer.persist_owned(*element, ctx.owner_key, ctx.registry);
        if (auto* k = std::get_if<key>(&result)) {
            kept_paths.insert(k->to_path());
        }
    }
}

bool owned_collection_callbacks::post_insert(const mapping_context& ctx) {
    std::set<std::string> kept;
    persist_elements(ctx, kept);
    LOG_DEBUG("callbacks", "%s.%s: stored %zu elements under %s", ctx.owner.kind().c_str(),
              ctx.field.name.c_str(), kept.size(), ctx.owner_key.to_string().c_str());
    return false;
}

bool owned_collection_callbacks::post_update(const mapping_context& ctx) {
    // A collection that was never loaded says nothing about the stored children.
    if (!ctx.owner.is_loaded(ctx.field.name)) {
        return false;
    }

    std::set<std::string> kept;
    persist_elements(ctx, kept);

    // Only the element kinds are candidates; other fields own the rest of
    // the owner's children.
    std::vector<key> orphans;
    for (const auto& kind : ctx.field.related_kinds()) {
        ctx.writer.store().scan(kind, ctx.owner_key, [&](const entity& child) {
            const key* parent = child.parent();
            if (parent && *parent == ctx.owner_key && !kept.count(child.get_key().to_path())) {
                orphans.push_back(child.get_key());
            }
            return true;
        });
    }

    for (const auto& orphan : orphans) {
        LOG_INFO("callbacks", "Removing %s, no longer in %s.%s", orphan.to_string().c_str(),
                 ctx.owner.kind().c_str(), ctx.field.name.c_str());
        ctx.writer.remove_owned(orphan);
    }
    return false;
}

void callback_registry::register_callbacks(const std::string& kind, const std::string& field,
                                           std::shared_ptr<mapping_callbacks> callbacks) {
    callbacks_[{kind, field}] = std::move(callbacks);
}

mapping_callbacks* callback_registry::find(const std::string& kind, const std::string& field) const {
    auto it = callbacks_.find({kind, field});
    return it == callbacks_.end() ? nullptr : it->second.get();
}

} // namespace kinship
