#include "kinship/key_registry.hpp"
#include "kinship/parent_key_resolver.hpp"

namespace kinship {

void key_registry::register_key(const persistent_object* obj, const key& k) {
    keys_.insert_or_assign(obj, k);
}

std::optional<key> key_registry::key_for(const persistent_object* obj) const {
    auto it = keys_.find(obj);
    if (it == keys_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<key> key_registry::stored_keys() const {
    std::vector<key> result;
    result.reserve(keys_.size());
    for (const auto& [_, k] : keys_) {
        result.push_back(k);
    }
    return result;
}

void key_registry::rebase(const key& old_root, const key& new_root) {
    for (auto& [_, k] : keys_) {
        if (auto moved = rebase_key(k, old_root, new_root)) {
            k = *moved;
        }
    }
}

void key_registry::register_pending_patch(const persistent_object* related, pending_patch patch) {
    pending_[related].push_back(patch);
}

std::vector<pending_patch> key_registry::take_pending_patches(const persistent_object* related) {
    auto it = pending_.find(related);
    if (it == pending_.end()) {
        return {};
    }
    auto patches = std::move(it->second);
    pending_.erase(it);
    return patches;
}

size_t key_registry::pending_patch_count() const {
    size_t n = 0;
    for (const auto& [_, patches] : pending_) {
        n += patches.size();
    }
    return n;
}

} // namespace kinship
