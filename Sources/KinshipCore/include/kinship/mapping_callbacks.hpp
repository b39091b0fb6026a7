#pragma once

#ifdef __cplusplus

#include "key.hpp"
#include "object.hpp"
#include "schema.hpp"
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>

namespace kinship {

class key_registry;
class relation_writer;

/// Everything a callback needs to act on one field of one stored owner.
struct mapping_context {
    persistent_object& owner;
    const key& owner_key;
    const field_metadata& field;
    const related_value& value;
    relation_writer& writer;
    key_registry& registry;
};

// ============================================================================
// mapping_callbacks - post-write hooks for plain (non-reference) mappings
// ============================================================================

class mapping_callbacks {
public:
    virtual ~mapping_callbacks() = default;

    /// Called once the owner's record has its final key after an insert.
    /// Returns true if the owner's record must be rewritten.
    virtual bool post_insert(const mapping_context& ctx) = 0;
    virtual bool post_update(const mapping_context& ctx) = 0;
};

/// Writes collection elements as children of the owner. On update, direct
/// children of the element kind that left the collection are deleted.
class owned_collection_callbacks : public mapping_callbacks {
public:
    bool post_insert(const mapping_context& ctx) override;
    bool post_update(const mapping_context& ctx) override;

private:
    void persist_elements(const mapping_context& ctx, std::set<std::string>& kept_paths);
};

class callback_registry {
public:
    void register_callbacks(const std::string& kind, const std::string& field,
                            std::shared_ptr<mapping_callbacks> callbacks);

    /// nullptr if nothing is registered for the field.
    mapping_callbacks* find(const std::string& kind, const std::string& field) const;

private:
    std::map<std::pair<std::string, std::string>, std::shared_ptr<mapping_callbacks>> callbacks_;
};

} // namespace kinship

#endif // __cplusplus
