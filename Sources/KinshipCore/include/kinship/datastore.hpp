#pragma once

#ifdef __cplusplus

#include "entity.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace kinship {

// ============================================================================
// datastore - hierarchical, ancestor-keyed record store
// ============================================================================

class datastore {
public:
    virtual ~datastore() = default;

    /// Writes the record. An incomplete key is completed with an id allocated
    /// for its kind and written back into `record`. Returns the final key.
    virtual key put(entity& record) = 0;

    virtual std::optional<entity> get(const key& k) = 0;

    /// Visits records of `kind` (every kind if empty) whose key is `ancestor`
    /// or descends from it, in key path order. Stops when `visit` returns false.
    virtual void scan(const std::string& kind, const key& ancestor,
                      const std::function<bool(const entity&)>& visit) = 0;

    /// Returns true if a record was removed.
    virtual bool remove(const key& k) = 0;

    std::vector<entity> query(const std::string& kind, const key& ancestor) {
        std::vector<entity> results;
        scan(kind, ancestor, [&](const entity& e) {
            results.push_back(e);
            return true;
        });
        return results;
    }
};

} // namespace kinship

#endif // __cplusplus
