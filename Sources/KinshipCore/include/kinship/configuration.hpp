#pragma once

#ifdef __cplusplus

#include "log.hpp"
#include <string>

namespace kinship {

struct configuration {
    /// Datastore file path. Use ":memory:" for an in-memory store.
    std::string path = ":memory:";

    /// Process-wide log level applied when a persistence_manager is created.
    log_level logging = log_level::off;

    /// When true, fetching the parent side of a one-to-one scans every
    /// descendant of the child kind and fails if more than one is a direct
    /// child. Otherwise the first direct child wins.
    bool strict_one_to_one = false;

    /// Delete owned descendants along with their parent.
    bool cascade_delete = true;

    configuration() = default;

    explicit configuration(const std::string& p) : path(p) {}

    configuration(const std::string& p, log_level level)
        : path(p), logging(level) {}
};

/// Reads a JSON object such as
///   {"path": "app.db", "log_level": "debug", "strict_one_to_one": true}
/// Unknown keys are ignored; values of the wrong type throw kinship_error.
configuration parse_configuration(const std::string& json_text);
configuration load_configuration(const std::string& file_path);

log_level parse_log_level(const std::string& name);

} // namespace kinship

#endif // __cplusplus
