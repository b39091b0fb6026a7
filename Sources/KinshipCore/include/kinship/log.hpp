#pragma once

#ifdef __cplusplus

#include <atomic>
#include <cstdio>

namespace kinship {

enum class log_level : int {
    off = 0,
    error = 1,
    warn = 2,
    info = 3,
    debug = 4
};

/// Process-wide level, set from configuration::logging when a
/// persistence_manager is created. Defined in persistence_manager.cpp.
extern std::atomic<log_level> g_log_level;

inline void set_log_level(log_level level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

inline log_level get_log_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

/// Guard for work done only to produce log output.
inline bool log_enabled(log_level level) {
    return level != log_level::off &&
           static_cast<int>(level) <= static_cast<int>(get_log_level());
}

inline const char* log_level_label(log_level level) {
    switch (level) {
        case log_level::error: return "E";
        case log_level::warn:  return "W";
        case log_level::info:  return "I";
        case log_level::debug: return "D";
        case log_level::off:   break;
    }
    return "-";
}

}  // namespace kinship

// Writes "kinship[<level>/<tag>] message" to stderr.
#define KINSHIP_LOG(level, tag, fmt, ...) \
    do { \
        if (kinship::log_enabled(level)) { \
            std::fprintf(stderr, "kinship[%s/%s] " fmt "\n", kinship::log_level_label(level), tag, ##__VA_ARGS__); \
        } \
    } while(0)

#define LOG_ERROR(tag, fmt, ...) KINSHIP_LOG(kinship::log_level::error, tag, fmt, ##__VA_ARGS__)
#define LOG_WARN(tag, fmt, ...)  KINSHIP_LOG(kinship::log_level::warn, tag, fmt, ##__VA_ARGS__)
#define LOG_INFO(tag, fmt, ...)  KINSHIP_LOG(kinship::log_level::info, tag, fmt, ##__VA_ARGS__)

#ifdef NDEBUG
#define LOG_DEBUG(tag, fmt, ...) ((void)0)
#else
#define LOG_DEBUG(tag, fmt, ...) KINSHIP_LOG(kinship::log_level::debug, tag, fmt, ##__VA_ARGS__)
#endif

#endif // __cplusplus
