#pragma once

#ifdef __cplusplus

#include <cstdio>
#include <atomic>

namespace corelay {

enum class log_level : int {
    off = 0,
    error = 1,
    warn = 2,
    info = 3,
    debug = 4
};

/// Single global log level, defined in Corelay/src/corelay.cpp.
extern std::atomic<log_level> g_log_level;

inline void set_log_level(log_level level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

inline log_level get_log_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

inline bool log_enabled(log_level level) {
    return static_cast<int>(level) <= static_cast<int>(get_log_level());
}

constexpr const char* log_level_name(log_level level) {
    switch (level) {
        case log_level::error: return "error";
        case log_level::warn:  return "warn";
        case log_level::info:  return "info";
        case log_level::debug: return "debug";
        default:               return "off";
    }
}

}  // namespace corelay

#define CORELAY_LOG(level, tag, fmt, ...) \
    do { \
        if (corelay::log_enabled(level)) { \
            std::fprintf(stderr, "corelay %s [%s] " fmt "\n", corelay::log_level_name(level), tag, ##__VA_ARGS__); \
        } \
    } while(0)

#define LOG_ERROR(tag, fmt, ...) CORELAY_LOG(corelay::log_level::error, tag, fmt, ##__VA_ARGS__)
#define LOG_WARN(tag, fmt, ...)  CORELAY_LOG(corelay::log_level::warn, tag, fmt, ##__VA_ARGS__)
#define LOG_INFO(tag, fmt, ...)  CORELAY_LOG(corelay::log_level::info, tag, fmt, ##__VA_ARGS__)

#ifdef NDEBUG
#define LOG_DEBUG(tag, fmt, ...) ((void)0)
#else
#define LOG_DEBUG(tag, fmt, ...) CORELAY_LOG(corelay::log_level::debug, tag, fmt, ##__VA_ARGS__)
#endif

#endif // __cplusplus
