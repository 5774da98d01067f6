#pragma once

#include <atomic>
#include <cstdio>

#include <fmt/core.h>

namespace stratalog {

enum class log_level : int { off = 0, error = 1, warn = 2, info = 3, debug = 4 };

inline std::atomic<log_level> g_log_level{log_level::warn};

inline void set_log_level(log_level level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

inline log_level get_log_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

inline bool log_enabled(log_level level) {
    return static_cast<int>(level) <= static_cast<int>(get_log_level());
}

} // namespace stratalog

#define STRATALOG_LOG(level, tag, ...)                                         \
    do {                                                                       \
        if (::stratalog::log_enabled(level)) {                                 \
            fmt::print(stderr, "[{}] {}\n", tag, fmt::format(__VA_ARGS__));    \
        }                                                                      \
    } while (0)

#define STRATALOG_LOG_ERROR(tag, ...)                                          \
    STRATALOG_LOG(::stratalog::log_level::error, tag, __VA_ARGS__)
#define STRATALOG_LOG_WARN(tag, ...)                                           \
    STRATALOG_LOG(::stratalog::log_level::warn, tag, __VA_ARGS__)
#define STRATALOG_LOG_INFO(tag, ...)                                           \
    STRATALOG_LOG(::stratalog::log_level::info, tag, __VA_ARGS__)

#ifdef NDEBUG
#define STRATALOG_LOG_DEBUG(tag, ...) ((void)0)
#else
#define STRATALOG_LOG_DEBUG(tag, ...)                                          \
    STRATALOG_LOG(::stratalog::log_level::debug, tag, __VA_ARGS__)
#endif
