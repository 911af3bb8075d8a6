#pragma once

#include "stmap/core/macros.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>

// =============================================================================
// FILE: stmap/core/log.hpp
// BRIEF: Leveled stderr diagnostics
// =============================================================================
//
// Lines are written as "stmap LEVEL: message". The threshold starts at INFO,
// or at the value of STMAP_LOG_LEVEL (debug|info|warning|error|off) when set.
// =============================================================================

namespace stmap::log {

enum class Level : int {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3,
    OFF = 4
};

namespace detail {

inline Level level_from_env() noexcept {
    const char* env = std::getenv("STMAP_LOG_LEVEL");
    if (env == nullptr) return Level::INFO;
    if (std::strcmp(env, "debug") == 0) return Level::DEBUG;
    if (std::strcmp(env, "warning") == 0) return Level::WARNING;
    if (std::strcmp(env, "error") == 0) return Level::ERROR;
    if (std::strcmp(env, "off") == 0) return Level::OFF;
    return Level::INFO;
}

inline std::atomic<int>& threshold() noexcept {
    static std::atomic<int> value{static_cast<int>(level_from_env())};
    return value;
}

inline std::mutex& sink_mutex() noexcept {
    static std::mutex m;
    return m;
}

inline const char* level_name(Level level) noexcept {
    switch (level) {
        case Level::DEBUG:   return "DEBUG";
        case Level::INFO:    return "INFO";
        case Level::WARNING: return "WARNING";
        case Level::ERROR:   return "ERROR";
        default:             return "";
    }
}

} // namespace detail

inline void set_level(Level level) noexcept {
    detail::threshold().store(static_cast<int>(level), std::memory_order_relaxed);
}

inline Level get_level() noexcept {
    return static_cast<Level>(detail::threshold().load(std::memory_order_relaxed));
}

inline bool enabled(Level level) noexcept {
    return level != Level::OFF &&
           static_cast<int>(level) >= detail::threshold().load(std::memory_order_relaxed);
}

#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 2, 3)))
#endif
inline void write(Level level, const char* fmt, ...) {
    if (!enabled(level)) return;

    char buffer[1024];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    std::lock_guard<std::mutex> lock(detail::sink_mutex());
    std::fprintf(stderr, "stmap %s: %s\n", detail::level_name(level), buffer);
}

} // namespace stmap::log

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define STMAP_LOG_DEBUG(...)   ::stmap::log::write(::stmap::log::Level::DEBUG, __VA_ARGS__)
#define STMAP_LOG_INFO(...)    ::stmap::log::write(::stmap::log::Level::INFO, __VA_ARGS__)
#define STMAP_LOG_WARNING(...) ::stmap::log::write(::stmap::log::Level::WARNING, __VA_ARGS__)
#define STMAP_LOG_ERROR(...)   ::stmap::log::write(::stmap::log::Level::ERROR, __VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
