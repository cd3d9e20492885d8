#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace planetwalk::log {

enum class VerbosityLevel : int { Quiet = 0, Verbose = 1, Debug = 2 };

inline VerbosityLevel current_level = VerbosityLevel::Quiet;

// set_verbosity maps -v / -vv counts onto a level, clamped to Debug.
inline void set_verbosity(int level) {
    level = std::clamp(level, 0, 2);
    current_level = static_cast<VerbosityLevel>(level);
}

constexpr const char* level_name(VerbosityLevel level) {
    switch (level) {
        case VerbosityLevel::Quiet: return "QUIET";
        case VerbosityLevel::Verbose: return "INFO";
        case VerbosityLevel::Debug: return "DEBUG";
    }
    return "INFO";
}

template <typename... Args>
void write_line(std::ostream& stream, const char* tag, Args&&... args) {
    stream << '[' << tag << "] ";
    if constexpr (sizeof...(Args) > 0) {
        ((stream << std::forward<Args>(args) << ' '), ...);
    }
    stream << '\n';
}

template <typename... Args>
void log_impl(VerbosityLevel min_level, Args&&... args) {
    if (current_level < min_level) return;
    write_line(std::cerr, level_name(min_level), std::forward<Args>(args)...);
}

template <typename... Args>
void info(Args&&... args) {
    log_impl(VerbosityLevel::Verbose, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(Args&&... args) {
    log_impl(VerbosityLevel::Debug, std::forward<Args>(args)...);
}

// Warnings and errors are printed regardless of verbosity.
template <typename... Args>
void warn(Args&&... args) {
    write_line(std::cerr, "WARN", std::forward<Args>(args)...);
}

template <typename... Args>
void error(Args&&... args) {
    write_line(std::cerr, "ERROR", std::forward<Args>(args)...);
}

namespace detail {

inline std::mutex rate_mutex;
inline std::unordered_map<uint64_t, std::chrono::steady_clock::time_point> rate_timestamps;

inline bool should_log_rate(uint64_t key, uint32_t ms) {
    auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(rate_mutex);
    auto it = rate_timestamps.find(key);
    if (it == rate_timestamps.end() ||
        std::chrono::duration_cast<std::chrono::milliseconds>(now - it->second).count() >= ms) {
        rate_timestamps[key] = now;
        return true;
    }
    return false;
}

constexpr uint64_t location_key(const char* file, int line) {
    uint64_t hash = 14695981039346656037ull;
    for (size_t i = 0; file[i] != '\0'; ++i) {
        hash ^= static_cast<uint64_t>(static_cast<unsigned char>(file[i]));
        hash *= 1099511628211ull;
    }
    hash ^= static_cast<uint64_t>(line);
    hash *= 1099511628211ull;
    return hash;
}

} // namespace detail

} // namespace planetwalk::log

#define LOGI(...) ::planetwalk::log::info(__VA_ARGS__)
#define LOGW(...) ::planetwalk::log::warn(__VA_ARGS__)
#define LOGE(...) ::planetwalk::log::error(__VA_ARGS__)

// Per-frame conditions: at most one line per call site every `ms` milliseconds.
#define LOGW_RATE_LIMIT(ms, ...) \
    do { \
        constexpr uint64_t _loc_key = ::planetwalk::log::detail::location_key(__FILE__, __LINE__); \
        if (::planetwalk::log::detail::should_log_rate(_loc_key, ms)) { \
            ::planetwalk::log::warn(__VA_ARGS__); \
        } \
    } while (false)

#if PLANETWALK_DEBUG
    #define LOGD(...) ::planetwalk::log::debug(__VA_ARGS__)
#else
    #define LOGD(...) do {} while(false)
#endif
