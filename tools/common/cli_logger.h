#pragma once

#include <algorithm>
#include <iostream>
#include <utility>

#include "console_unicode.h"

namespace lvbtools::log {

enum class VerbosityLevel : int { Quiet = 0, Verbose = 1, Debug = 2 };

inline VerbosityLevel current_level = VerbosityLevel::Quiet;

inline void set_verbosity(int level) {
    level = std::clamp(level, 0, 2);
    current_level = static_cast<VerbosityLevel>(level);
}

inline bool debug_enabled() { return current_level >= VerbosityLevel::Debug; }

constexpr const char* level_name(VerbosityLevel level) {
    switch (level) {
        case VerbosityLevel::Quiet: return "QUIET";
        case VerbosityLevel::Verbose: return "VERBOSE";
        case VerbosityLevel::Debug: return "DEBUG";
    }
    return "VERBOSE";
}

constexpr const char* level_emoji(VerbosityLevel level) {
    switch (level) {
        case VerbosityLevel::Quiet: return "🔇";
        case VerbosityLevel::Verbose: return "🔈";
        case VerbosityLevel::Debug: return "🐞";
    }
    return "🔈";
}

// Emoji tags only when stderr is a terminal that can show them; redirected
// logs stay ASCII.
inline bool supports_utf() {
    static const bool value = []() {
        auto caps = consoleu::detect_capabilities();
        return caps.stderr_is_tty && (caps.has_native_unicode_console || caps.utf8_configured);
    }();
    return value;
}

template <typename... Args>
void write_line(std::ostream& stream, Args&&... args) {
    if constexpr (sizeof...(Args) > 0) {
        ((stream << std::forward<Args>(args) << ' '), ...);
    }
    stream << '\n';
}

template <typename... Args>
void log_impl(VerbosityLevel min_level, Args&&... args) {
    if (current_level < min_level) return;
    auto& stream = std::cerr;
    if (supports_utf())
        stream << '[' << level_emoji(min_level) << "] ";
    else
        stream << '[' << level_name(min_level) << "] ";
    write_line(stream, std::forward<Args>(args)...);
}

template <typename... Args>
void info(Args&&... args) {
    log_impl(VerbosityLevel::Verbose, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(Args&&... args) {
    log_impl(VerbosityLevel::Debug, std::forward<Args>(args)...);
}

template <typename... Args>
void warn(Args&&... args) {
    auto& stream = std::cerr;
    stream << (supports_utf() ? "⚠️ " : "[WARN] ");
    write_line(stream, std::forward<Args>(args)...);
}

template <typename... Args>
void error(Args&&... args) {
    auto& stream = std::cerr;
    stream << (supports_utf() ? "❌ " : "[ERROR] ");
    write_line(stream, std::forward<Args>(args)...);
}

// print writes usage text to stderr so stdout carries only JSON.
template <typename... Args>
void print(Args&&... args) {
    write_line(std::cerr, std::forward<Args>(args)...);
}

} // namespace lvbtools::log

namespace lvbtools::cli {
    using namespace lvbtools::log;
}

#define LOGI(...) ::lvbtools::log::info(__VA_ARGS__)
#define LOGW(...) ::lvbtools::log::warn(__VA_ARGS__)
#define LOGE(...) ::lvbtools::log::error(__VA_ARGS__)

#if LVB_DEBUG
    #define LOGD(...) ::lvbtools::log::debug(__VA_ARGS__)
#else
    #define LOGD(...) do {} while(false)
#endif
