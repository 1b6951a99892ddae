#pragma once

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/chrono.h>
#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <chrono>
#include <optional>
#include <string_view>

namespace h2bridge::log {

/// Log level enumeration
enum class level {
    debug = 0,
    info = 1,
    warning = 2,
    error = 3,
    off = 4
};

/// Convert log level to string
constexpr const char* level_to_string(level lvl) noexcept {
    switch (lvl) {
        case level::debug:   return "DEBUG";
        case level::info:    return "INFO";
        case level::warning: return "WARN";
        case level::error:   return "ERROR";
        case level::off:     return "OFF";
        default:             return "UNKNOWN";
    }
}

/// Parse a level name as accepted in H2BRIDGE_LOG_LEVEL
inline std::optional<level> level_from_string(std::string_view name) noexcept {
    if (name == "debug")   return level::debug;
    if (name == "info")    return level::info;
    if (name == "warning" || name == "warn") return level::warning;
    if (name == "error")   return level::error;
    if (name == "off")     return level::off;
    return std::nullopt;
}

/// Convert log level to ANSI color code
constexpr const char* level_to_color(level lvl) noexcept {
    switch (lvl) {
        case level::debug:   return "\033[36m";  // Cyan
        case level::info:    return "\033[32m";  // Green
        case level::warning: return "\033[33m";  // Yellow
        case level::error:   return "\033[31m";  // Red
        default:             return "\033[0m";   // Reset
    }
}

/// Process-wide logger.
///
/// The adapter is a library, so the default threshold is `warning`: pool and
/// TLS context churn is reported at info/debug and stays quiet unless the
/// embedding application (or H2BRIDGE_LOG_LEVEL) asks for it.
class logger {
public:
    /// Get singleton instance
    static logger& instance() noexcept {
        static logger inst;
        return inst;
    }

    /// Set minimum log level
    void set_level(level min_level) noexcept {
        min_level_.store(min_level, std::memory_order_relaxed);
    }

    /// Get current minimum log level
    level get_level() const noexcept {
        return min_level_.load(std::memory_order_relaxed);
    }

    /// Check whether a message at `lvl` would be written
    bool enabled(level lvl) const noexcept {
        return lvl != level::off && lvl >= min_level_.load(std::memory_order_relaxed);
    }

    /// Redirect output (stderr by default). The stream is not owned.
    void set_output(std::FILE* out) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = out ? out : stderr;
        colored_ = (out_ == stderr);
    }

    /// Log a message with formatting
    template<typename... Args>
    void log(level lvl, const char* file, int line, fmt::format_string<Args...> fmt_str, Args&&... args) {
        if (!enabled(lvl)) {
            return;
        }

        auto msg = fmt::format(fmt_str, std::forward<Args>(args)...);

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::lock_guard<std::mutex> lock(mutex_);

        // Format: [TIMESTAMP] [LEVEL] [file:line] message
        fmt::print(out_,
            "{}[{:%Y-%m-%d %H:%M:%S}.{:03d}] [{}] [{}:{}] {}{}\n",
            colored_ ? level_to_color(lvl) : "",
            fmt::localtime(time),
            ms.count(),
            level_to_string(lvl),
            file,
            line,
            msg,
            colored_ ? "\033[0m" : ""
        );
        std::fflush(out_);
    }

private:
    logger() noexcept : min_level_(level::warning) {
        if (const char* env = std::getenv("H2BRIDGE_LOG_LEVEL")) {
            if (auto lvl = level_from_string(env)) {
                min_level_.store(*lvl, std::memory_order_relaxed);
            }
        }
    }
    ~logger() = default;

    logger(const logger&) = delete;
    logger& operator=(const logger&) = delete;

    std::atomic<level> min_level_;
    std::mutex mutex_;  // Protect concurrent writes to the output stream
    std::FILE* out_ = stderr;
    bool colored_ = true;
};

} // namespace h2bridge::log
