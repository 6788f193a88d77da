#pragma once

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/chrono.h>
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace tern::log {

/// Log level enumeration
enum class level {
    debug = 0,
    info = 1,
    warning = 2,
    error = 3,
    off = 4
};

constexpr const char* level_to_string(level lvl) noexcept {
    switch (lvl) {
        case level::debug:   return "DEBUG";
        case level::info:    return "INFO";
        case level::warning: return "WARN";
        case level::error:   return "ERROR";
        case level::off:     return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name as used by TERN_LOG_LEVEL ("debug", "info", "warn",
/// "warning", "error", "off"). Case-insensitive.
inline std::optional<level> parse_level(std::string_view name) noexcept {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower.push_back((c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c);
    }
    if (lower == "debug") return level::debug;
    if (lower == "info") return level::info;
    if (lower == "warn" || lower == "warning") return level::warning;
    if (lower == "error") return level::error;
    if (lower == "off" || lower == "none") return level::off;
    return std::nullopt;
}

/// Host-provided log sink. Receives the level, the source location and the
/// already formatted message.
using sink_fn = std::function<void(level, std::string_view file, int line, std::string_view msg)>;

/// Process-wide logger. Writes coloured lines to stderr unless a host sink
/// has been installed.
class logger {
public:
    static logger& instance() noexcept {
        static logger inst;
        return inst;
    }

    void set_level(level min_level) noexcept {
        min_level_.store(min_level, std::memory_order_relaxed);
    }

    level get_level() const noexcept {
        return min_level_.load(std::memory_order_relaxed);
    }

    bool enabled(level lvl) const noexcept {
        return lvl >= min_level_.load(std::memory_order_relaxed) && lvl != level::off;
    }

    /// Route log output to a host callback. Passing an empty function
    /// restores stderr output.
    void set_sink(sink_fn sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = std::move(sink);
    }

    template<typename... Args>
    void log(level lvl, const char* file, int line, fmt::format_string<Args...> fmt_str, Args&&... args) {
        if (!enabled(lvl)) {
            return;
        }

        auto msg = fmt::format(fmt_str, std::forward<Args>(args)...);
        std::string_view short_file = basename(file);

        std::lock_guard<std::mutex> lock(mutex_);
        if (sink_) {
            sink_(lvl, short_file, line, msg);
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        // [TIMESTAMP] [LEVEL] [tern] [file:line] message
        fmt::print(stderr,
            "{}[{:%Y-%m-%d %H:%M:%S}.{:03d}] [{}] [tern] [{}:{}] {}\033[0m\n",
            level_to_color(lvl),
            fmt::localtime(time),
            ms.count(),
            level_to_string(lvl),
            short_file,
            line,
            msg
        );
    }

private:
    logger() noexcept : min_level_(level::info) {}
    ~logger() = default;

    logger(const logger&) = delete;
    logger& operator=(const logger&) = delete;

    static constexpr const char* level_to_color(level lvl) noexcept {
        switch (lvl) {
            case level::debug:   return "\033[36m";
            case level::info:    return "\033[32m";
            case level::warning: return "\033[33m";
            case level::error:   return "\033[31m";
            default:             return "\033[0m";
        }
    }

    static std::string_view basename(const char* path) noexcept {
        std::string_view p(path);
        auto pos = p.find_last_of('/');
        return pos == std::string_view::npos ? p : p.substr(pos + 1);
    }

    std::atomic<level> min_level_;
    std::mutex mutex_;
    sink_fn sink_;
};

} // namespace tern::log
