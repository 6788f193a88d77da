#pragma once

#include <tern/errors/error.hpp>
#include <tern/log/logger.hpp>
#include <tern/pipeline/context.hpp>
#include <tern/version.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace tern::config {

/// Settings of the shared client. Read once when the client is created.
struct client_config {
    size_t pool_max_idle_per_host = 64;
    std::chrono::milliseconds pool_idle_timeout{90000};
    pipeline::timeouts timeouts;
    pipeline::retry_policy retry;
    std::string tls_backend = "openssl";
    bool verify_certificates = true;
    std::string ca_file;
    bool http2 = true;
    bool http2_prior_knowledge = false;
    std::string user_agent = std::string("tern/") + std::string(version_string);
    size_t worker_threads = std::max<size_t>(2, std::thread::hardware_concurrency());
    log::level log_level = log::level::warning;
    /// Serve streamed bodies through the prefetching bridge
    bool prefetch_streams = false;

    /// Reject settings the client cannot honour
    errors::result<void> validate() const {
        if (tls_backend != "openssl") {
            return std::unexpected(errors::invalid_request("tls_backend",
                fmt::format("unsupported TLS backend '{}'", tls_backend)));
        }
        if (timeouts.total.count() <= 0) {
            return std::unexpected(errors::invalid_request("timeout", "timeout must be positive"));
        }
        if (retry.max_attempts == 0) {
            return std::unexpected(errors::invalid_request("retry", "retry.max_attempts must be at least 1"));
        }
        if (worker_threads == 0) {
            return std::unexpected(errors::invalid_request("worker_threads", "at least one worker is required"));
        }
        return {};
    }
};

namespace detail {

inline std::optional<std::string_view> env(const char* name) {
    const char* v = std::getenv(name);
    if (!v || !*v) return std::nullopt;
    return std::string_view(v);
}

inline errors::error bad_env(const char* name, std::string_view value, std::string_view expected) {
    return errors::invalid_request(name, fmt::format("{}='{}': expected {}", name, value, expected));
}

inline std::optional<int64_t> parse_int(std::string_view s) {
    int64_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return v;
}

inline std::optional<double> parse_seconds(std::string_view s) {
    std::string copy(s);
    char* end = nullptr;
    double v = std::strtod(copy.c_str(), &end);
    if (end != copy.c_str() + copy.size() || !(v > 0)) return std::nullopt;
    return v;
}

inline std::optional<bool> parse_bool(std::string_view s) {
    std::string lower(s);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;
    return std::nullopt;
}

inline std::chrono::milliseconds to_ms(double seconds) {
    return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0 + 0.5));
}

} // namespace detail

/// Overlay TERN_* environment variables on `base`.
///
/// Durations are in seconds (fractions allowed) except the retry backoffs,
/// which are in milliseconds. TERN_RETRY_STATUSES is a comma separated
/// list of status codes.
inline errors::result<client_config> load_from_env(client_config base = {}) {
    using detail::bad_env;
    using detail::env;

    if (auto v = env("TERN_POOL_MAX_IDLE_PER_HOST")) {
        auto n = detail::parse_int(*v);
        if (!n || *n < 0) return std::unexpected(bad_env("TERN_POOL_MAX_IDLE_PER_HOST", *v, "a count"));
        base.pool_max_idle_per_host = static_cast<size_t>(*n);
    }
    if (auto v = env("TERN_POOL_IDLE_TIMEOUT")) {
        auto s = detail::parse_seconds(*v);
        if (!s) return std::unexpected(bad_env("TERN_POOL_IDLE_TIMEOUT", *v, "seconds"));
        base.pool_idle_timeout = detail::to_ms(*s);
    }
    if (auto v = env("TERN_TIMEOUT")) {
        auto s = detail::parse_seconds(*v);
        if (!s) return std::unexpected(bad_env("TERN_TIMEOUT", *v, "seconds"));
        base.timeouts.total = detail::to_ms(*s);
    }
    struct phase_var { const char* name; std::optional<std::chrono::milliseconds>* slot; };
    for (auto [name, slot] : {phase_var{"TERN_CONNECT_TIMEOUT", &base.timeouts.connect},
                              phase_var{"TERN_READ_TIMEOUT", &base.timeouts.read},
                              phase_var{"TERN_WRITE_TIMEOUT", &base.timeouts.write}}) {
        if (auto v = env(name)) {
            auto s = detail::parse_seconds(*v);
            if (!s) return std::unexpected(bad_env(name, *v, "seconds"));
            *slot = detail::to_ms(*s);
        }
    }
    if (auto v = env("TERN_RETRY_MAX_ATTEMPTS")) {
        auto n = detail::parse_int(*v);
        if (!n || *n < 1) return std::unexpected(bad_env("TERN_RETRY_MAX_ATTEMPTS", *v, "an integer >= 1"));
        base.retry.max_attempts = static_cast<uint32_t>(*n);
    }
    if (auto v = env("TERN_RETRY_BASE_BACKOFF_MS")) {
        auto n = detail::parse_int(*v);
        if (!n || *n < 0) return std::unexpected(bad_env("TERN_RETRY_BASE_BACKOFF_MS", *v, "milliseconds"));
        base.retry.base_backoff = std::chrono::milliseconds(*n);
    }
    if (auto v = env("TERN_RETRY_MAX_BACKOFF_MS")) {
        auto n = detail::parse_int(*v);
        if (!n || *n < 0) return std::unexpected(bad_env("TERN_RETRY_MAX_BACKOFF_MS", *v, "milliseconds"));
        base.retry.max_backoff = std::chrono::milliseconds(*n);
    }
    if (auto v = env("TERN_RETRY_STATUSES")) {
        std::vector<int> statuses;
        std::string_view rest = *v;
        while (!rest.empty()) {
            auto comma = rest.find(',');
            auto item = rest.substr(0, comma);
            while (!item.empty() && item.front() == ' ') item.remove_prefix(1);
            while (!item.empty() && item.back() == ' ') item.remove_suffix(1);
            auto code = detail::parse_int(item);
            if (!code || *code < 100 || *code > 599) {
                return std::unexpected(bad_env("TERN_RETRY_STATUSES", *v, "comma separated status codes"));
            }
            statuses.push_back(static_cast<int>(*code));
            rest = comma == std::string_view::npos ? std::string_view{} : rest.substr(comma + 1);
        }
        base.retry.retry_statuses = std::move(statuses);
    }
    if (auto v = env("TERN_TLS_BACKEND")) {
        base.tls_backend = std::string(*v);
    }
    if (auto v = env("TERN_CA_FILE")) {
        base.ca_file = std::string(*v);
    }
    if (auto v = env("TERN_USER_AGENT")) {
        base.user_agent = std::string(*v);
    }
    struct bool_var { const char* name; bool* slot; };
    for (auto [name, slot] : {bool_var{"TERN_VERIFY_CERTIFICATES", &base.verify_certificates},
                              bool_var{"TERN_HTTP2", &base.http2},
                              bool_var{"TERN_HTTP2_PRIOR_KNOWLEDGE", &base.http2_prior_knowledge},
                              bool_var{"TERN_PREFETCH_STREAMS", &base.prefetch_streams}}) {
        if (auto v = env(name)) {
            auto b = detail::parse_bool(*v);
            if (!b) return std::unexpected(bad_env(name, *v, "a boolean"));
            *slot = *b;
        }
    }
    if (auto v = env("TERN_WORKER_THREADS")) {
        auto n = detail::parse_int(*v);
        if (!n || *n < 1) return std::unexpected(bad_env("TERN_WORKER_THREADS", *v, "an integer >= 1"));
        base.worker_threads = static_cast<size_t>(*n);
    }
    if (auto v = env("TERN_LOG_LEVEL")) {
        auto lvl = log::parse_level(*v);
        if (!lvl) return std::unexpected(bad_env("TERN_LOG_LEVEL", *v, "debug, info, warn, error or off"));
        base.log_level = *lvl;
    }
    return base;
}

} // namespace tern::config
