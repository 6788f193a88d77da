#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace tern::http {

/// Opaque per-request value. Mirrors what a dynamically typed host can
/// hand over without a schema.
using ext_value = std::variant<std::monostate, bool, int64_t, double, std::string>;

/// Request/response extensions channel. Stages read the well-known keys
/// below and ignore the rest; unknown keys travel back untouched.
using extensions = std::map<std::string, ext_value, std::less<>>;

namespace ext {

// request side
inline constexpr std::string_view timeout = "timeout";                 ///< seconds (number > 0)
inline constexpr std::string_view connect_timeout = "timeout.connect";
inline constexpr std::string_view read_timeout = "timeout.read";
inline constexpr std::string_view write_timeout = "timeout.write";
inline constexpr std::string_view stream = "stream";                   ///< bool
inline constexpr std::string_view retry_max_attempts = "retry.max_attempts";
inline constexpr std::string_view retry_allow_non_idempotent = "retry.allow_non_idempotent";

// response side
inline constexpr std::string_view elapsed_ms = "elapsed_ms";
inline constexpr std::string_view attempts = "attempts";
inline constexpr std::string_view http_version = "http_version";
inline constexpr std::string_view trace_id = "trace_id";

} // namespace ext

inline const ext_value* find_ext(const extensions& e, std::string_view key) {
    auto it = e.find(key);
    return it == e.end() ? nullptr : &it->second;
}

/// bool, or an integer 0/1
inline std::optional<bool> ext_bool(const extensions& e, std::string_view key) {
    const ext_value* v = find_ext(e, key);
    if (!v) return std::nullopt;
    if (auto* b = std::get_if<bool>(v)) return *b;
    if (auto* i = std::get_if<int64_t>(v)) {
        if (*i == 0 || *i == 1) return *i == 1;
    }
    return std::nullopt;
}

inline std::optional<int64_t> ext_int(const extensions& e, std::string_view key) {
    const ext_value* v = find_ext(e, key);
    if (!v) return std::nullopt;
    if (auto* i = std::get_if<int64_t>(v)) return *i;
    if (auto* d = std::get_if<double>(v)) {
        if (*d == static_cast<double>(static_cast<int64_t>(*d))) return static_cast<int64_t>(*d);
    }
    return std::nullopt;
}

inline std::optional<double> ext_number(const extensions& e, std::string_view key) {
    const ext_value* v = find_ext(e, key);
    if (!v) return std::nullopt;
    if (auto* d = std::get_if<double>(v)) return *d;
    if (auto* i = std::get_if<int64_t>(v)) return static_cast<double>(*i);
    return std::nullopt;
}

inline std::chrono::milliseconds seconds_to_ms(double seconds) {
    return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0 + 0.5));
}

} // namespace tern::http
