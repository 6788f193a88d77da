#pragma once

#include <tern/log/logger.hpp>

#include <fmt/format.h>
#include <openssl/rand.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tern::observe {

using trace_id = std::array<uint8_t, 16>;
using span_id = std::array<uint8_t, 8>;

namespace detail {

template<size_t N>
std::string to_hex(const std::array<uint8_t, N>& bytes) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out(N * 2, '0');
    for (size_t i = 0; i < N; ++i) {
        out[2 * i] = digits[bytes[i] >> 4];
        out[2 * i + 1] = digits[bytes[i] & 0x0f];
    }
    return out;
}

inline int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;  // traceparent is lower-case only
}

template<size_t N>
bool from_hex(std::string_view text, std::array<uint8_t, N>& out) {
    if (text.size() != N * 2) return false;
    for (size_t i = 0; i < N; ++i) {
        int hi = hex_value(text[2 * i]);
        int lo = hex_value(text[2 * i + 1]);
        if (hi < 0 || lo < 0) return false;
        out[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return true;
}

template<size_t N>
bool all_zero(const std::array<uint8_t, N>& bytes) noexcept {
    for (auto b : bytes) {
        if (b != 0) return false;
    }
    return true;
}

/// Random non-zero id from the OpenSSL CSPRNG
template<size_t N>
std::array<uint8_t, N> random_id() {
    std::array<uint8_t, N> id{};
    do {
        if (RAND_bytes(id.data(), static_cast<int>(N)) != 1) {
            thread_local std::mt19937_64 fallback{std::random_device{}()};
            for (auto& b : id) b = static_cast<uint8_t>(fallback());
        }
    } while (all_zero(id));
    return id;
}

} // namespace detail

/// W3C trace context (traceparent header, version 00)
struct trace_context {
    observe::trace_id trace{};
    observe::span_id span{};
    uint8_t flags = 0x01;   ///< sampled

    /// "00-<32 hex>-<16 hex>-<2 hex>"; all-zero ids are invalid
    static std::optional<trace_context> parse(std::string_view header) {
        while (!header.empty() && (header.front() == ' ' || header.front() == '\t')) header.remove_prefix(1);
        while (!header.empty() && (header.back() == ' ' || header.back() == '\t')) header.remove_suffix(1);
        if (header.size() < 55 || header[2] != '-' || header[35] != '-' || header[52] != '-') {
            return std::nullopt;
        }
        std::array<uint8_t, 1> version{};
        if (!detail::from_hex(header.substr(0, 2), version) || version[0] == 0xff) {
            return std::nullopt;
        }
        if (version[0] == 0 && header.size() != 55) {
            return std::nullopt;
        }
        trace_context ctx;
        std::array<uint8_t, 1> flags{};
        if (!detail::from_hex(header.substr(3, 32), ctx.trace) ||
            !detail::from_hex(header.substr(36, 16), ctx.span) ||
            !detail::from_hex(header.substr(53, 2), flags)) {
            return std::nullopt;
        }
        if (detail::all_zero(ctx.trace) || detail::all_zero(ctx.span)) {
            return std::nullopt;
        }
        ctx.flags = flags[0];
        return ctx;
    }

    std::string traceparent() const {
        return fmt::format("00-{}-{}-{:02x}", detail::to_hex(trace), detail::to_hex(span), flags);
    }

    std::string trace_id_hex() const { return detail::to_hex(trace); }
    std::string span_id_hex() const { return detail::to_hex(span); }
};

enum class span_status {
    unset,
    ok,
    error
};

constexpr std::string_view span_status_name(span_status s) noexcept {
    switch (s) {
        case span_status::unset: return "unset";
        case span_status::ok:    return "ok";
        case span_status::error: return "error";
    }
    return "unset";
}

/// A finished or in-progress unit of work
struct span {
    std::string name;
    trace_context context;
    std::optional<span_id> parent;
    std::chrono::system_clock::time_point start;
    std::chrono::system_clock::time_point end;
    span_status status = span_status::unset;
    std::string status_message;
    std::vector<std::pair<std::string, std::string>> attributes;

    bool valid() const noexcept { return !detail::all_zero(context.trace); }

    void set_attribute(std::string key, std::string value) {
        attributes.emplace_back(std::move(key), std::move(value));
    }

    std::chrono::microseconds duration() const {
        return std::chrono::duration_cast<std::chrono::microseconds>(end - start);
    }
};

/// Receives every span when it ends. Called from engine threads.
class trace_sink {
public:
    virtual ~trace_sink() = default;
    virtual void on_span_end(const span& s) = 0;
};

/// Default sink: one debug-level log line per span. Goes through the
/// logger directly so the runtime log level decides, not TERN_DEBUG.
class log_trace_sink : public trace_sink {
public:
    void on_span_end(const span& s) override {
        auto& logger = log::logger::instance();
        if (!logger.enabled(log::level::debug)) {
            return;
        }
        logger.log(log::level::debug, __FILE__, __LINE__,
                   "span {} trace={} span={} parent={} status={} duration={}us{}",
                   s.name, s.context.trace_id_hex(), s.context.span_id_hex(),
                   s.parent ? detail::to_hex(*s.parent) : std::string("-"),
                   span_status_name(s.status), s.duration().count(),
                   s.status_message.empty() ? std::string() : " (" + s.status_message + ")");
    }
};

/// Creates spans and hands finished ones to the sink
class tracer {
public:
    explicit tracer(std::shared_ptr<trace_sink> sink = std::make_shared<log_trace_sink>())
        : sink_(std::move(sink)) {}

    /// Root span of a request. Continues `incoming` (the caller's
    /// traceparent) when given, otherwise starts a new trace.
    span start_root(std::string name, const std::optional<trace_context>& incoming = std::nullopt) const {
        span s;
        s.name = std::move(name);
        s.start = std::chrono::system_clock::now();
        if (incoming) {
            s.context.trace = incoming->trace;
            s.context.flags = incoming->flags;
            s.parent = incoming->span;
        } else {
            s.context.trace = detail::random_id<16>();
        }
        s.context.span = detail::random_id<8>();
        return s;
    }

    span start_child(const span& parent, std::string name) const {
        span s;
        s.name = std::move(name);
        s.start = std::chrono::system_clock::now();
        s.context.trace = parent.context.trace;
        s.context.flags = parent.context.flags;
        s.context.span = detail::random_id<8>();
        s.parent = parent.context.span;
        return s;
    }

    void end(span& s, span_status status, std::string message = {}) const {
        s.end = std::chrono::system_clock::now();
        s.status = status;
        s.status_message = std::move(message);
        if (sink_) {
            sink_->on_span_end(s);
        }
    }

    const std::shared_ptr<trace_sink>& sink() const noexcept { return sink_; }

private:
    std::shared_ptr<trace_sink> sink_;
};

} // namespace tern::observe
