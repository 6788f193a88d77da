#pragma once

#include <tern/bridge/byte_stream.hpp>
#include <tern/bridge/foreign.hpp>
#include <tern/bridge/prefetch_stream.hpp>
#include <tern/coro/cancel_token.hpp>
#include <tern/coro/task.hpp>
#include <tern/errors/error.hpp>
#include <tern/http/extensions.hpp>
#include <tern/http/http_common.hpp>
#include <tern/http/request.hpp>
#include <tern/http/response.hpp>
#include <tern/runtime/scheduler.hpp>

#include <fmt/format.h>

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace tern::bridge {

/// How the response body reaches the host
enum class response_mode {
    buffered,    ///< read fully before completion, exposed as `content`
    streaming,   ///< pulled on demand through byte_stream
    prefetch     ///< forwarded ahead into a bounded buffer
};

struct marshal_options {
    std::string user_agent;
    /// Serve `stream` requests through prefetch_stream instead of byte_stream
    bool prefetch = false;
    size_t prefetch_capacity = prefetch_stream::default_capacity;
};

/// Conversion between the host's loose request/response shapes and the
/// typed descriptors. Only cheap, non-blocking work happens in
/// to_descriptor().
class marshal {
public:
    marshal(runtime::scheduler& sched, marshal_options opts)
        : sched_(sched), opts_(std::move(opts)) {}

    const marshal_options& options() const noexcept { return opts_; }

    errors::result<http::request_descriptor> to_descriptor(foreign_request in) const {
        http::request_descriptor out;

        auto m = http::method::parse(in.method);
        if (!m) {
            return std::unexpected(errors::invalid_request("method", fmt::format("invalid HTTP method: '{}'", in.method)));
        }
        out.method = std::move(*m);

        auto u = http::url::parse(in.url);
        if (!u) {
            return std::unexpected(errors::invalid_request("url", fmt::format("'{}' is not an absolute http(s) URL", in.url)));
        }
        out.target = std::move(*u);

        if (auto h = copy_headers(in.headers, out.headers); !h) {
            return std::unexpected(std::move(h.error()));
        }
        if (!opts_.user_agent.empty() && !out.headers.contains("User-Agent")) {
            out.headers.add("User-Agent", opts_.user_agent);
        }

        if (auto e = check_extensions(in.extensions); !e) {
            return std::unexpected(std::move(e.error()));
        }
        out.extensions = std::move(in.extensions);

        out.body = std::visit([](auto& b) -> http::request_body {
            using B = std::decay_t<decltype(b)>;
            if constexpr (std::is_same_v<B, std::monostate>) {
                return {};
            } else if constexpr (std::is_same_v<B, std::string>) {
                return http::request_body::from_bytes(std::move(b));
            } else if constexpr (std::is_same_v<B, std::vector<std::string>>) {
                return http::request_body::from_producer(std::make_shared<http::chunk_list_producer>(std::move(b)));
            } else {
                if (!b) return {};
                return http::request_body::from_producer(std::make_shared<http::function_producer>(std::move(b)));
            }
        }, in.body);
        return out;
    }

    response_mode mode_for(const http::extensions& ext) const {
        if (!http::ext_bool(ext, http::ext::stream).value_or(false)) {
            return response_mode::buffered;
        }
        return opts_.prefetch ? response_mode::prefetch : response_mode::streaming;
    }

    /// Build the host response. In buffered mode the body is drained here,
    /// still inside the request task. A returned stream keeps `owner`
    /// alive.
    coro::task<errors::result<foreign_response>> to_foreign(http::response resp, http::extensions request_ext,
                                                            response_mode mode, coro::cancel_token token,
                                                            std::shared_ptr<void> owner = {}) const {
        foreign_response out;
        out.status = resp.status;
        out.http_version = resp.http_version;
        out.headers.reserve(resp.headers.size());
        for (const auto& [name, value] : resp.headers) {
            out.headers.emplace_back(name, value);
        }
        out.extensions = std::move(request_ext);
        for (auto& [key, value] : resp.extensions) {
            out.extensions.insert_or_assign(key, std::move(value));
        }

        switch (mode) {
            case response_mode::buffered: {
                auto body = co_await resp.body.read_all(token);
                if (!body) {
                    co_return std::unexpected(std::move(body.error()));
                }
                out.content = std::move(*body);
                break;
            }
            case response_mode::streaming:
                out.stream = std::make_shared<byte_stream>(sched_, std::move(resp.body), std::move(owner));
                break;
            case response_mode::prefetch:
                out.prefetch = prefetch_stream::start(sched_, std::move(resp.body), opts_.prefetch_capacity,
                                                       std::move(owner));
                break;
        }
        co_return out;
    }

    /// Header name is a token, value has no CR, LF or NUL
    static bool valid_header(std::string_view name, std::string_view value) noexcept {
        if (!http::is_token(name)) return false;
        return value.find_first_of(std::string_view("\r\n\0", 3)) == std::string_view::npos;
    }

private:
    static errors::result<void> copy_headers(const foreign_headers& in, http::header_list& out) {
        auto add = [&out](const std::string& name, const std::string& value) -> errors::result<void> {
            if (!valid_header(name, value)) {
                return std::unexpected(errors::invalid_request("headers", fmt::format("invalid header '{}'", name)));
            }
            out.add(name, value);
            return {};
        };
        if (std::holds_alternative<std::monostate>(in)) {
            return {};
        }
        if (auto* pairs = std::get_if<std::vector<header_pair>>(&in)) {
            for (const auto& [name, value] : *pairs) {
                if (auto r = add(name, value); !r) return r;
            }
            return {};
        }
        if (auto* mapping = std::get_if<std::map<std::string, std::string>>(&in)) {
            for (const auto& [name, value] : *mapping) {
                if (auto r = add(name, value); !r) return r;
            }
            return {};
        }
        if (auto* rows = std::get_if<std::vector<std::vector<std::string>>>(&in)) {
            for (const auto& row : *rows) {
                if (row.size() != 2) {
                    return std::unexpected(errors::invalid_request("headers", "header rows must have exactly 2 elements"));
                }
                if (auto r = add(row[0], row[1]); !r) return r;
            }
            return {};
        }
        return std::unexpected(errors::invalid_request("headers", "headers must be a list of pairs or a mapping"));
    }

    static errors::result<void> check_extensions(const http::extensions& ext) {
        for (auto key : {http::ext::timeout, http::ext::connect_timeout, http::ext::read_timeout,
                         http::ext::write_timeout}) {
            if (!http::find_ext(ext, key)) continue;
            if (std::holds_alternative<std::monostate>(*http::find_ext(ext, key))) continue;
            auto secs = http::ext_number(ext, key);
            if (!secs || *secs <= 0) {
                return std::unexpected(errors::invalid_request("extensions",
                    fmt::format("{} must be a positive number of seconds", key)));
            }
        }
        if (auto* v = http::find_ext(ext, http::ext::stream);
            v && !std::holds_alternative<std::monostate>(*v) && !http::ext_bool(ext, http::ext::stream)) {
            return std::unexpected(errors::invalid_request("extensions", "stream must be a boolean"));
        }
        if (auto* v = http::find_ext(ext, http::ext::retry_max_attempts); v && !std::holds_alternative<std::monostate>(*v)) {
            auto n = http::ext_int(ext, http::ext::retry_max_attempts);
            if (!n || *n < 1) {
                return std::unexpected(errors::invalid_request("extensions", "retry.max_attempts must be an integer >= 1"));
            }
        }
        if (auto* v = http::find_ext(ext, http::ext::retry_allow_non_idempotent);
            v && !std::holds_alternative<std::monostate>(*v) &&
            !http::ext_bool(ext, http::ext::retry_allow_non_idempotent)) {
            return std::unexpected(errors::invalid_request("extensions", "retry.allow_non_idempotent must be a boolean"));
        }
        return {};
    }

    runtime::scheduler& sched_;
    marshal_options opts_;
};

} // namespace tern::bridge
