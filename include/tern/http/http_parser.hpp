#pragma once

#include <tern/http/http_common.hpp>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace tern::http {

enum class parse_result {
    need_more,
    complete,
    error
};

/// Incremental HTTP/1.x response head parser (status line + header block).
/// Bytes after the blank line are left to the body decoder.
class response_head_parser {
public:
    static constexpr size_t MAX_HEAD_SIZE = 64 * 1024;

    /// Consume from the front of `buffer` as much as belongs to the head.
    parse_result parse(std::string& buffer) {
        while (state_ != state::complete) {
            auto line_end = buffer.find("\r\n");
            if (line_end == std::string::npos) {
                if (head_bytes_ + buffer.size() > MAX_HEAD_SIZE) {
                    return fail("response head too large");
                }
                return parse_result::need_more;
            }
            head_bytes_ += line_end + 2;
            if (head_bytes_ > MAX_HEAD_SIZE) {
                return fail("response head too large");
            }
            std::string_view line(buffer.data(), line_end);
            bool ok = state_ == state::status_line ? parse_status_line(line) : parse_header_line(line);
            buffer.erase(0, line_end + 2);
            if (!ok) {
                return parse_result::error;
            }
        }
        return parse_result::complete;
    }

    /// Ready for the next response on the same connection (after a 1xx)
    void reset() {
        state_ = state::status_line;
        status_ = 0;
        version_minor_ = 1;
        reason_.clear();
        headers_.clear();
        error_.clear();
        head_bytes_ = 0;
    }

    int status() const noexcept { return status_; }
    int version_minor() const noexcept { return version_minor_; }
    std::string_view reason() const noexcept { return reason_; }
    const header_list& headers() const noexcept { return headers_; }
    header_list take_headers() { return std::move(headers_); }
    std::string_view error_message() const noexcept { return error_; }

private:
    enum class state { status_line, headers, complete };

    bool parse_status_line(std::string_view line) {
        // HTTP/1.1 200 OK
        if (line.size() < 12 || !line.starts_with("HTTP/1.") || line[8] != ' ') {
            fail("malformed status line");
            return false;
        }
        char minor = line[7];
        if (minor != '0' && minor != '1') {
            fail("unsupported HTTP version");
            return false;
        }
        version_minor_ = minor - '0';
        auto code = line.substr(9, 3);
        int value = 0;
        auto [ptr, ec] = std::from_chars(code.data(), code.data() + code.size(), value);
        if (ec != std::errc{} || ptr != code.data() + 3 || value < 100 || value > 999) {
            fail("malformed status code");
            return false;
        }
        if (line.size() > 12 && line[12] != ' ') {
            fail("malformed status line");
            return false;
        }
        status_ = value;
        reason_ = line.size() > 13 ? std::string(line.substr(13)) : std::string();
        state_ = state::headers;
        return true;
    }

    bool parse_header_line(std::string_view line) {
        if (line.empty()) {
            state_ = state::complete;
            return true;
        }
        if (line.front() == ' ' || line.front() == '\t') {
            // obsolete line folding (RFC 9112 5.2)
            fail("obsolete header line folding");
            return false;
        }
        auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0 || !is_token(line.substr(0, colon))) {
            fail("malformed header line");
            return false;
        }
        auto name = line.substr(0, colon);
        auto value = line.substr(colon + 1);
        while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) value.remove_prefix(1);
        while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) value.remove_suffix(1);
        headers_.add(name, value);
        return true;
    }

    parse_result fail(std::string_view msg) {
        error_ = std::string(msg);
        return parse_result::error;
    }

    state state_ = state::status_line;
    int status_ = 0;
    int version_minor_ = 1;
    std::string reason_;
    header_list headers_;
    std::string error_;
    size_t head_bytes_ = 0;
};

/// How the body of a response is delimited (RFC 9112 6.3)
enum class body_framing {
    none,
    content_length,
    chunked,
    until_close
};

inline body_framing framing_for(const method& m, int status, const header_list& headers) {
    if (m.kind() == verb::HEAD || (status >= 100 && status < 200) || status == 204 || status == 304) {
        return body_framing::none;
    }
    if (headers.contains("Transfer-Encoding")) {
        return headers.is_chunked() ? body_framing::chunked : body_framing::until_close;
    }
    if (auto len = headers.content_length()) {
        return *len == 0 ? body_framing::none : body_framing::content_length;
    }
    return body_framing::until_close;
}

/// Incremental body decoder. Never accumulates: each decode() call moves
/// at most `max_out` payload bytes from the wire buffer to `out`.
class body_decoder {
public:
    body_decoder() = default;
    body_decoder(body_framing framing, uint64_t content_length = 0)
        : framing_(framing), remaining_(content_length) {
        if (framing_ == body_framing::none) {
            state_ = state::done;
        } else if (framing_ == body_framing::chunked) {
            state_ = state::chunk_size;
        } else {
            state_ = state::data;
        }
    }

    /// Returns complete once the body end was seen; need_more when the
    /// buffer is exhausted or `out` reached max_out.
    parse_result decode(std::string& buffer, std::string& out, size_t max_out) {
        size_t pos = 0;
        parse_result r = parse_result::need_more;
        while (state_ != state::done && state_ != state::failed && out.size() < max_out) {
            size_t before = pos;
            if (!step(buffer, pos, out, max_out)) {
                break;
            }
            if (pos == before && state_ != state::done) {
                continue;
            }
        }
        buffer.erase(0, pos);
        if (state_ == state::failed) r = parse_result::error;
        else if (state_ == state::done) r = parse_result::complete;
        return r;
    }

    /// The peer closed the connection. Completes close-delimited bodies,
    /// anything else is truncated.
    parse_result finish_on_eof() {
        if (framing_ == body_framing::until_close && state_ == state::data) {
            state_ = state::done;
            return parse_result::complete;
        }
        if (state_ == state::done) {
            return parse_result::complete;
        }
        error_ = "connection closed before end of body";
        state_ = state::failed;
        return parse_result::error;
    }

    bool is_done() const noexcept { return state_ == state::done; }
    body_framing framing() const noexcept { return framing_; }
    std::string_view error_message() const noexcept { return error_; }

private:
    enum class state { data, chunk_size, chunk_data, chunk_data_crlf, trailer, done, failed };

    static constexpr size_t MAX_CHUNK_LINE = 4096;

    // Advance one state; false when more input is needed.
    bool step(const std::string& buf, size_t& pos, std::string& out, size_t max_out) {
        size_t avail = buf.size() - pos;
        switch (state_) {
            case state::data: {
                if (avail == 0) return false;
                size_t n = std::min(avail, max_out - out.size());
                if (framing_ == body_framing::content_length) {
                    n = static_cast<size_t>(std::min<uint64_t>(n, remaining_));
                    remaining_ -= n;
                }
                out.append(buf, pos, n);
                pos += n;
                if (framing_ == body_framing::content_length && remaining_ == 0) {
                    state_ = state::done;
                }
                return true;
            }
            case state::chunk_size: {
                auto end = buf.find("\r\n", pos);
                if (end == std::string::npos) {
                    if (avail > MAX_CHUNK_LINE) return fail("chunk size line too long");
                    return false;
                }
                std::string_view line(buf.data() + pos, end - pos);
                if (auto semi = line.find(';'); semi != std::string_view::npos) {
                    line = line.substr(0, semi);  // chunk extensions ignored
                }
                while (!line.empty() && (line.back() == ' ' || line.back() == '\t')) line.remove_suffix(1);
                uint64_t size = 0;
                auto [ptr, ec] = std::from_chars(line.data(), line.data() + line.size(), size, 16);
                if (line.empty() || ec != std::errc{} || ptr != line.data() + line.size()) {
                    return fail("malformed chunk size");
                }
                pos = end + 2;
                remaining_ = size;
                state_ = size == 0 ? state::trailer : state::chunk_data;
                return true;
            }
            case state::chunk_data: {
                if (avail == 0) return false;
                size_t n = static_cast<size_t>(std::min<uint64_t>({avail, remaining_, max_out - out.size()}));
                out.append(buf, pos, n);
                pos += n;
                remaining_ -= n;
                if (remaining_ == 0) state_ = state::chunk_data_crlf;
                return true;
            }
            case state::chunk_data_crlf: {
                if (avail < 2) return false;
                if (buf[pos] != '\r' || buf[pos + 1] != '\n') return fail("missing CRLF after chunk data");
                pos += 2;
                state_ = state::chunk_size;
                return true;
            }
            case state::trailer: {
                auto end = buf.find("\r\n", pos);
                if (end == std::string::npos) {
                    if (avail > MAX_CHUNK_LINE) return fail("trailer line too long");
                    return false;
                }
                bool last = end == pos;
                pos = end + 2;
                if (last) state_ = state::done;
                return true;
            }
            case state::done:
            case state::failed:
                return false;
        }
        return false;
    }

    bool fail(std::string_view msg) {
        error_ = std::string(msg);
        state_ = state::failed;
        return false;
    }

    body_framing framing_ = body_framing::none;
    state state_ = state::done;
    uint64_t remaining_ = 0;
    std::string error_;
};

} // namespace tern::http
