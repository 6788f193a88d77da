#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tern::http {

/// Standard request methods. Anything else that is a valid token travels
/// as verb::extension with its spelling kept in method::name().
enum class verb : uint8_t {
    GET,
    HEAD,
    POST,
    PUT,
    DELETE_,  // DELETE is a macro on some platforms
    CONNECT,
    OPTIONS,
    TRACE,
    PATCH,
    extension
};

inline constexpr std::string_view verb_to_string(verb v) noexcept {
    switch (v) {
        case verb::GET:       return "GET";
        case verb::HEAD:      return "HEAD";
        case verb::POST:      return "POST";
        case verb::PUT:       return "PUT";
        case verb::DELETE_:   return "DELETE";
        case verb::CONNECT:   return "CONNECT";
        case verb::OPTIONS:   return "OPTIONS";
        case verb::TRACE:     return "TRACE";
        case verb::PATCH:     return "PATCH";
        case verb::extension: return "";
    }
    return "";
}

/// RFC 9110 tchar
inline constexpr bool is_token_char(char c) noexcept {
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) {
        return true;
    }
    switch (c) {
        case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
        case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
            return true;
        default:
            return false;
    }
}

inline bool is_token(std::string_view s) noexcept {
    return !s.empty() && std::all_of(s.begin(), s.end(), is_token_char);
}

class method {
public:
    method() = default;
    method(verb v) : verb_(v) {}  // NOLINT: implicit on purpose, http::verb::GET reads as a method

    /// Methods are case-sensitive; "get" is an extension method, not GET.
    static std::optional<method> parse(std::string_view name) {
        if (!is_token(name)) {
            return std::nullopt;
        }
        for (auto v : {verb::GET, verb::HEAD, verb::POST, verb::PUT, verb::DELETE_,
                       verb::CONNECT, verb::OPTIONS, verb::TRACE, verb::PATCH}) {
            if (verb_to_string(v) == name) {
                return method(v);
            }
        }
        method m(verb::extension);
        m.extension_ = std::string(name);
        return m;
    }

    verb kind() const noexcept { return verb_; }

    std::string_view name() const noexcept {
        return verb_ == verb::extension ? std::string_view(extension_) : verb_to_string(verb_);
    }

    /// RFC 9110 9.2.2
    bool is_idempotent() const noexcept {
        switch (verb_) {
            case verb::GET: case verb::HEAD: case verb::PUT: case verb::DELETE_:
            case verb::OPTIONS: case verb::TRACE:
                return true;
            default:
                return false;
        }
    }

    bool operator==(const method& o) const noexcept {
        return verb_ == o.verb_ && extension_ == o.extension_;
    }

private:
    verb verb_ = verb::GET;
    std::string extension_;
};

inline bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

inline std::string to_lower(std::string_view s) {
    std::string out(s);
    for (char& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

/// Ordered header multimap. Insertion order and duplicates are kept;
/// lookups compare names case-insensitively.
class header_list {
public:
    using value_type = std::pair<std::string, std::string>;
    using const_iterator = std::vector<value_type>::const_iterator;

    header_list() = default;
    header_list(std::initializer_list<value_type> init) : entries_(init) {}

    void add(std::string_view name, std::string_view value) {
        entries_.emplace_back(std::string(name), std::string(value));
    }

    /// Replace every entry named `name` by one entry at the first position.
    void set(std::string_view name, std::string_view value) {
        auto it = std::find_if(entries_.begin(), entries_.end(),
                               [&](const value_type& e) { return iequals(e.first, name); });
        if (it == entries_.end()) {
            add(name, value);
            return;
        }
        it->second = std::string(value);
        auto tail = std::remove_if(std::next(it), entries_.end(),
                                   [&](const value_type& e) { return iequals(e.first, name); });
        entries_.erase(tail, entries_.end());
    }

    /// First value, or empty view
    std::string_view get(std::string_view name) const {
        for (const auto& e : entries_) {
            if (iequals(e.first, name)) return e.second;
        }
        return {};
    }

    std::vector<std::string_view> get_all(std::string_view name) const {
        std::vector<std::string_view> out;
        for (const auto& e : entries_) {
            if (iequals(e.first, name)) out.push_back(e.second);
        }
        return out;
    }

    bool contains(std::string_view name) const {
        return std::any_of(entries_.begin(), entries_.end(),
                           [&](const value_type& e) { return iequals(e.first, name); });
    }

    size_t remove(std::string_view name) {
        return std::erase_if(entries_, [&](const value_type& e) { return iequals(e.first, name); });
    }

    std::optional<uint64_t> content_length() const {
        auto val = get("Content-Length");
        if (val.empty()) return std::nullopt;
        uint64_t len = 0;
        auto [ptr, ec] = std::from_chars(val.data(), val.data() + val.size(), len);
        if (ec != std::errc{} || ptr != val.data() + val.size()) return std::nullopt;
        return len;
    }

    /// Final transfer coding is chunked
    bool is_chunked() const {
        auto all = get_all("Transfer-Encoding");
        if (all.empty()) return false;
        auto last = to_lower(all.back());
        auto pos = last.find_last_not_of(" \t");
        last.erase(pos == std::string::npos ? 0 : pos + 1);
        return last.size() >= 7 && last.compare(last.size() - 7, 7, "chunked") == 0;
    }

    /// Connection persistence per RFC 9112 9.3
    bool keep_alive(int version_minor) const {
        for (auto v : get_all("Connection")) {
            auto lower = to_lower(v);
            if (lower.find("close") != std::string::npos) return false;
            if (lower.find("keep-alive") != std::string::npos) return true;
        }
        return version_minor >= 1;
    }

    size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }
    void clear() noexcept { entries_.clear(); }
    void reserve(size_t n) { entries_.reserve(n); }

    const_iterator begin() const noexcept { return entries_.begin(); }
    const_iterator end() const noexcept { return entries_.end(); }
    const value_type& operator[](size_t i) const { return entries_[i]; }

    bool operator==(const header_list&) const = default;

private:
    std::vector<value_type> entries_;
};

/// Absolute http/https URL
struct url {
    std::string scheme;     ///< "http" or "https", lower case
    std::string host;       ///< IPv6 literals without brackets
    uint16_t port = 0;      ///< 0 = scheme default
    std::string path;       ///< leading '/'
    std::string query;      ///< without '?'

    std::string target() const {
        std::string t = path.empty() ? "/" : path;
        if (!query.empty()) {
            t += '?';
            t += query;
        }
        return t;
    }

    uint16_t default_port() const noexcept { return scheme == "https" ? 443 : 80; }
    uint16_t effective_port() const noexcept { return port != 0 ? port : default_port(); }
    bool is_secure() const noexcept { return scheme == "https"; }

    /// Host header / :authority value
    std::string authority() const {
        std::string a = host.find(':') != std::string::npos ? "[" + host + "]" : host;
        if (port != 0 && port != default_port()) {
            a += ':';
            a += std::to_string(port);
        }
        return a;
    }

    std::string to_string() const {
        return scheme + "://" + authority() + target();
    }

    /// Strict parse: scheme must be http or https, host must be present,
    /// port must be 1-65535, no whitespace or control characters. The
    /// fragment is dropped and userinfo is rejected (credentials are the
    /// caller's business, not the transport's).
    static std::optional<url> parse(std::string_view str) {
        for (char c : str) {
            auto uc = static_cast<unsigned char>(c);
            if (uc <= 0x20 || uc == 0x7f) return std::nullopt;
        }
        auto scheme_end = str.find("://");
        if (scheme_end == std::string_view::npos || scheme_end == 0) {
            return std::nullopt;
        }
        url result;
        result.scheme = to_lower(str.substr(0, scheme_end));
        if (result.scheme != "http" && result.scheme != "https") {
            return std::nullopt;
        }
        str.remove_prefix(scheme_end + 3);

        if (auto frag = str.find('#'); frag != std::string_view::npos) {
            str = str.substr(0, frag);
        }
        auto authority_end = str.find_first_of("/?");
        std::string_view authority = str.substr(0, authority_end);
        std::string_view rest = authority_end == std::string_view::npos ? std::string_view{} : str.substr(authority_end);

        if (authority.find('@') != std::string_view::npos) {
            return std::nullopt;
        }

        std::string_view port_str;
        if (!authority.empty() && authority.front() == '[') {
            auto close = authority.find(']');
            if (close == std::string_view::npos) return std::nullopt;
            result.host = std::string(authority.substr(1, close - 1));
            auto after = authority.substr(close + 1);
            if (!after.empty()) {
                if (after.front() != ':') return std::nullopt;
                port_str = after.substr(1);
            }
        } else {
            auto colon = authority.rfind(':');
            if (colon != std::string_view::npos) {
                result.host = std::string(authority.substr(0, colon));
                port_str = authority.substr(colon + 1);
                if (port_str.empty()) return std::nullopt;
            } else {
                result.host = std::string(authority);
            }
            result.host = to_lower(result.host);
        }
        if (result.host.empty()) {
            return std::nullopt;
        }
        if (!port_str.empty()) {
            unsigned value = 0;
            auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), value);
            if (ec != std::errc{} || ptr != port_str.data() + port_str.size() || value == 0 || value > 65535) {
                return std::nullopt;
            }
            result.port = static_cast<uint16_t>(value);
        }

        auto q = rest.find('?');
        result.path = std::string(q == std::string_view::npos ? rest : rest.substr(0, q));
        if (result.path.empty()) result.path = "/";
        if (q != std::string_view::npos) result.query = std::string(rest.substr(q + 1));
        return result;
    }
};

/// "1xx" .. "5xx", "other" for anything outside 100-599
inline std::string_view status_class(int code) noexcept {
    switch (code / 100) {
        case 1: return "1xx";
        case 2: return "2xx";
        case 3: return "3xx";
        case 4: return "4xx";
        case 5: return "5xx";
        default: return "other";
    }
}

} // namespace tern::http
