#pragma once

#include <tern/bridge/byte_stream.hpp>
#include <tern/bridge/prefetch_stream.hpp>
#include <tern/http/extensions.hpp>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tern::bridge {

using header_pair = std::pair<std::string, std::string>;

/// Headers as a host hands them over. Ordered pairs and name->value
/// mappings are accepted; a list of rows must have exactly two entries per
/// row; a raw string is rejected.
using foreign_headers = std::variant<
    std::monostate,
    std::vector<header_pair>,
    std::map<std::string, std::string>,
    std::vector<std::vector<std::string>>,
    std::string>;

/// Iterator of body chunks; std::nullopt ends the body. Not replayable.
using chunk_iterator = std::function<std::optional<std::string>()>;

/// Request body as a host hands it over: none, bytes, a list of chunks
/// (replayable), or an iterator of chunks.
using foreign_body = std::variant<std::monostate, std::string, std::vector<std::string>, chunk_iterator>;

/// A request in the host's loose shape, before validation
struct foreign_request {
    std::string method;
    std::string url;
    foreign_headers headers;
    foreign_body body;
    http::extensions extensions;
};

/// What the host builds its response object from. Exactly one of
/// `content` (buffered mode) and a stream is set.
struct foreign_response {
    int status = 0;
    std::string http_version;
    std::vector<header_pair> headers;
    std::optional<std::string> content;
    std::shared_ptr<byte_stream> stream;
    std::shared_ptr<prefetch_stream> prefetch;
    http::extensions extensions;

    /// Abandon the body without reading it
    void close() {
        if (stream) stream->close();
        if (prefetch) prefetch->close();
    }
};

} // namespace tern::bridge
