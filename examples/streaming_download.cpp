/// @file streaming_download.cpp
/// @brief Stream a response body to a file
///
/// The body is pulled chunk by chunk; with --prefetch it is forwarded
/// into a bounded channel ahead of the reader instead. --limit closes the
/// stream early, abandoning the rest of the body.
///
/// Usage: ./streaming_download <url> <output> [--prefetch] [--limit BYTES]

#include <tern/tern.hpp>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>

using namespace tern;

int main(int argc, char* argv[]) {
    if (argc < 3) {
        fmt::print(stderr, "usage: {} <url> <output> [--prefetch] [--limit BYTES]\n", argv[0]);
        return 2;
    }
    bool prefetch = false;
    uint64_t limit = 0;
    for (int i = 3; i < argc; ++i) {
        if (std::strcmp(argv[i], "--prefetch") == 0) {
            prefetch = true;
        } else if (std::strcmp(argv[i], "--limit") == 0 && i + 1 < argc) {
            limit = std::strtoull(argv[++i], nullptr, 10);
        }
    }

    auto base = config::load_from_env();
    if (!base) {
        TERN_LOG_ERROR("{}", base.error().describe());
        return 1;
    }
    base->prefetch_streams = prefetch;
    base->log_level = log::level::info;
    auto c = client::client::create(std::move(*base));
    if (!c) {
        TERN_LOG_ERROR("client unavailable: {}", c.error().describe());
        return 1;
    }

    bridge::foreign_request req;
    req.method = "GET";
    req.url = argv[1];
    req.extensions["stream"] = true;
    auto resp = (*c)->handle_request(std::move(req));
    if (!resp) {
        TERN_LOG_ERROR("{}", resp.error().message);
        return 1;
    }
    TERN_LOG_INFO("{} {}", resp->http_version, resp->status);

    std::unique_ptr<FILE, decltype(&std::fclose)> out(std::fopen(argv[2], "wb"), &std::fclose);
    if (!out) {
        TERN_LOG_ERROR("cannot open {}: {}", argv[2], std::strerror(errno));
        resp->close();
        return 1;
    }

    uint64_t written = 0;
    for (;;) {
        auto chunk = resp->prefetch ? resp->prefetch->read_chunk() : resp->stream->read_chunk();
        if (!chunk) {
            TERN_LOG_ERROR("{}", chunk.error().message);
            return 1;
        }
        if (!*chunk) {
            break;
        }
        std::fwrite((*chunk)->data(), 1, (*chunk)->size(), out.get());
        written += (*chunk)->size();
        if (limit && written >= limit) {
            TERN_LOG_INFO("limit reached, abandoning the rest");
            resp->close();
            break;
        }
    }
    TERN_LOG_INFO("wrote {} bytes to {}", written, argv[2]);
    (*c)->shutdown();
    return 0;
}
