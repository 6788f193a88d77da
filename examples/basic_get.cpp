/// @file basic_get.cpp
/// @brief Buffered requests through the shared client
///
/// Sends a GET and a POST the way a host binding would: loose request
/// shapes in, a buffered response out. Settings come from TERN_*
/// environment variables.
///
/// Usage: ./basic_get [url]
/// Default: http://127.0.0.1:8080/

#include <tern/tern.hpp>

#include <map>
#include <string>
#include <vector>

using namespace tern;

int main(int argc, char* argv[]) {
    std::string url = argc > 1 ? argv[1] : "http://127.0.0.1:8080/";

    auto c = client::client::try_instance();
    if (!c) {
        TERN_LOG_ERROR("client unavailable: {}", c.error().describe());
        return 1;
    }

    bridge::foreign_request get;
    get.method = "GET";
    get.url = url;
    get.headers = std::vector<bridge::header_pair>{{"Accept", "*/*"}};
    get.extensions["timeout"] = 10.0;

    auto resp = (*c)->handle_request(std::move(get));
    if (!resp) {
        TERN_LOG_ERROR("{}", resp.error().message);
        return 1;
    }
    TERN_LOG_INFO("{} {} ({} bytes, {} attempts)", resp->http_version, resp->status, resp->content->size(),
                  http::ext_int(resp->extensions, http::ext::attempts).value_or(1));
    for (const auto& [name, value] : resp->headers) {
        TERN_LOG_INFO("  {}: {}", name, value);
    }
    fmt::print("{}\n", *resp->content);

    bridge::foreign_request post;
    post.method = "POST";
    post.url = url;
    post.headers = std::map<std::string, std::string>{{"Content-Type", "application/json"}};
    post.body = std::string(R"({"name": "tern"})");

    auto posted = (*c)->handle_request(std::move(post));
    if (!posted) {
        TERN_LOG_ERROR("POST failed: {}", posted.error().message);
        return 1;
    }
    TERN_LOG_INFO("POST answered with {}", posted->status);
    return 0;
}
