#pragma once

/// tern: HTTP transport core
///
/// Include this file for the whole public surface: the shared client, the
/// foreign-caller bridge and the typed request/response model.

#include <tern/version.hpp>

#include <tern/bridge/byte_stream.hpp>
#include <tern/bridge/foreign.hpp>
#include <tern/bridge/marshal.hpp>
#include <tern/bridge/pending_call.hpp>
#include <tern/bridge/prefetch_stream.hpp>
#include <tern/client/client.hpp>
#include <tern/config/client_config.hpp>
#include <tern/errors/error.hpp>
#include <tern/errors/host_error.hpp>
#include <tern/http/request.hpp>
#include <tern/http/response.hpp>
#include <tern/log/logger.hpp>
#include <tern/log/macros.hpp>
#include <tern/observe/metrics.hpp>
#include <tern/observe/tracing.hpp>

#include <string>

namespace tern {

inline const char* version() noexcept {
    return version_string.data();
}

/// What a host checks before choosing this transport
struct build_info {
    std::string version;
    bool available = false;
    std::string init_error;
};

/// True once the shared client could be created. A host falls back to its
/// own transport otherwise.
inline bool is_available() {
    return client::client::try_instance().has_value();
}

inline build_info version_info() {
    build_info info;
    info.version = std::string(version_string);
    auto inst = client::client::try_instance();
    info.available = inst.has_value();
    if (!inst) {
        info.init_error = inst.error().describe();
    }
    return info;
}

} // namespace tern
