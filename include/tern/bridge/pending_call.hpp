#pragma once

#include <tern/bridge/foreign.hpp>
#include <tern/bridge/pending.hpp>

#include <memory>

namespace tern::bridge {

/// The pending operation returned to a foreign caller for one request.
/// A response that arrives after cancel() gets its body closed.
using pending_call = pending_result<foreign_response>;

inline std::shared_ptr<pending_call> make_pending_call() {
    auto call = std::make_shared<pending_call>();
    call->set_discard([](foreign_response& late) { late.close(); });
    return call;
}

} // namespace tern::bridge
