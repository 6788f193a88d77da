#pragma once

#include <string_view>
#include <tuple>

#define TERN_VERSION_MAJOR 0
#define TERN_VERSION_MINOR 1
#define TERN_VERSION_PATCH 0

namespace tern {

inline constexpr std::string_view version_string = "0.1.0";

inline constexpr auto version_tuple() noexcept {
    return std::make_tuple(TERN_VERSION_MAJOR, TERN_VERSION_MINOR, TERN_VERSION_PATCH);
}

} // namespace tern
