#pragma once

#include <string_view>

namespace lanxfer {

inline constexpr std::string_view version() noexcept {
    return "0.3.0";
}

// Version baked in by the build (LANXFER_VERSION), falls back to version().
const char* resolved_version();

} // namespace lanxfer
