// === Version Metadata ========================================================
//
// Exposes the service's semantic version string used in logs and the HTTP
// Server header.

#pragma once

#include <string_view>

namespace radnote {

inline constexpr std::string_view k_version{"0.3.0"};

}  // namespace radnote
