// === Version Metadata ========================================================
//
// Exposes the operator's semantic version string used in startup logs.

#pragma once

#include <string_view>

namespace kit_operator {

inline constexpr std::string_view k_version{"0.3.0"};

}  // namespace kit_operator
