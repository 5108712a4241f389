// === Version Metadata ========================================================
//
// Exposes the planner's semantic version string used in logs and reports.

#pragma once

#include <string_view>

namespace flower {

inline constexpr std::string_view k_version{"0.3.0"};

}  // namespace flower
