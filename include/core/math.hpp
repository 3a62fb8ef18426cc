#pragma once

#include <algorithm>

namespace host_agent::core {

inline constexpr double clamp_percent(const double value) noexcept {
  return std::clamp(value, 0.0, 100.0);
}

inline constexpr double percent_of(const double part, const double whole) noexcept {
  return whole > 0.0 ? clamp_percent((part / whole) * 100.0) : 0.0;
}

}  // namespace host_agent::core
