#pragma once
/// @file numeric.hpp
/// @brief Fixed-precision rounding used for every reported gauge.

#include <cmath>

namespace statmon {

/// @brief Round @p value to @p decimals decimal places.
[[nodiscard]] inline auto round_to(double value, int decimals) -> double {
  const double scale = std::pow(10.0, decimals);
  return std::round(value * scale) / scale;
}

} // namespace statmon
