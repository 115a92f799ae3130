#pragma once
/// @file clock.hpp
/// @brief Wall-clock source shared by every time-stamping component.

#include <chrono>
#include <cstdint>
#include <functional>

namespace statmon {

/// @brief Returns the current time as milliseconds since the Unix epoch.
///
/// Injected everywhere a timestamp is taken so tests can drive time by hand.
using NowFn = std::function<std::int64_t()>;

/// @brief Default clock: std::chrono::system_clock in epoch milliseconds.
[[nodiscard]] inline auto wall_clock_ms() -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

} // namespace statmon
