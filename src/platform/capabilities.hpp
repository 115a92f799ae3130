#pragma once
/// @file capabilities.hpp
/// @brief Which metric categories the hosting environment can provide.

namespace statmon {

/// @brief Capability descriptor for the collecting process.
///
/// A reduced environment (sandboxed runtime, no /proc access) still tracks
/// requests, latency and errors; host and process gauges read as zero and
/// never raise alerts.
struct Capabilities {
  bool host_metrics = true;    ///< CPU, memory, load average, host uptime.
  bool process_metrics = true; ///< Resident / virtual size of this process.
  bool event_loop_lag = true;  ///< Rollover timer drift.

  [[nodiscard]] auto reduced_mode() const noexcept -> bool {
    return !host_metrics && !process_metrics && !event_loop_lag;
  }

  /// @brief Everything this build can read on the current platform.
  [[nodiscard]] static auto detect() noexcept -> Capabilities;

  /// @brief Request-level metrics only.
  [[nodiscard]] static constexpr auto reduced() noexcept -> Capabilities {
    return {.host_metrics = false,
            .process_metrics = false,
            .event_loop_lag = false};
  }
};

} // namespace statmon
