#pragma once
/// @file alerts.hpp
/// @brief Threshold checks over the latest metric values.

#include "platform/capabilities.hpp"

namespace statmon {

/// @brief Values above which a metric is flagged.
struct AlertThresholds {
  double cpu = 80.0;             ///< Percent.
  double memory = 90.0;          ///< Percent of host memory in use.
  double response_time = 500.0;  ///< Milliseconds.
  double error_rate = 5.0;       ///< Percent of requests.
  double event_loop_lag = 100.0; ///< Milliseconds.
};

/// @brief Latest observed value per monitored metric.
struct AlertInputs {
  double cpu = 0.0;
  double memory_percent = 0.0;
  double response_time = 0.0;
  double error_rate = 0.0;
  double event_loop_lag = 0.0;
};

struct AlertFlags {
  bool cpu = false;
  bool memory = false;
  bool response_time = false;
  bool error_rate = false;
  bool event_loop_lag = false;

  [[nodiscard]] auto any() const noexcept -> bool {
    return cpu || memory || response_time || error_rate || event_loop_lag;
  }
};

/// @brief Flag every metric whose value is strictly above its threshold.
///
/// Metrics @p caps marks unavailable are never flagged.
[[nodiscard]] auto evaluate_alerts(const AlertInputs &in,
                                   const AlertThresholds &thresholds,
                                   const Capabilities &caps) noexcept
    -> AlertFlags;

} // namespace statmon
