/// @file alerts.cpp
/// @brief Implementation of evaluate_alerts.

#include "metrics/alerts.hpp"

namespace statmon {

auto evaluate_alerts(const AlertInputs &in, const AlertThresholds &thresholds,
                     const Capabilities &caps) noexcept -> AlertFlags {
  return AlertFlags{
      .cpu = caps.host_metrics && in.cpu > thresholds.cpu,
      .memory = caps.host_metrics && in.memory_percent > thresholds.memory,
      .response_time = in.response_time > thresholds.response_time,
      .error_rate = in.error_rate > thresholds.error_rate,
      .event_loop_lag =
          caps.event_loop_lag && in.event_loop_lag > thresholds.event_loop_lag,
  };
}

} // namespace statmon
