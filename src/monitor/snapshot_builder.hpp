#pragma once
/// @file snapshot_builder.hpp
/// @brief Composes a MetricsSnapshot from the live collection state.

#include "metrics/percentiles.hpp"
#include "metrics/route_table.hpp"
#include "metrics/time_series.hpp"
#include "monitor/config.hpp"
#include "monitor/snapshot.hpp"
#include "platform/host_sampler.hpp"

#include <chrono>

namespace statmon {

/// @brief Reads (never mutates) the collection state and produces one
/// immutable snapshot per call.
///
/// Holds references: the owner must outlive the builder.
class SnapshotBuilder {
public:
  SnapshotBuilder(const MonitorConfig &cfg, const RouteTable &routes,
                  const RollingHistory &history,
                  const PercentileEstimator &percentiles,
                  const HostSampler &host) noexcept;

  /// @brief Build a snapshot, waiting for the health probe.
  [[nodiscard]] auto build() const -> MetricsSnapshot;

  /// @brief Run the health probe and time it. Never throws.
  [[nodiscard]] auto probe_health() const -> HealthStatus;

  [[nodiscard]] auto alert_inputs() const -> AlertInputs;

private:
  const MonitorConfig &cfg_;
  const RouteTable &routes_;
  const RollingHistory &history_;
  const PercentileEstimator &percentiles_;
  const HostSampler &host_;
  std::chrono::steady_clock::time_point started_;
};

} // namespace statmon
