#pragma once
/// @file config.hpp
/// @brief Monitor configuration: defaults, environment detection and JSON
///        file loading.

#include "metrics/alerts.hpp"
#include "metrics/clock.hpp"
#include "metrics/route_table.hpp"
#include "monitor/snapshot.hpp"
#include "platform/capabilities.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <future>
#include <optional>
#include <string>
#include <system_error>

namespace statmon {

/// @brief Asynchronous health check. The returned future may throw.
using HealthProbe = std::function<std::future<HealthResult>()>;

/// @brief Probe that always reports connected with zero latency.
[[nodiscard]] auto always_healthy_probe() -> HealthProbe;

/// @brief Configuration for StatusMonitor construction.
struct MonitorConfig {
  std::int64_t update_interval_ms = 1000; ///< Rollover tick period.
  std::int64_t retention_seconds = 60;    ///< History window.
  std::size_t max_recent_errors = 10;
  std::size_t max_routes = 10; ///< Length of each ranked route list.
  AlertThresholds alerts{};
  PathNormalizer path_normalizer = default_normalize_path;
  HealthProbe health_probe = always_healthy_probe();
  std::optional<bool> cluster_mode; ///< Unset: detect_cluster_mode().
  std::int64_t worker_id = 0;       ///< Id sent in worker-metrics messages.
  Capabilities capabilities = Capabilities::detect();
  NowFn now = wall_clock_ms;
};

/// @brief True if the environment marks this process as part of a cluster
/// (STATMON_CLUSTER set to a non-"0" value, or STATMON_WORKER_ID present).
[[nodiscard]] auto detect_cluster_mode() -> bool;

/// @brief STATMON_WORKER_ID as an integer, or 0.
[[nodiscard]] auto detect_worker_id() -> std::int64_t;

/// @brief Load scalar settings from a JSON file over the defaults.
///
/// Recognised keys: updateIntervalMs, retentionSeconds, maxRecentErrors,
/// maxRoutes, clusterMode, workerId, reducedMode and an "alerts" object
/// (cpu, memory, responseTime, errorRate, eventLoopLag). Missing keys keep
/// their defaults.
/// @return The config, no_such_file_or_directory if the file cannot be
/// opened, or invalid_argument if it is not valid JSON of the right shape.
[[nodiscard]] auto load_config(const std::string &path)
    -> std::expected<MonitorConfig, std::error_code>;

} // namespace statmon
