#pragma once
/// @file snapshot.hpp
/// @brief The immutable point-in-time composite of every tracked metric.

#include "metrics/alerts.hpp"
#include "metrics/percentiles.hpp"
#include "metrics/route_table.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace statmon {

/// @brief What an injected health probe reports.
struct HealthResult {
  bool connected = true;
  double latency_ms = 0.0;
  std::optional<std::string> name;
};

/// @brief Health probe outcome as captured in a snapshot.
///
/// A probe that throws is reported as disconnected with zero latency.
struct HealthStatus {
  bool connected = false;
  double latency_ms = 0.0;
  std::optional<std::string> name;
};

/// @brief One cluster worker as listed in an aggregated snapshot.
struct WorkerInfo {
  std::int64_t pid = 0;
  double cpu = 0.0;
  double memory_mb = 0.0;
  double rps = 0.0;
  std::uint64_t total_requests = 0;
  double response_time = 0.0;
};

struct MetricsSnapshot {
  std::int64_t timestamp = 0; ///< Epoch ms when the snapshot was built.

  // Host and process gauges (zero in reduced mode).
  double cpu = 0.0;
  double memory_mb = 0.0;
  double memory_percent = 0.0;
  double heap_used_mb = 0.0;
  double heap_total_mb = 0.0;
  double heap_growth_rate = 0.0;
  double load_avg = 0.0;
  std::int64_t uptime = 0;         ///< Host uptime (s).
  std::int64_t process_uptime = 0; ///< Seconds since the monitor started.
  double event_loop_lag = 0.0;

  // Request metrics.
  double response_time = 0.0; ///< Mean of the last rollover interval (ms).
  double rps = 0.0;           ///< Requests in the last rollover interval.
  StatusCodeCounts status_codes;
  std::uint64_t total_requests = 0;
  std::uint64_t active_connections = 0;
  PercentileSet percentiles;
  std::vector<RouteStats> top_routes;
  std::vector<RouteStats> slowest_routes;
  std::vector<RouteStats> error_routes;
  std::vector<ErrorEntry> recent_errors;
  RateLimitStats rate_limit;
  double error_rate = 0.0; ///< Percent (2 decimals).

  AlertFlags alerts;
  HealthStatus database;

  // Identity.
  std::string hostname;
  std::string platform;
  std::string runtime;
  std::int64_t pid = 0;
  unsigned cpu_count = 0;

  // Present only in an aggregated cluster view.
  std::optional<std::vector<WorkerInfo>> workers;
  std::optional<std::size_t> worker_count;

  bool reduced_mode = false;
};

} // namespace statmon
