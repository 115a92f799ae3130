#pragma once
/// @file worker_message.hpp
/// @brief What a worker reports to the coordinating process on every tick.

#include "metrics/route_table.hpp"
#include "metrics/time_series.hpp"
#include "monitor/snapshot.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace statmon {

/// @brief The aggregated subset of a MetricsSnapshot, every field optional.
///
/// A missing number reads as 0 and a missing list or map as empty, so a
/// worker running an older or reduced build can still be folded in.
struct PartialSnapshot {
  std::optional<double> cpu;
  std::optional<double> memory_mb;
  std::optional<double> rps;
  std::optional<double> response_time;
  std::optional<double> error_rate;
  std::optional<std::uint64_t> total_requests;
  std::optional<std::uint64_t> active_connections;
  std::optional<StatusCodeCounts> status_codes;
  std::optional<RateLimitStats> rate_limit;
  std::optional<std::vector<RouteStats>> top_routes;
  std::optional<std::vector<RouteStats>> slowest_routes;
  std::optional<std::vector<RouteStats>> error_routes;
};

/// @brief Project a full local snapshot onto the wire subset.
[[nodiscard]] auto to_partial(const MetricsSnapshot &s) -> PartialSnapshot;

inline constexpr std::string_view kWorkerMetricsType = "worker-metrics";

/// @brief {type: "worker-metrics", workerId, pid, partialSnapshot, charts}.
struct WorkerMetricsMessage {
  std::int64_t worker_id = 0;
  std::int64_t pid = 0;
  PartialSnapshot snapshot;
  ChartBundle charts;
};

} // namespace statmon
