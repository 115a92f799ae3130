/// @file worker_message.cpp
/// @brief Projection of a local snapshot onto the worker wire subset.

#include "cluster/worker_message.hpp"

namespace statmon {

auto to_partial(const MetricsSnapshot &s) -> PartialSnapshot {
  return PartialSnapshot{
      .cpu = s.cpu,
      .memory_mb = s.memory_mb,
      .rps = s.rps,
      .response_time = s.response_time,
      .error_rate = s.error_rate,
      .total_requests = s.total_requests,
      .active_connections = s.active_connections,
      .status_codes = s.status_codes,
      .rate_limit = s.rate_limit,
      .top_routes = s.top_routes,
      .slowest_routes = s.slowest_routes,
      .error_routes = s.error_routes,
  };
}

} // namespace statmon
