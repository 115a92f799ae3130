#pragma once
/// @file json_serializer.hpp
/// @brief nlohmann/json serialization for snapshots, charts and the
///        worker-metrics wire message.

#include "cluster/worker_message.hpp"
#include "metrics/time_series.hpp"
#include "monitor/snapshot.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <limits>
#include <optional>
#include <string>

namespace statmon {

namespace detail {

template <typename T>
void put_optional(nlohmann::json &j, const char *key,
                  const std::optional<T> &value) {
  if (value) {
    j[key] = *value;
  }
}

template <typename T>
void get_optional(const nlohmann::json &j, const char *key,
                  std::optional<T> &out) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    out.reset();
    return;
  }
  out = it->template get<T>();
}

} // namespace detail

// ─── Points and series ──────────────────────────────────────────────────

inline void to_json(nlohmann::json &j, const MetricDataPoint &p) {
  j = nlohmann::json{{"timestamp", p.timestamp}, {"value", p.value}};
}

inline void from_json(const nlohmann::json &j, MetricDataPoint &p) {
  j.at("timestamp").get_to(p.timestamp);
  j.at("value").get_to(p.value);
}

/// @brief Serialize a chart bundle as {"cpu": [{timestamp, value}...], ...}.
inline auto charts_to_json(const ChartBundle &charts) -> nlohmann::json {
  nlohmann::json j = nlohmann::json::object();
  for (const auto &[name, points] : charts) {
    j[name] = points;
  }
  return j;
}

// ─── Routes and errors ──────────────────────────────────────────────────

/// minTime is +infinity until the first completion; JSON has no infinity,
/// so it travels as null.
inline void to_json(nlohmann::json &j, const RouteStats &r) {
  j = nlohmann::json{
      {"path", r.path},
      {"method", r.method},
      {"count", r.count},
      {"totalTime", r.total_time},
      {"avgTime", r.avg_time},
      {"minTime", std::isinf(r.min_time) ? nlohmann::json(nullptr)
                                         : nlohmann::json(r.min_time)},
      {"maxTime", r.max_time},
      {"errors", r.error_count},
      {"lastAccess", r.last_access},
  };
}

inline void from_json(const nlohmann::json &j, RouteStats &r) {
  j.at("path").get_to(r.path);
  j.at("method").get_to(r.method);
  r.count = j.value("count", std::uint64_t{0});
  r.total_time = j.value("totalTime", 0.0);
  r.avg_time = j.value("avgTime", 0.0);
  auto min = j.find("minTime");
  r.min_time = (min == j.end() || min->is_null())
                   ? std::numeric_limits<double>::infinity()
                   : min->get<double>();
  r.max_time = j.value("maxTime", 0.0);
  r.error_count = j.value("errors", std::uint64_t{0});
  r.last_access = j.value("lastAccess", std::int64_t{0});
}

inline void to_json(nlohmann::json &j, const ErrorEntry &e) {
  j = nlohmann::json{
      {"timestamp", e.timestamp}, {"path", e.path},
      {"method", e.method},       {"status", e.status},
      {"message", e.message},
  };
}

inline void to_json(nlohmann::json &j, const RateLimitStats &r) {
  j = nlohmann::json{{"blocked", r.blocked}, {"total", r.total}};
}

inline void from_json(const nlohmann::json &j, RateLimitStats &r) {
  r.blocked = j.value("blocked", std::uint64_t{0});
  r.total = j.value("total", std::uint64_t{0});
}

// ─── Snapshot parts ─────────────────────────────────────────────────────

inline void to_json(nlohmann::json &j, const PercentileSet &p) {
  j = nlohmann::json{
      {"p50", p.p50}, {"p95", p.p95}, {"p99", p.p99}, {"avg", p.avg}};
}

inline void to_json(nlohmann::json &j, const AlertFlags &a) {
  j = nlohmann::json{
      {"cpu", a.cpu},
      {"memory", a.memory},
      {"responseTime", a.response_time},
      {"errorRate", a.error_rate},
      {"eventLoopLag", a.event_loop_lag},
  };
}

inline void to_json(nlohmann::json &j, const HealthStatus &h) {
  j = nlohmann::json{{"connected", h.connected}, {"latencyMs", h.latency_ms}};
  detail::put_optional(j, "name", h.name);
}

inline void to_json(nlohmann::json &j, const WorkerInfo &w) {
  j = nlohmann::json{
      {"pid", w.pid},
      {"cpu", w.cpu},
      {"memoryMB", w.memory_mb},
      {"rps", w.rps},
      {"totalRequests", w.total_requests},
      {"responseTime", w.response_time},
  };
}

inline void to_json(nlohmann::json &j, const MetricsSnapshot &s) {
  j = nlohmann::json{
      {"timestamp", s.timestamp},
      {"cpu", s.cpu},
      {"memoryMB", s.memory_mb},
      {"memoryPercent", s.memory_percent},
      {"heapUsedMB", s.heap_used_mb},
      {"heapTotalMB", s.heap_total_mb},
      {"heapGrowthRate", s.heap_growth_rate},
      {"loadAvg", s.load_avg},
      {"uptime", s.uptime},
      {"processUptime", s.process_uptime},
      {"eventLoopLag", s.event_loop_lag},
      {"responseTime", s.response_time},
      {"rps", s.rps},
      {"statusCodes", s.status_codes},
      {"totalRequests", s.total_requests},
      {"activeConnections", s.active_connections},
      {"percentiles", s.percentiles},
      {"topRoutes", s.top_routes},
      {"slowestRoutes", s.slowest_routes},
      {"errorRoutes", s.error_routes},
      {"recentErrors", s.recent_errors},
      {"rateLimitStats", s.rate_limit},
      {"errorRate", s.error_rate},
      {"alerts", s.alerts},
      {"database", s.database},
      {"hostname", s.hostname},
      {"platform", s.platform},
      {"runtime", s.runtime},
      {"pid", s.pid},
      {"cpuCount", s.cpu_count},
      {"reducedMode", s.reduced_mode},
  };
  detail::put_optional(j, "workers", s.workers);
  detail::put_optional(j, "workerCount", s.worker_count);
}

// ─── Wire message ───────────────────────────────────────────────────────

inline void to_json(nlohmann::json &j, const PartialSnapshot &p) {
  j = nlohmann::json::object();
  detail::put_optional(j, "cpu", p.cpu);
  detail::put_optional(j, "memoryMB", p.memory_mb);
  detail::put_optional(j, "rps", p.rps);
  detail::put_optional(j, "responseTime", p.response_time);
  detail::put_optional(j, "errorRate", p.error_rate);
  detail::put_optional(j, "totalRequests", p.total_requests);
  detail::put_optional(j, "activeConnections", p.active_connections);
  detail::put_optional(j, "statusCodes", p.status_codes);
  detail::put_optional(j, "rateLimitStats", p.rate_limit);
  detail::put_optional(j, "topRoutes", p.top_routes);
  detail::put_optional(j, "slowestRoutes", p.slowest_routes);
  detail::put_optional(j, "errorRoutes", p.error_routes);
}

inline void from_json(const nlohmann::json &j, PartialSnapshot &p) {
  detail::get_optional(j, "cpu", p.cpu);
  detail::get_optional(j, "memoryMB", p.memory_mb);
  detail::get_optional(j, "rps", p.rps);
  detail::get_optional(j, "responseTime", p.response_time);
  detail::get_optional(j, "errorRate", p.error_rate);
  detail::get_optional(j, "totalRequests", p.total_requests);
  detail::get_optional(j, "activeConnections", p.active_connections);
  detail::get_optional(j, "statusCodes", p.status_codes);
  detail::get_optional(j, "rateLimitStats", p.rate_limit);
  detail::get_optional(j, "topRoutes", p.top_routes);
  detail::get_optional(j, "slowestRoutes", p.slowest_routes);
  detail::get_optional(j, "errorRoutes", p.error_routes);
}

inline void to_json(nlohmann::json &j, const WorkerMetricsMessage &m) {
  j = nlohmann::json{
      {"type", std::string{kWorkerMetricsType}},
      {"workerId", m.worker_id},
      {"pid", m.pid},
      {"partialSnapshot", m.snapshot},
      {"charts", charts_to_json(m.charts)},
  };
}

/// Throws nlohmann::json::exception on a missing or mistyped field. The
/// "type" tag is checked by the caller.
inline void from_json(const nlohmann::json &j, WorkerMetricsMessage &m) {
  j.at("workerId").get_to(m.worker_id);
  j.at("pid").get_to(m.pid);
  m.snapshot = j.value("partialSnapshot", nlohmann::json::object())
                   .get<PartialSnapshot>();
  m.charts.clear();
  if (auto it = j.find("charts"); it != j.end() && it->is_object()) {
    for (const auto &[name, points] : it->items()) {
      m.charts.emplace(name, points.get<TimeSeries>());
    }
  }
}

} // namespace statmon
