/// @file aggregator.cpp
/// @brief Implementation of ClusterAggregator.

#include "cluster/aggregator.hpp"
#include "metrics/numeric.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace statmon {

// ─── Free helpers ───────────────────────────────────────────────────────

auto merge_routes(const std::vector<RouteStats> &routes)
    -> std::vector<RouteStats> {
  std::vector<RouteStats> merged;
  std::unordered_map<std::string, std::size_t> index;

  for (const auto &route : routes) {
    auto [it, inserted] = index.try_emplace(route.key().str(), merged.size());
    if (inserted) {
      merged.push_back(route);
      continue;
    }

    auto &m = merged[it->second];
    m.count += route.count;
    m.total_time += route.total_time;
    m.avg_time =
        m.count > 0 ? m.total_time / static_cast<double>(m.count) : 0.0;
    m.min_time = std::min(m.min_time, route.min_time);
    m.max_time = std::max(m.max_time, route.max_time);
    m.error_count += route.error_count;
    m.last_access = std::max(m.last_access, route.last_access);
  }
  return merged;
}

auto merge_series(const std::vector<const TimeSeries *> &inputs,
                  MergeMode mode) -> TimeSeries {
  struct Bucket {
    double sum = 0.0;
    std::size_t count = 0;
  };
  std::map<std::int64_t, Bucket> by_time;

  for (const auto *points : inputs) {
    for (const auto &p : *points) {
      auto &b = by_time[p.timestamp];
      b.sum += p.value;
      ++b.count;
    }
  }

  TimeSeries out;
  out.reserve(by_time.size());
  for (const auto &[ts, b] : by_time) {
    const double v = mode == MergeMode::Sum
                         ? b.sum
                         : b.sum / static_cast<double>(b.count);
    out.push_back({.timestamp = ts, .value = round_to(v, 2)});
  }
  return out;
}

// ─── ClusterAggregator ──────────────────────────────────────────────────

ClusterAggregator::ClusterAggregator(NowFn now, std::size_t max_routes,
                                     std::int64_t stale_after_ms)
    : now_{std::move(now)}, max_routes_{max_routes},
      stale_after_ms_{stale_after_ms} {}

void ClusterAggregator::ingest(std::int64_t worker_id, std::int64_t pid,
                               PartialSnapshot snapshot, ChartBundle charts) {
  records_[worker_id] = WorkerRecord{
      .worker_id = worker_id,
      .pid = pid,
      .snapshot = std::move(snapshot),
      .charts = std::move(charts),
      .last_seen = now_(),
  };
}

void ClusterAggregator::ingest(WorkerMetricsMessage message) {
  ingest(message.worker_id, message.pid, std::move(message.snapshot),
         std::move(message.charts));
}

auto ClusterAggregator::evict_stale() -> std::size_t {
  const auto now = now_();
  return std::erase_if(records_, [&](const auto &entry) {
    return now - entry.second.last_seen > stale_after_ms_;
  });
}

auto ClusterAggregator::worker_count() -> std::size_t {
  evict_stale();
  return records_.size();
}

auto ClusterAggregator::workers() -> std::vector<WorkerInfo> {
  evict_stale();
  std::vector<WorkerInfo> out;
  out.reserve(records_.size());
  for (const auto &[id, rec] : records_) {
    const auto &m = rec.snapshot;
    out.push_back(WorkerInfo{
        .pid = rec.pid,
        .cpu = m.cpu.value_or(0.0),
        .memory_mb = m.memory_mb.value_or(0.0),
        .rps = m.rps.value_or(0.0),
        .total_requests = m.total_requests.value_or(0),
        .response_time = m.response_time.value_or(0.0),
    });
  }
  return out;
}

auto ClusterAggregator::aggregate_snapshot(const MetricsSnapshot &local)
    -> MetricsSnapshot {
  evict_stale();
  if (records_.empty()) {
    return local;
  }

  double rps = 0.0;
  std::uint64_t total_requests = 0;
  std::uint64_t active_connections = 0;
  double cpu = 0.0;
  double response_time = 0.0;
  double error_rate = 0.0;
  StatusCodeCounts status_codes;
  RateLimitStats rate_limit;
  std::vector<RouteStats> routes;

  for (const auto &[id, rec] : records_) {
    const auto &m = rec.snapshot;

    rps += m.rps.value_or(0.0);
    total_requests += m.total_requests.value_or(0);
    active_connections += m.active_connections.value_or(0);

    cpu += m.cpu.value_or(0.0);
    response_time += m.response_time.value_or(0.0);
    error_rate += m.error_rate.value_or(0.0);

    if (m.status_codes) {
      for (const auto &[code, count] : *m.status_codes) {
        status_codes[code] += count;
      }
    }
    if (m.rate_limit) {
      rate_limit.blocked += m.rate_limit->blocked;
      rate_limit.total += m.rate_limit->total;
    }

    // A route can sit in several of one worker's ranked lists; it is the
    // same entry and must be counted once.
    std::unordered_set<std::string> seen;
    for (const auto *list : {&m.top_routes, &m.slowest_routes,
                             &m.error_routes}) {
      if (!*list) {
        continue;
      }
      for (const auto &route : **list) {
        if (seen.insert(route.key().str()).second) {
          routes.push_back(route);
        }
      }
    }
  }

  const auto n = static_cast<double>(records_.size());
  const auto merged = merge_routes(routes);

  MetricsSnapshot out = local;
  out.cpu = round_to(cpu / n, 1);
  out.response_time = round_to(response_time / n, 2);
  out.error_rate = round_to(error_rate / n, 2);
  out.rps = rps;
  out.total_requests = total_requests;
  out.active_connections = active_connections;
  if (!status_codes.empty()) {
    out.status_codes = std::move(status_codes);
  }
  out.rate_limit = rate_limit;
  out.top_routes = rank_routes(merged, RouteRanking::ByCount, max_routes_);
  out.slowest_routes =
      rank_routes(merged, RouteRanking::BySlowest, max_routes_);
  out.error_routes = rank_routes(merged, RouteRanking::ByErrors, max_routes_);
  out.workers = workers();
  out.worker_count = records_.size();
  return out;
}

auto ClusterAggregator::aggregate_charts(const ChartBundle &local)
    -> ChartBundle {
  evict_stale();
  if (records_.empty()) {
    return local;
  }

  std::set<std::string, std::less<>> names;
  for (const auto &[name, points] : local) {
    names.insert(name);
  }
  for (const auto &[id, rec] : records_) {
    for (const auto &[name, points] : rec.charts) {
      names.insert(name);
    }
  }

  ChartBundle out;
  for (const auto &name : names) {
    std::vector<const TimeSeries *> inputs;
    if (auto it = local.find(name); it != local.end()) {
      inputs.push_back(&it->second);
    }
    for (const auto &[id, rec] : records_) {
      if (auto it = rec.charts.find(name); it != rec.charts.end()) {
        inputs.push_back(&it->second);
      }
    }
    out.emplace(name, merge_series(inputs, merge_mode_for(name)));
  }
  return out;
}

} // namespace statmon
