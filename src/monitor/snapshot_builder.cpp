/// @file snapshot_builder.cpp
/// @brief Implementation of SnapshotBuilder.

#include "monitor/snapshot_builder.hpp"
#include "metrics/numeric.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace statmon {

SnapshotBuilder::SnapshotBuilder(const MonitorConfig &cfg,
                                 const RouteTable &routes,
                                 const RollingHistory &history,
                                 const PercentileEstimator &percentiles,
                                 const HostSampler &host) noexcept
    : cfg_{cfg}, routes_{routes}, history_{history},
      percentiles_{percentiles}, host_{host},
      started_{std::chrono::steady_clock::now()} {}

auto SnapshotBuilder::probe_health() const -> HealthStatus {
  if (!cfg_.health_probe) {
    return HealthStatus{.connected = true};
  }

  using Clock = std::chrono::steady_clock;
  const auto t0 = Clock::now();
  try {
    auto result = cfg_.health_probe().get();
    const auto measured =
        std::chrono::duration<double, std::milli>(Clock::now() - t0).count();
    return HealthStatus{
        .connected = result.connected,
        .latency_ms = result.latency_ms != 0.0 ? result.latency_ms
                                               : round_to(measured, 2),
        .name = std::move(result.name),
    };
  } catch (const std::exception &e) {
    std::cerr << "[SnapshotBuilder] health probe failed: " << e.what()
              << "\n";
    return HealthStatus{.connected = false, .latency_ms = 0.0};
  } catch (...) {
    std::cerr << "[SnapshotBuilder] health probe failed\n";
    return HealthStatus{.connected = false, .latency_ms = 0.0};
  }
}

auto SnapshotBuilder::alert_inputs() const -> AlertInputs {
  return AlertInputs{
      .cpu = history_.latest(series::kCpu),
      .memory_percent = host_.memory().percent,
      .response_time = history_.latest(series::kResponseTime),
      .error_rate = routes_.error_rate(),
      .event_loop_lag = history_.latest(series::kEventLoopLag),
  };
}

auto SnapshotBuilder::build() const -> MetricsSnapshot {
  const auto &caps = cfg_.capabilities;
  const auto memory = host_.memory();
  const auto process = host_.process_memory();
  const auto limit = cfg_.max_routes;

  MetricsSnapshot s;
  s.timestamp = cfg_.now();

  s.cpu = history_.latest(series::kCpu);
  s.memory_mb = memory.used_mb;
  s.memory_percent = memory.percent;
  s.heap_used_mb = process.resident_mb;
  s.heap_total_mb = process.virtual_mb;
  s.heap_growth_rate = host_.growth_rate();
  s.load_avg = host_.load_average();
  s.uptime = host_.host_uptime();
  s.process_uptime = std::chrono::duration_cast<std::chrono::seconds>(
                         std::chrono::steady_clock::now() - started_)
                         .count();
  s.event_loop_lag = history_.latest(series::kEventLoopLag);

  s.response_time = history_.latest(series::kResponseTime);
  s.rps = history_.latest(series::kRps);
  s.status_codes = routes_.status_codes();
  s.total_requests = routes_.total_requests();
  s.active_connections = routes_.active_connections();
  s.percentiles = percentiles_.compute();
  s.top_routes = routes_.top_by_count(limit);
  s.slowest_routes = routes_.slowest_by_avg(limit);
  s.error_routes = routes_.most_errors(limit);
  s.recent_errors = routes_.recent_errors();
  s.rate_limit = routes_.rate_limit();
  s.error_rate = routes_.error_rate();

  s.alerts = evaluate_alerts(alert_inputs(), cfg_.alerts, caps);
  s.database = probe_health();

  s.hostname = HostSampler::hostname();
  s.platform = HostSampler::platform();
  s.runtime = HostSampler::runtime();
  s.pid = HostSampler::process_id();
  s.cpu_count = HostSampler::cpu_count();
  s.reduced_mode = caps.reduced_mode();

  if (!caps.process_metrics) {
    s.heap_growth_rate = 0.0;
  }
  if (!caps.event_loop_lag) {
    s.event_loop_lag = 0.0;
  }
  return s;
}

} // namespace statmon
