/// @file status_monitor.cpp
/// @brief Implementation of the StatusMonitor façade.

#include "monitor/status_monitor.hpp"
#include "metrics/numeric.hpp"
#include "serialization/json_serializer.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <utility>
#include <vector>

namespace statmon {

StatusMonitor::StatusMonitor(MonitorConfig cfg)
    : cfg_{std::move(cfg)},
      worker_id_{cfg_.worker_id != 0 ? cfg_.worker_id : detect_worker_id()},
      routes_{cfg_.path_normalizer, cfg_.max_recent_errors, cfg_.now},
      history_{cfg_.retention_seconds, cfg_.now},
      host_{cfg_.capabilities},
      builder_{cfg_, routes_, history_, percentiles_, host_},
      last_tick_ms_{cfg_.now()} {
  if (cfg_.cluster_mode.value_or(detect_cluster_mode())) {
    aggregator_.emplace(cfg_.now, cfg_.max_routes);
  }
}

StatusMonitor::~StatusMonitor() { stop(); }

// ─── Request events ─────────────────────────────────────────────────────

void StatusMonitor::on_request_start(std::string_view path,
                                     std::string_view method) {
  routes_.record_start(path, method);
}

void StatusMonitor::on_request_complete(std::string_view path,
                                        std::string_view method,
                                        double duration_ms, int status) {
  routes_.record_complete(path, method, duration_ms, status);
  percentiles_.add(duration_ms);
}

void StatusMonitor::on_rate_limit_event(bool blocked) {
  routes_.record_rate_limit(blocked);
}

// ─── Rollover ───────────────────────────────────────────────────────────

auto StatusMonitor::measure_event_loop_lag() -> double {
  const auto now = cfg_.now();
  const auto actual = now - std::exchange(last_tick_ms_, now);
  const auto lag = std::max<std::int64_t>(0, actual - cfg_.update_interval_ms);
  return round_to(static_cast<double>(lag), 1);
}

void StatusMonitor::tick() {
  const auto &caps = cfg_.capabilities;
  const auto lag = measure_event_loop_lag();

  if (caps.host_metrics) {
    history_.append(series::kCpu, host_.cpu_percent());
    history_.append(series::kMemory, host_.memory().used_mb);
    history_.append(series::kLoadAvg, host_.load_average());
  }
  if (caps.process_metrics) {
    history_.append(series::kHeap, host_.sample_process_memory().resident_mb);
  }
  if (caps.event_loop_lag) {
    history_.append(series::kEventLoopLag, lag);
  }
  history_.append(series::kErrorRate, routes_.error_rate());

  const auto interval = routes_.take_interval();
  history_.append(series::kRps, static_cast<double>(interval.requests));
  history_.append(series::kResponseTime,
                  interval.response_count > 0
                      ? round_to(interval.response_time_sum /
                                     static_cast<double>(
                                         interval.response_count),
                                 2)
                      : 0.0);

  if (upstream_) {
    upstream_->send(worker_message());
  }
}

void StatusMonitor::schedule_tick() {
  timer_->expires_after(std::chrono::milliseconds(cfg_.update_interval_ms));
  timer_->async_wait([this](const boost::system::error_code &ec) {
    if (ec) {
      return; // Cancelled by stop().
    }
    tick();
    schedule_tick();
  });
}

void StatusMonitor::start(net::io_context &ioc) {
  if (timer_) {
    return;
  }
  last_tick_ms_ = cfg_.now();
  timer_ = std::make_unique<net::steady_timer>(ioc);
  schedule_tick();
  std::cout << "[StatusMonitor] started (interval " << cfg_.update_interval_ms
            << " ms, retention " << cfg_.retention_seconds << " s"
            << (cluster_mode() ? ", cluster mode" : "")
            << (cfg_.capabilities.reduced_mode() ? ", reduced mode" : "")
            << ")\n";
}

void StatusMonitor::stop() {
  if (!timer_) {
    return;
  }
  timer_->cancel();
  timer_.reset();
  std::cout << "[StatusMonitor] stopped\n";
}

// ─── Reads ──────────────────────────────────────────────────────────────

auto StatusMonitor::local_snapshot() const -> MetricsSnapshot {
  return builder_.build();
}

auto StatusMonitor::local_charts() const -> ChartBundle {
  return history_.bundle(series::kAll);
}

auto StatusMonitor::snapshot() -> MetricsSnapshot {
  auto local = local_snapshot();
  if (!aggregator_) {
    return local;
  }
  return aggregator_->aggregate_snapshot(local);
}

auto StatusMonitor::charts() -> ChartBundle {
  auto local = local_charts();
  if (!aggregator_) {
    return local;
  }
  return aggregator_->aggregate_charts(local);
}

// ─── Cluster ────────────────────────────────────────────────────────────

void StatusMonitor::report_to(std::shared_ptr<Channel> channel) {
  if (!cluster_mode()) {
    std::cerr << "[StatusMonitor] not in cluster mode, not reporting\n";
    return;
  }
  upstream_ = std::move(channel);
}

void StatusMonitor::accept_reports_from(std::shared_ptr<Channel> channel) {
  if (!cluster_mode()) {
    std::cerr << "[StatusMonitor] not in cluster mode, ignoring reports\n";
    return;
  }
  downstream_ = std::move(channel);
  downstream_->on_message(
      [this](const nlohmann::json &message) { ingest_worker_message(message); });
  std::cout << "[StatusMonitor] aggregating worker reports\n";
}

auto StatusMonitor::ingest_worker_message(const nlohmann::json &message)
    -> bool {
  if (!aggregator_ || !message.is_object()) {
    return false;
  }
  auto type = message.find("type");
  if (type == message.end() || !type->is_string() ||
      type->get<std::string>() != kWorkerMetricsType) {
    return false;
  }

  try {
    aggregator_->ingest(message.get<WorkerMetricsMessage>());
  } catch (const nlohmann::json::exception &e) {
    std::cerr << "[StatusMonitor] dropping malformed worker message: "
              << e.what() << "\n";
    return false;
  }
  return true;
}

auto StatusMonitor::worker_message() const -> nlohmann::json {
  return WorkerMetricsMessage{
      .worker_id = worker_id_,
      .pid = HostSampler::process_id(),
      .snapshot = to_partial(local_snapshot()),
      .charts = local_charts(),
  };
}

// ─── Formatting ─────────────────────────────────────────────────────────

auto format_uptime(std::int64_t seconds) -> std::string {
  const auto days = seconds / 86400;
  const auto hours = (seconds % 86400) / 3600;
  const auto minutes = (seconds % 3600) / 60;
  const auto secs = seconds % 60;

  std::vector<std::string> parts;
  if (days > 0) {
    parts.push_back(std::to_string(days) + "d");
  }
  if (hours > 0) {
    parts.push_back(std::to_string(hours) + "h");
  }
  if (minutes > 0) {
    parts.push_back(std::to_string(minutes) + "m");
  }
  parts.push_back(std::to_string(secs) + "s");

  std::string out;
  for (const auto &p : parts) {
    if (!out.empty()) {
      out += ' ';
    }
    out += p;
  }
  return out;
}

} // namespace statmon
