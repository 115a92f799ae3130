#pragma once
/// @file status_monitor.hpp
/// @brief Single-entry-point façade for request telemetry collection.
///
/// Owns the whole collection pipeline (RouteTable, RollingHistory,
/// PercentileEstimator, HostSampler, SnapshotBuilder) and, in cluster mode,
/// the ClusterAggregator. One instance is created at startup and handed to
/// every collaborator; there is no global state.
///
/// Usage:
/// @code
///   boost::asio::io_context ioc;
///   statmon::StatusMonitor monitor{{.retention_seconds = 120}};
///   monitor.start(ioc);
///   monitor.on_request_start("/api/users/42", "GET");
///   monitor.on_request_complete("/api/users/42", "GET", 12.5, 200);
///   auto snap = monitor.snapshot();
/// @endcode

#include "cluster/aggregator.hpp"
#include "cluster/channel.hpp"
#include "metrics/percentiles.hpp"
#include "metrics/route_table.hpp"
#include "metrics/time_series.hpp"
#include "monitor/config.hpp"
#include "monitor/snapshot.hpp"
#include "monitor/snapshot_builder.hpp"
#include "platform/host_sampler.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace statmon {

namespace net = boost::asio;

/// @brief Collects request telemetry for one process.
///
/// Thread-safety: none. Request events, the rollover timer and reads must
/// all run on the same thread (typically the io_context's).
class StatusMonitor {
public:
  explicit StatusMonitor(MonitorConfig cfg = {});
  ~StatusMonitor();

  // Components hold references into this object.
  StatusMonitor(const StatusMonitor &) = delete;
  StatusMonitor &operator=(const StatusMonitor &) = delete;
  StatusMonitor(StatusMonitor &&) = delete;
  StatusMonitor &operator=(StatusMonitor &&) = delete;

  // ─── Request events ─────────────────────────────────────────────────

  void on_request_start(std::string_view path, std::string_view method);
  void on_request_complete(std::string_view path, std::string_view method,
                           double duration_ms, int status);
  void on_rate_limit_event(bool blocked);

  // ─── Rollover ───────────────────────────────────────────────────────

  /// @brief Roll the interval counters into the history once, and in
  /// cluster mode report to the coordinator.
  void tick();

  /// @brief Run tick() every update_interval_ms on @p ioc. No-op if
  /// already running.
  void start(net::io_context &ioc);

  /// @brief Cancel the rollover timer. No-op if not running.
  void stop();

  [[nodiscard]] auto running() const noexcept -> bool {
    return timer_ != nullptr;
  }

  // ─── Reads ──────────────────────────────────────────────────────────

  /// @brief This process only.
  [[nodiscard]] auto local_snapshot() const -> MetricsSnapshot;
  [[nodiscard]] auto local_charts() const -> ChartBundle;

  /// @brief The cluster-wide view when workers are reporting, otherwise
  /// the local one.
  [[nodiscard]] auto snapshot() -> MetricsSnapshot;
  [[nodiscard]] auto charts() -> ChartBundle;

  // ─── Cluster ────────────────────────────────────────────────────────

  /// @brief Send a worker-metrics message over @p channel on every tick.
  void report_to(std::shared_ptr<Channel> channel);

  /// @brief Feed every message arriving on @p channel to
  /// ingest_worker_message().
  void accept_reports_from(std::shared_ptr<Channel> channel);

  /// @brief Ingest one inbound message. Anything that is not a well-formed
  /// worker-metrics message is ignored.
  /// @return True if the message was folded into the aggregator.
  auto ingest_worker_message(const nlohmann::json &message) -> bool;

  /// @brief The message this process would report right now.
  [[nodiscard]] auto worker_message() const -> nlohmann::json;

  [[nodiscard]] auto cluster_mode() const noexcept -> bool {
    return aggregator_.has_value();
  }

  [[nodiscard]] auto aggregator() noexcept -> ClusterAggregator * {
    return aggregator_ ? &*aggregator_ : nullptr;
  }

  [[nodiscard]] auto config() const noexcept -> const MonitorConfig & {
    return cfg_;
  }

  [[nodiscard]] auto routes() const noexcept -> const RouteTable & {
    return routes_;
  }

private:
  void schedule_tick();
  [[nodiscard]] auto measure_event_loop_lag() -> double;

  MonitorConfig cfg_;
  std::int64_t worker_id_;

  RouteTable routes_;
  RollingHistory history_;
  PercentileEstimator percentiles_;
  HostSampler host_;
  SnapshotBuilder builder_;
  std::optional<ClusterAggregator> aggregator_;

  std::shared_ptr<Channel> upstream_;
  std::shared_ptr<Channel> downstream_;

  std::unique_ptr<net::steady_timer> timer_;
  std::int64_t last_tick_ms_;
};

/// @brief "1d 1h 1m 5s"; zero day, hour and minute units are omitted,
/// seconds are always shown.
[[nodiscard]] auto format_uptime(std::int64_t seconds) -> std::string;

} // namespace statmon
