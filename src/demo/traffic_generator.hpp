#pragma once
/// @file traffic_generator.hpp
/// @brief Synthetic request load for the demo executable.
///
/// Fires weighted random requests at a StatusMonitor on an io_context
/// timer. Each request is started immediately and completed after a random
/// latency, so in-flight requests show up as active connections.

#include "monitor/status_monitor.hpp"

#include <boost/asio.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>

namespace statmon::demo {

/// @brief Load generator configuration.
struct TrafficConfig {
  std::size_t requests_per_second = 50;
  std::int64_t batch_interval_ms = 100; ///< Requests are fired in batches.
  double min_latency_ms = 2.0;
  double max_latency_ms = 120.0;
  double client_error_ratio = 0.04; ///< Share of requests answered 4xx.
  double server_error_ratio = 0.01; ///< Share of requests answered 5xx.
  double rate_limit_ratio = 0.02;   ///< Share of requests that are blocked.
};

/// @brief Running counts of what the generator has produced.
struct TrafficStats {
  std::uint64_t started = 0;
  std::uint64_t completed = 0;
  std::uint64_t errors = 0;
  std::uint64_t blocked = 0;
};

class TrafficGenerator {
public:
  TrafficGenerator(net::io_context &ioc, StatusMonitor &monitor,
                   TrafficConfig cfg = {});

  void start();
  void stop();

  [[nodiscard]] auto stats() const noexcept -> const TrafficStats & {
    return stats_;
  }

private:
  void schedule_batch();
  void fire_batch();
  void fire_one();

  net::io_context &ioc_;
  StatusMonitor &monitor_;
  TrafficConfig cfg_;
  TrafficStats stats_;
  std::mt19937 rng_{std::random_device{}()};
  double carry_ = 0.0; ///< Fractional requests owed to the next batch.
  std::unique_ptr<net::steady_timer> timer_;
};

} // namespace statmon::demo
