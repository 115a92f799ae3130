/// @file traffic_generator.cpp
/// @brief Synthetic request load implementation.

#include "demo/traffic_generator.hpp"

#include <array>
#include <chrono>
#include <string>
#include <string_view>

namespace statmon::demo {

namespace {

struct Endpoint {
  const char *method;
  const char *path;
  double base_latency_ms; ///< Added to the random latency.
};

// Weighted pool: GET-heavy, with one deliberately slow route and ids in
// paths so normalization has something to collapse.
constexpr std::array<Endpoint, 20> kPool = {{
    {"GET", "/api/users", 0.0},
    {"GET", "/api/users", 0.0},
    {"GET", "/api/users", 0.0},
    {"GET", "/api/users/42", 0.0},
    {"GET", "/api/users/1337", 0.0},
    {"GET", "/api/users/507f1f77bcf86cd799439011", 0.0},
    {"GET", "/api/data", 0.0},
    {"GET", "/api/data", 0.0},
    {"GET", "/api/metrics", 0.0},
    {"GET", "/api/sessions/9c5b94b1-35ad-49bb-b118-8e8fc24abf80", 0.0},
    {"POST", "/api/users", 10.0},
    {"POST", "/api/upload", 40.0},
    {"POST", "/api/upload", 40.0},
    {"POST", "/api/sessions", 5.0},
    {"PUT", "/api/users/42", 8.0},
    {"PUT", "/api/data/17", 8.0},
    {"PUT", "/api/data/17", 8.0},
    {"DELETE", "/api/sessions/7", 0.0},
    {"DELETE", "/api/users/99", 0.0},
    {"GET", "/api/reports/quarterly", 300.0},
}};

constexpr std::array<int, 4> kClientErrors = {400, 401, 404, 429};
constexpr std::array<int, 3> kServerErrors = {500, 502, 503};

} // namespace

// ─── TrafficGenerator ───────────────────────────────────────────────────

TrafficGenerator::TrafficGenerator(net::io_context &ioc,
                                   StatusMonitor &monitor, TrafficConfig cfg)
    : ioc_{ioc}, monitor_{monitor}, cfg_{cfg} {}

void TrafficGenerator::start() {
  if (timer_)
    return;
  timer_ = std::make_unique<net::steady_timer>(ioc_);
  schedule_batch();
}

void TrafficGenerator::stop() {
  if (!timer_)
    return;
  timer_->cancel();
  timer_.reset();
}

void TrafficGenerator::schedule_batch() {
  timer_->expires_after(std::chrono::milliseconds(cfg_.batch_interval_ms));
  timer_->async_wait([this](const boost::system::error_code &ec) {
    if (ec || !timer_)
      return;
    fire_batch();
    schedule_batch();
  });
}

void TrafficGenerator::fire_batch() {
  carry_ += static_cast<double>(cfg_.requests_per_second) *
            static_cast<double>(cfg_.batch_interval_ms) / 1000.0;
  while (carry_ >= 1.0) {
    fire_one();
    carry_ -= 1.0;
  }
}

void TrafficGenerator::fire_one() {
  std::uniform_int_distribution<std::size_t> pick(0, kPool.size() - 1);
  std::uniform_real_distribution<double> unit(0.0, 1.0);
  std::uniform_real_distribution<double> latency(cfg_.min_latency_ms,
                                                 cfg_.max_latency_ms);

  const auto &ep = kPool[pick(rng_)];

  if (unit(rng_) < cfg_.rate_limit_ratio) {
    monitor_.on_rate_limit_event(true);
    ++stats_.blocked;
    return;
  }
  monitor_.on_rate_limit_event(false);

  int status = 200;
  auto roll = unit(rng_);
  if (roll < cfg_.server_error_ratio) {
    status = kServerErrors[rng_() % kServerErrors.size()];
  } else if (roll < cfg_.server_error_ratio + cfg_.client_error_ratio) {
    status = kClientErrors[rng_() % kClientErrors.size()];
  } else if (std::string_view{ep.method} == "POST") {
    status = 201;
  } else if (std::string_view{ep.method} == "DELETE") {
    status = 204;
  }

  double duration = ep.base_latency_ms + latency(rng_);

  monitor_.on_request_start(ep.path, ep.method);
  ++stats_.started;

  auto done = std::make_shared<net::steady_timer>(
      ioc_, std::chrono::microseconds(static_cast<long>(duration * 1000.0)));
  done->async_wait([this, done, &ep, duration,
                    status](const boost::system::error_code &ec) {
    if (ec)
      return;
    monitor_.on_request_complete(ep.path, ep.method, duration, status);
    ++stats_.completed;
    if (status >= 400)
      ++stats_.errors;
  });
}

} // namespace statmon::demo
