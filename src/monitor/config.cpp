/// @file config.cpp
/// @brief Implementation of configuration defaults and loading.

#include "monitor/config.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string_view>

namespace statmon {

namespace {

auto env(const char *name) -> std::optional<std::string_view> {
  const char *value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string_view{value};
}

void apply_alerts(const nlohmann::json &j, AlertThresholds &a) {
  a.cpu = j.value("cpu", a.cpu);
  a.memory = j.value("memory", a.memory);
  a.response_time = j.value("responseTime", a.response_time);
  a.error_rate = j.value("errorRate", a.error_rate);
  a.event_loop_lag = j.value("eventLoopLag", a.event_loop_lag);
}

void apply_config(const nlohmann::json &j, MonitorConfig &cfg) {
  cfg.update_interval_ms = j.value("updateIntervalMs", cfg.update_interval_ms);
  cfg.retention_seconds = j.value("retentionSeconds", cfg.retention_seconds);
  cfg.max_recent_errors = j.value("maxRecentErrors", cfg.max_recent_errors);
  cfg.max_routes = j.value("maxRoutes", cfg.max_routes);
  cfg.worker_id = j.value("workerId", cfg.worker_id);
  if (j.contains("clusterMode")) {
    cfg.cluster_mode = j.at("clusterMode").get<bool>();
  }
  if (j.value("reducedMode", false)) {
    cfg.capabilities = Capabilities::reduced();
  }
  if (j.contains("alerts")) {
    apply_alerts(j.at("alerts"), cfg.alerts);
  }
}

} // namespace

auto always_healthy_probe() -> HealthProbe {
  return [] {
    std::promise<HealthResult> p;
    p.set_value(HealthResult{.connected = true, .latency_ms = 0.0});
    return p.get_future();
  };
}

auto detect_cluster_mode() -> bool {
  if (auto flag = env("STATMON_CLUSTER")) {
    return *flag != "0";
  }
  return env("STATMON_WORKER_ID").has_value();
}

auto detect_worker_id() -> std::int64_t {
  auto id = env("STATMON_WORKER_ID");
  if (!id) {
    return 0;
  }
  return std::strtoll(std::string{*id}.c_str(), nullptr, 10);
}

auto load_config(const std::string &path)
    -> std::expected<MonitorConfig, std::error_code> {
  std::ifstream file(path);
  if (!file) {
    return std::unexpected(
        std::make_error_code(std::errc::no_such_file_or_directory));
  }

  MonitorConfig cfg;
  try {
    auto j = nlohmann::json::parse(file);
    if (!j.is_object()) {
      std::cerr << "[config] " << path << ": top level must be an object\n";
      return std::unexpected(
          std::make_error_code(std::errc::invalid_argument));
    }
    apply_config(j, cfg);
  } catch (const nlohmann::json::exception &e) {
    std::cerr << "[config] " << path << ": " << e.what() << "\n";
    return std::unexpected(std::make_error_code(std::errc::invalid_argument));
  }

  if (cfg.update_interval_ms <= 0 || cfg.retention_seconds <= 0) {
    std::cerr << "[config] " << path
              << ": updateIntervalMs and retentionSeconds must be positive\n";
    return std::unexpected(std::make_error_code(std::errc::invalid_argument));
  }

  return cfg;
}

} // namespace statmon
