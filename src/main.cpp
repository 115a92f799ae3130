/// @file main.cpp
/// @brief Demo program: runs a StatusMonitor fed by synthetic traffic and
///        serves its snapshot and charts over HTTP.
///
/// Roles:
///   standalone   monitor + HTTP server (default)
///   worker       monitor reporting to a coordinator over a local socket
///   coordinator  monitor + HTTP server aggregating every worker's reports

#include "cluster/local_socket_channel.hpp"
#include "demo/traffic_generator.hpp"
#include "monitor/config.hpp"
#include "monitor/status_monitor.hpp"
#include "server/status_server.hpp"

#include <boost/asio.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace {

using namespace statmon;

// ─── CLI argument parsing ───────────────────────────────────────────────

enum class Role { Standalone, Worker, Coordinator };

struct DemoArgs {
  unsigned short port = 8080;
  std::string config_path;
  Role role = Role::Standalone;
  std::string socket_path = "/tmp/statmon.sock";
  std::int64_t worker_id = 0;
  bool reduced = false;
  std::size_t rps = 50;
};

void print_usage(const char *prog) {
  std::cout
      << "Usage: " << prog << " [options]\n\n"
      << "Options:\n"
      << "  --port <N>           HTTP port (default: 8080)\n"
      << "  --config <FILE>      JSON config file\n"
      << "  --role <R>           standalone|worker|coordinator "
         "(default: standalone)\n"
      << "  --socket <PATH>      Coordinator socket (default: "
         "/tmp/statmon.sock)\n"
      << "  --worker-id <N>      Id reported by a worker\n"
      << "  --reduced            Request metrics only, no host gauges\n"
      << "  --rps <N>            Synthetic requests per second (default: 50, "
         "0 disables)\n"
      << "  --help               Show this help\n";
}

auto parse_role(const std::string &s) -> Role {
  if (s == "worker")
    return Role::Worker;
  if (s == "coordinator")
    return Role::Coordinator;
  return Role::Standalone;
}

auto role_name(Role r) -> const char * {
  switch (r) {
  case Role::Standalone:
    return "standalone";
  case Role::Worker:
    return "worker";
  case Role::Coordinator:
    return "coordinator";
  }
  return "unknown";
}

auto parse_args(int argc, char *argv[]) -> DemoArgs {
  DemoArgs args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "--port" && i + 1 < argc) {
      args.port = static_cast<unsigned short>(std::stoul(argv[++i]));
    } else if (arg == "--config" && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if (arg == "--role" && i + 1 < argc) {
      args.role = parse_role(argv[++i]);
    } else if (arg == "--socket" && i + 1 < argc) {
      args.socket_path = argv[++i];
    } else if (arg == "--worker-id" && i + 1 < argc) {
      args.worker_id = std::stoll(argv[++i]);
    } else if (arg == "--reduced") {
      args.reduced = true;
    } else if (arg == "--rps" && i + 1 < argc) {
      args.rps = std::stoull(argv[++i]);
    }
  }
  return args;
}

// ─── Console summary ────────────────────────────────────────────────────

void print_summary(const MetricsSnapshot &s) {
  std::cout << std::fixed << std::setprecision(1);
  std::cout << "[summary] rps " << s.rps << "  p95 " << s.percentiles.p95
            << " ms  errors " << s.error_rate << "%  active "
            << s.active_connections << "  total " << s.total_requests;
  if (s.worker_count) {
    std::cout << "  workers " << *s.worker_count;
  }
  if (s.alerts.any()) {
    std::cout << "  ALERT";
  }
  std::cout << "  up " << format_uptime(s.process_uptime) << "\n";
}

void schedule_summary(net::steady_timer &timer, StatusMonitor &monitor) {
  timer.expires_after(std::chrono::seconds(5));
  timer.async_wait([&timer, &monitor](const boost::system::error_code &ec) {
    if (ec)
      return;
    print_summary(monitor.snapshot());
    schedule_summary(timer, monitor);
  });
}

} // namespace

// ─── main ───────────────────────────────────────────────────────────────

int main(int argc, char *argv[]) {
  auto args = parse_args(argc, argv);

  MonitorConfig cfg;
  if (!args.config_path.empty()) {
    auto loaded = load_config(args.config_path);
    if (!loaded.has_value()) {
      std::cerr << "Failed to load config " << args.config_path << ": "
                << loaded.error().message() << "\n";
      return 1;
    }
    cfg = std::move(*loaded);
  }
  if (args.reduced) {
    cfg.capabilities = Capabilities::reduced();
  }
  if (args.role != Role::Standalone) {
    cfg.cluster_mode = true;
  }
  if (args.worker_id != 0) {
    cfg.worker_id = args.worker_id;
  }

  std::cout << "=== statmon demo ===\n";
  std::cout << "Role:        " << role_name(args.role) << "\n";
  std::cout << "Host:        " << HostSampler::hostname() << " ("
            << HostSampler::platform() << ", " << HostSampler::cpu_count()
            << " cpus)\n";
  std::cout << "Capabilities: "
            << (cfg.capabilities.reduced_mode() ? "reduced" : "full") << "\n";

  net::io_context ioc{1};
  StatusMonitor monitor{std::move(cfg)};

  // ─── Cluster wiring ──────────────────────────────────────────────────

  std::shared_ptr<LocalSocketChannel> channel;
  if (args.role == Role::Coordinator) {
    auto listening = LocalSocketChannel::listen(ioc, args.socket_path);
    if (!listening.has_value()) {
      std::cerr << "Failed to listen on " << args.socket_path << ": "
                << listening.error().message() << "\n";
      return 1;
    }
    channel = *listening;
    monitor.accept_reports_from(channel);
  } else if (args.role == Role::Worker) {
    channel = LocalSocketChannel::connect(ioc, args.socket_path);
    monitor.report_to(channel);
  }

  // ─── HTTP endpoint (not on workers) ──────────────────────────────────

  std::optional<StatusServer> server;
  if (args.role != Role::Worker) {
    try {
      server.emplace(ioc, args.port, monitor);
    } catch (const boost::system::system_error &e) {
      std::cerr << "Failed to bind port " << args.port << ": " << e.what()
                << "\n";
      return 1;
    }
    server->start();
  }

  // ─── Load and timers ─────────────────────────────────────────────────

  demo::TrafficGenerator traffic{
      ioc, monitor, demo::TrafficConfig{.requests_per_second = args.rps}};
  if (args.rps > 0) {
    traffic.start();
  }

  monitor.start(ioc);

  net::steady_timer summary_timer{ioc};
  schedule_summary(summary_timer, monitor);

  net::signal_set signals{ioc, SIGINT, SIGTERM};
  signals.async_wait([&](const boost::system::error_code &, int) {
    std::cout << "\nShutting down\n";
    traffic.stop();
    monitor.stop();
    summary_timer.cancel();
    if (server)
      server->stop();
    if (channel)
      channel->close();
    ioc.stop();
  });

  ioc.run();

  const auto &t = traffic.stats();
  std::cout << "Generated " << t.started << " requests (" << t.errors
            << " errors, " << t.blocked << " rate limited)\n";
  return 0;
}
