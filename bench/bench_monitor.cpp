#include "cluster/aggregator.hpp"
#include "monitor/status_monitor.hpp"
#include <benchmark/benchmark.h>
#include <string>
#include <vector>

using namespace statmon;

static auto bench_config() -> MonitorConfig {
  MonitorConfig cfg;
  cfg.capabilities = Capabilities::reduced();
  cfg.cluster_mode = false;
  return cfg;
}

static void BM_Monitor_RecordRequest(benchmark::State &state) {
  StatusMonitor monitor{bench_config()};
  const std::vector<std::string> paths = {
      "/api/users/42", "/api/users", "/api/data/17",
      "/api/sessions/9c5b94b1-35ad-49bb-b118-8e8fc24abf80"};
  std::size_t i = 0;

  for (auto _ : state) {
    const auto &p = paths[i++ % paths.size()];
    monitor.on_request_start(p, "GET");
    monitor.on_request_complete(p, "GET", 12.5, 200);
  }
  state.SetItemsProcessed(state.iterations());
}

static void BM_Monitor_RecordRequestIdentityNormalizer(
    benchmark::State &state) {
  auto cfg = bench_config();
  cfg.path_normalizer = [](std::string_view p) { return std::string{p}; };
  StatusMonitor monitor{std::move(cfg)};

  for (auto _ : state) {
    monitor.on_request_start("/api/users", "GET");
    monitor.on_request_complete("/api/users", "GET", 12.5, 200);
  }
  state.SetItemsProcessed(state.iterations());
}

static void BM_Monitor_Snapshot(benchmark::State &state) {
  StatusMonitor monitor{bench_config()};
  const auto routes = state.range(0);
  for (long r = 0; r < routes; ++r) {
    auto path = "/api/r" + std::string(1, static_cast<char>('a' + r % 26)) +
                "/x" + std::string(1, static_cast<char>('a' + r / 26 % 26));
    for (int i = 0; i < 10; ++i) {
      monitor.on_request_start(path, "GET");
      monitor.on_request_complete(path, "GET", static_cast<double>(i),
                                  i == 0 ? 500 : 200);
    }
  }

  for (auto _ : state) {
    auto s = monitor.snapshot();
    benchmark::DoNotOptimize(s);
  }
}

static void BM_Aggregator_Snapshot(benchmark::State &state) {
  ClusterAggregator agg{wall_clock_ms};
  const auto workers = state.range(0);
  for (long w = 0; w < workers; ++w) {
    std::vector<RouteStats> routes;
    for (int r = 0; r < 10; ++r) {
      routes.push_back(RouteStats{.path = "/api/" + std::to_string(r),
                                  .method = "GET",
                                  .count = 10,
                                  .total_time = 100.0,
                                  .avg_time = 10.0,
                                  .min_time = 1.0,
                                  .max_time = 20.0});
    }
    agg.ingest(w, 1000 + w,
               PartialSnapshot{.cpu = 10.0,
                               .rps = 5.0,
                               .total_requests = 100,
                               .status_codes = StatusCodeCounts{{"200", 100}},
                               .top_routes = routes,
                               .slowest_routes = routes},
               {});
  }
  MetricsSnapshot local;

  for (auto _ : state) {
    auto s = agg.aggregate_snapshot(local);
    benchmark::DoNotOptimize(s);
  }
}

static void BM_Aggregator_Charts(benchmark::State &state) {
  ClusterAggregator agg{wall_clock_ms};
  auto series_of = [](std::int64_t offset) {
    TimeSeries s;
    for (std::int64_t i = 0; i < 60; ++i) {
      s.push_back({.timestamp = offset + i * 1000, .value = 1.0});
    }
    return s;
  };
  const auto workers = state.range(0);
  for (long w = 0; w < workers; ++w) {
    ChartBundle charts;
    for (auto name : series::kAll) {
      charts[std::string{name}] = series_of(w * 7);
    }
    agg.ingest(w, w, {}, std::move(charts));
  }
  ChartBundle local;

  for (auto _ : state) {
    auto c = agg.aggregate_charts(local);
    benchmark::DoNotOptimize(c);
  }
}

BENCHMARK(BM_Monitor_RecordRequest);
BENCHMARK(BM_Monitor_RecordRequestIdentityNormalizer);
BENCHMARK(BM_Monitor_Snapshot)->Arg(10)->Arg(100)->Arg(500);
BENCHMARK(BM_Aggregator_Snapshot)->Arg(2)->Arg(8)->Arg(32);
BENCHMARK(BM_Aggregator_Charts)->Arg(2)->Arg(8);

BENCHMARK_MAIN();
