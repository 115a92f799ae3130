#include "serialization/json_serializer.hpp"
#include <benchmark/benchmark.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using namespace statmon;

static auto make_routes(std::size_t n) -> std::vector<RouteStats> {
  std::vector<RouteStats> routes;
  for (std::size_t i = 0; i < n; ++i) {
    routes.push_back(RouteStats{
        .path = "/api/resource" + std::to_string(i) + "/:id",
        .method = "GET",
        .count = 100 + i,
        .total_time = 1500.0,
        .avg_time = 15.0,
        .min_time = 1.0,
        .max_time = 90.0,
        .error_count = i % 3,
        .last_access = 1'700'000'000'000,
    });
  }
  return routes;
}

static auto make_charts(std::size_t points) -> ChartBundle {
  ChartBundle charts;
  for (auto name : series::kAll) {
    auto &s = charts[std::string{name}];
    for (std::size_t i = 0; i < points; ++i) {
      s.push_back({.timestamp = static_cast<std::int64_t>(i) * 1000,
                   .value = static_cast<double>(i % 50)});
    }
  }
  return charts;
}

static void BM_Serialization_Snapshot(benchmark::State &state) {
  MetricsSnapshot s;
  s.status_codes = {{"200", 9000}, {"201", 400}, {"404", 50}, {"500", 3}};
  s.top_routes = make_routes(10);
  s.slowest_routes = make_routes(10);
  s.error_routes = make_routes(5);

  for (auto _ : state) {
    nlohmann::json j = s;
    std::string out = j.dump();
    benchmark::DoNotOptimize(out);
  }
}

static void BM_Serialization_Charts(benchmark::State &state) {
  auto charts = make_charts(static_cast<std::size_t>(state.range(0)));

  for (auto _ : state) {
    std::string out = charts_to_json(charts).dump();
    benchmark::DoNotOptimize(out);
  }
}

static void BM_Serialization_WorkerMessageDecode(benchmark::State &state) {
  WorkerMetricsMessage m{
      .worker_id = 1,
      .pid = 4242,
      .snapshot = {.cpu = 12.0,
                   .rps = 40.0,
                   .total_requests = 10'000,
                   .top_routes = make_routes(10)},
      .charts = make_charts(60),
  };
  const std::string wire = nlohmann::json(m).dump();

  for (auto _ : state) {
    auto decoded = nlohmann::json::parse(wire).get<WorkerMetricsMessage>();
    benchmark::DoNotOptimize(decoded);
  }
}

BENCHMARK(BM_Serialization_Snapshot);
BENCHMARK(BM_Serialization_Charts)->Arg(10)->Arg(60)->Arg(600);
BENCHMARK(BM_Serialization_WorkerMessageDecode);

BENCHMARK_MAIN();
