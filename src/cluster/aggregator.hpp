#pragma once
/// @file aggregator.hpp
/// @brief Coordinator-side fold of the snapshots and charts reported by
///        cluster workers.

#include "cluster/worker_message.hpp"
#include "metrics/clock.hpp"
#include "monitor/snapshot.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

namespace statmon {

/// @brief The last report received from one worker.
///
/// Created on the first report for a worker id, replaced wholesale by every
/// later one, removed once it has been silent for longer than the staleness
/// timeout.
struct WorkerRecord {
  std::int64_t worker_id = 0;
  std::int64_t pid = 0;
  PartialSnapshot snapshot;
  ChartBundle charts;
  std::int64_t last_seen = 0; ///< Epoch ms of the last ingest.
};

/// @brief Merges worker reports into one cluster-wide view.
///
/// Single writer (the message ingestion point) and synchronous readers on
/// the same thread; no locking. Stale records are evicted lazily at the
/// start of every read.
class ClusterAggregator {
public:
  static constexpr std::int64_t kDefaultStaleAfterMs = 10'000;

  explicit ClusterAggregator(NowFn now = wall_clock_ms,
                             std::size_t max_routes = 10,
                             std::int64_t stale_after_ms = kDefaultStaleAfterMs);

  /// @brief Upsert the record for @p worker_id and mark it seen now. Later
  /// messages always win; ordering is not checked.
  void ingest(std::int64_t worker_id, std::int64_t pid,
              PartialSnapshot snapshot, ChartBundle charts);

  void ingest(WorkerMetricsMessage message);

  /// @brief Drop records silent for more than the timeout.
  /// @return Number of records removed.
  auto evict_stale() -> std::size_t;

  [[nodiscard]] auto worker_count() -> std::size_t;

  /// @brief Roster of active workers, ordered by worker id.
  [[nodiscard]] auto workers() -> std::vector<WorkerInfo>;

  /// @brief Fold every active worker into @p local.
  ///
  /// Sums rates, counters, rate-limit stats and status codes; averages cpu,
  /// response time and error rate; merges routes by (method, path) and
  /// re-ranks them. Fields not aggregated are taken from @p local. With no
  /// active workers @p local is returned unchanged.
  [[nodiscard]] auto aggregate_snapshot(const MetricsSnapshot &local)
      -> MetricsSnapshot;

  /// @brief Merge each named series of @p local with every worker's series
  /// by exact timestamp. Request rate is summed, other series averaged;
  /// unmatched points are kept. With no active workers @p local is returned
  /// unchanged.
  [[nodiscard]] auto aggregate_charts(const ChartBundle &local) -> ChartBundle;

  [[nodiscard]] auto records() const noexcept
      -> const std::map<std::int64_t, WorkerRecord> & {
    return records_;
  }

private:
  NowFn now_;
  std::size_t max_routes_;
  std::int64_t stale_after_ms_;
  std::map<std::int64_t, WorkerRecord> records_;
};

/// @brief Merge route entries sharing (method, path): counts, total time and
/// errors are summed, min/max/last access combined, the average recomputed.
/// First-seen order is preserved.
[[nodiscard]] auto merge_routes(const std::vector<RouteStats> &routes)
    -> std::vector<RouteStats>;

/// @brief Merge several series by exact timestamp, ascending.
[[nodiscard]] auto merge_series(const std::vector<const TimeSeries *> &inputs,
                                MergeMode mode) -> TimeSeries;

} // namespace statmon
