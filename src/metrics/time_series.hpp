#pragma once
/// @file time_series.hpp
/// @brief Retention-bounded time series per scalar metric.

#include "metrics/clock.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace statmon {

/// @brief A single timestamped observation. Immutable once stored.
struct MetricDataPoint {
  std::int64_t timestamp = 0; ///< Epoch milliseconds.
  double value = 0.0;

  friend auto operator==(const MetricDataPoint &,
                         const MetricDataPoint &) -> bool = default;
};

/// @brief Ordered points, timestamps non-decreasing.
using TimeSeries = std::vector<MetricDataPoint>;

/// @brief One series per metric name, as published to chart consumers.
using ChartBundle = std::map<std::string, TimeSeries>;

/// @brief Names of the series recorded on every rollover tick.
namespace series {
inline constexpr std::string_view kCpu = "cpu";
inline constexpr std::string_view kMemory = "memory";
inline constexpr std::string_view kHeap = "heap";
inline constexpr std::string_view kLoadAvg = "loadAvg";
inline constexpr std::string_view kResponseTime = "responseTime";
inline constexpr std::string_view kRps = "rps";
inline constexpr std::string_view kEventLoopLag = "eventLoopLag";
inline constexpr std::string_view kErrorRate = "errorRate";

inline constexpr std::string_view kAll[] = {
    kCpu, kMemory, kHeap, kLoadAvg, kResponseTime, kRps, kEventLoopLag,
    kErrorRate,
};
} // namespace series

/// @brief How points from different processes sharing a timestamp combine.
enum class MergeMode { Sum, Average };

/// @brief Request rate is additive across processes; everything else is a
/// per-process gauge and is averaged.
[[nodiscard]] auto merge_mode_for(std::string_view series_name) -> MergeMode;

/// @brief Fixed-retention history store.
///
/// Retention is enforced lazily on append: a series that stops receiving
/// writes keeps its last points until the next append.
class RollingHistory {
public:
  /// @param retention_seconds Maximum point age kept after an append.
  /// @param now               Clock used to stamp appended points.
  explicit RollingHistory(std::int64_t retention_seconds,
                          NowFn now = wall_clock_ms);

  /// @brief Append @p value stamped with the current time, then trim every
  /// point older than now - retention from the front.
  void append(std::string_view name, double value);

  /// @brief Most recent value of @p name, or 0 if the series is empty.
  [[nodiscard]] auto latest(std::string_view name) const -> double;

  /// @brief Copy of the series, empty if @p name was never written.
  [[nodiscard]] auto series(std::string_view name) const -> TimeSeries;

  /// @brief Copy of every series in @p names (missing ones empty).
  template <typename Names>
  [[nodiscard]] auto bundle(const Names &names) const -> ChartBundle {
    ChartBundle out;
    for (const auto &name : names) {
      out.emplace(std::string{name}, series(name));
    }
    return out;
  }

  [[nodiscard]] auto retention_ms() const noexcept -> std::int64_t {
    return retention_ms_;
  }

private:
  std::int64_t retention_ms_;
  NowFn now_;
  std::map<std::string, TimeSeries, std::less<>> series_;
};

} // namespace statmon
