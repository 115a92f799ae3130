/// @file time_series.cpp
/// @brief Implementation of RollingHistory.

#include "metrics/time_series.hpp"

#include <algorithm>
#include <utility>

namespace statmon {

auto merge_mode_for(std::string_view series_name) -> MergeMode {
  return series_name == series::kRps ? MergeMode::Sum : MergeMode::Average;
}

RollingHistory::RollingHistory(std::int64_t retention_seconds, NowFn now)
    : retention_ms_{retention_seconds * 1000}, now_{std::move(now)} {}

void RollingHistory::append(std::string_view name, double value) {
  auto it = series_.find(name);
  if (it == series_.end()) {
    it = series_.emplace(std::string{name}, TimeSeries{}).first;
  }

  auto &points = it->second;
  const auto now = now_();
  points.push_back({.timestamp = now, .value = value});

  // Points are appended in time order, so expired ones form a prefix.
  const auto cutoff = now - retention_ms_;
  auto first_kept =
      std::find_if(points.begin(), points.end(),
                   [cutoff](const auto &p) { return p.timestamp >= cutoff; });
  points.erase(points.begin(), first_kept);
}

auto RollingHistory::latest(std::string_view name) const -> double {
  auto it = series_.find(name);
  if (it == series_.end() || it->second.empty()) {
    return 0.0;
  }
  return it->second.back().value;
}

auto RollingHistory::series(std::string_view name) const -> TimeSeries {
  auto it = series_.find(name);
  if (it == series_.end()) {
    return {};
  }
  return it->second;
}

} // namespace statmon
