#pragma once
/// @file percentiles.hpp
/// @brief Nearest-rank latency percentiles over a bounded recent-sample buffer.

#include <cstddef>
#include <vector>

namespace statmon {

/// @brief Derived latency statistics (milliseconds, 2 decimals).
struct PercentileSet {
  double p50 = 0.0;
  double p95 = 0.0;
  double p99 = 0.0;
  double avg = 0.0;
};

/// @brief Keeps raw response-time samples and computes percentiles on demand.
///
/// The buffer is capped: once it grows past kCapacity samples it is cut back
/// to the most recent kRetainOnOverflow. This favours recent traffic and is
/// not a uniform reservoir.
class PercentileEstimator {
public:
  static constexpr std::size_t kCapacity = 1000;
  static constexpr std::size_t kRetainOnOverflow = 500;

  void add(double sample_ms);

  /// @brief Sort a copy and read p50/p95/p99 at floor(len * q), clamped.
  [[nodiscard]] auto compute() const -> PercentileSet;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return samples_.size();
  }

  void clear() noexcept { samples_.clear(); }

private:
  std::vector<double> samples_;
};

} // namespace statmon
