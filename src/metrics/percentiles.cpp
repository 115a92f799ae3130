/// @file percentiles.cpp
/// @brief Implementation of PercentileEstimator.

#include "metrics/percentiles.hpp"
#include "metrics/numeric.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace statmon {

void PercentileEstimator::add(double sample_ms) {
  samples_.push_back(sample_ms);
  if (samples_.size() > kCapacity) {
    samples_.erase(samples_.begin(),
                   samples_.end() -
                       static_cast<std::ptrdiff_t>(kRetainOnOverflow));
  }
}

auto PercentileEstimator::compute() const -> PercentileSet {
  if (samples_.empty()) {
    return {};
  }

  auto sorted = samples_;
  std::sort(sorted.begin(), sorted.end());
  const auto len = sorted.size();

  auto at = [&](double q) -> double {
    auto idx = static_cast<std::size_t>(
        std::floor(static_cast<double>(len) * q));
    return sorted[std::min(idx, len - 1)];
  };

  const double sum = std::accumulate(sorted.begin(), sorted.end(), 0.0);

  return PercentileSet{
      .p50 = round_to(at(0.50), 2),
      .p95 = round_to(at(0.95), 2),
      .p99 = round_to(at(0.99), 2),
      .avg = round_to(sum / static_cast<double>(len), 2),
  };
}

} // namespace statmon
