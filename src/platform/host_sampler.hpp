#pragma once
/// @file host_sampler.hpp
/// @brief Reads host and process gauges (CPU, memory, load, uptime).

#include "platform/capabilities.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace statmon {

struct MemoryUsage {
  double used_mb = 0.0; ///< Host memory in use (1 decimal).
  double percent = 0.0; ///< Host memory in use, percent (1 decimal).
};

struct ProcessMemory {
  double resident_mb = 0.0; ///< Resident set size (1 decimal).
  double virtual_mb = 0.0;  ///< Total mapped size (1 decimal).
};

/// @brief Cumulative CPU jiffies from one /proc/stat read.
struct CpuTimes {
  std::uint64_t busy = 0;
  std::uint64_t total = 0;
};

/// @brief Samples host gauges. Every reading is zero for a category the
/// capability descriptor marks unavailable.
///
/// cpu_percent() and sample_process_memory() are stateful: they report the
/// change since their previous call.
class HostSampler {
public:
  explicit HostSampler(Capabilities caps = Capabilities::detect()) noexcept;

  /// @brief CPU utilization since the previous call (0 on the first call).
  [[nodiscard]] auto cpu_percent() -> double;

  [[nodiscard]] auto memory() const -> MemoryUsage;

  /// @brief One-minute load average (2 decimals).
  [[nodiscard]] auto load_average() const -> double;

  [[nodiscard]] auto process_memory() const -> ProcessMemory;

  /// @brief Read process memory and update the growth rate.
  auto sample_process_memory() -> ProcessMemory;

  /// @brief Change in resident MB between the last two samples.
  [[nodiscard]] auto growth_rate() const noexcept -> double {
    return growth_rate_;
  }

  /// @brief Host uptime in whole seconds.
  [[nodiscard]] auto host_uptime() const -> std::int64_t;

  [[nodiscard]] auto capabilities() const noexcept -> const Capabilities & {
    return caps_;
  }

  [[nodiscard]] static auto hostname() -> std::string;

  /// @brief "<sysname> <release>", e.g. "Linux 6.1.0".
  [[nodiscard]] static auto platform() -> std::string;

  [[nodiscard]] static auto cpu_count() noexcept -> unsigned;

  [[nodiscard]] static auto process_id() noexcept -> std::int64_t;

  /// @brief Compiler that built this binary, e.g. "gcc 12.2.0".
  [[nodiscard]] static auto runtime() -> std::string;

  /// @brief Parse the aggregate "cpu" line of /proc/stat.
  [[nodiscard]] static auto parse_cpu_times(const std::string &line)
      -> std::optional<CpuTimes>;

private:
  Capabilities caps_;
  std::optional<CpuTimes> last_cpu_;
  double last_resident_mb_ = 0.0;
  double growth_rate_ = 0.0;
};

} // namespace statmon
