/// @file host_sampler.cpp
/// @brief Linux implementation of HostSampler via /proc, sysinfo and uname.

#include "platform/host_sampler.hpp"
#include "metrics/numeric.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <thread>
#include <utility>
#include <vector>

#if defined(__linux__)
#include <sys/sysinfo.h>
#include <sys/utsname.h>
#include <unistd.h>
#endif

namespace statmon {

namespace {

constexpr double kBytesPerMb = 1024.0 * 1024.0;

#if defined(__linux__)
auto read_first_line(const char *path) -> std::optional<std::string> {
  std::ifstream file(path);
  std::string line;
  if (!file || !std::getline(file, line)) {
    return std::nullopt;
  }
  return line;
}
#endif

} // namespace

auto Capabilities::detect() noexcept -> Capabilities {
#if defined(__linux__)
  return {};
#else
  return {.host_metrics = false,
          .process_metrics = false,
          .event_loop_lag = true};
#endif
}

HostSampler::HostSampler(Capabilities caps) noexcept : caps_{caps} {}

auto HostSampler::parse_cpu_times(const std::string &line)
    -> std::optional<CpuTimes> {
  std::istringstream in(line);
  std::string label;
  in >> label;
  if (label != "cpu") {
    return std::nullopt;
  }

  // user nice system idle iowait irq softirq steal
  std::vector<std::uint64_t> fields;
  std::uint64_t v = 0;
  while (fields.size() < 8 && in >> v) {
    fields.push_back(v);
  }
  if (fields.size() < 4) {
    return std::nullopt;
  }

  CpuTimes t;
  for (auto f : fields) {
    t.total += f;
  }
  const auto idle = fields[3] + (fields.size() > 4 ? fields[4] : 0);
  t.busy = t.total - idle;
  return t;
}

auto HostSampler::cpu_percent() -> double {
  if (!caps_.host_metrics) {
    return 0.0;
  }
#if defined(__linux__)
  auto line = read_first_line("/proc/stat");
  auto now = line ? parse_cpu_times(*line) : std::nullopt;
  if (!now) {
    return 0.0;
  }

  auto prev = std::exchange(last_cpu_, now);
  if (!prev || now->total <= prev->total) {
    return 0.0;
  }

  const auto busy = static_cast<double>(now->busy - prev->busy);
  const auto total = static_cast<double>(now->total - prev->total);
  return round_to(busy / total * 100.0, 1);
#else
  return 0.0;
#endif
}

auto HostSampler::memory() const -> MemoryUsage {
  if (!caps_.host_metrics) {
    return {};
  }
#if defined(__linux__)
  struct sysinfo info {};
  if (::sysinfo(&info) != 0 || info.totalram == 0) {
    return {};
  }
  const double unit = info.mem_unit;
  const double total = static_cast<double>(info.totalram) * unit;
  const double used =
      total - static_cast<double>(info.freeram) * unit;
  return MemoryUsage{
      .used_mb = round_to(used / kBytesPerMb, 1),
      .percent = round_to(used / total * 100.0, 1),
  };
#else
  return {};
#endif
}

auto HostSampler::load_average() const -> double {
  if (!caps_.host_metrics) {
    return 0.0;
  }
  std::array<double, 3> loads{};
  if (::getloadavg(loads.data(), 1) < 1) {
    return 0.0;
  }
  return round_to(loads[0], 2);
}

auto HostSampler::process_memory() const -> ProcessMemory {
  if (!caps_.process_metrics) {
    return {};
  }
#if defined(__linux__)
  auto line = read_first_line("/proc/self/statm");
  if (!line) {
    return {};
  }
  std::istringstream in(*line);
  std::uint64_t size_pages = 0;
  std::uint64_t resident_pages = 0;
  if (!(in >> size_pages >> resident_pages)) {
    return {};
  }
  static const auto page = static_cast<double>(::sysconf(_SC_PAGESIZE));
  return ProcessMemory{
      .resident_mb =
          round_to(static_cast<double>(resident_pages) * page / kBytesPerMb, 1),
      .virtual_mb =
          round_to(static_cast<double>(size_pages) * page / kBytesPerMb, 1),
  };
#else
  return {};
#endif
}

auto HostSampler::sample_process_memory() -> ProcessMemory {
  auto mem = process_memory();
  if (last_resident_mb_ > 0.0) {
    growth_rate_ = round_to(mem.resident_mb - last_resident_mb_, 2);
  }
  last_resident_mb_ = mem.resident_mb;
  return mem;
}

auto HostSampler::host_uptime() const -> std::int64_t {
  if (!caps_.host_metrics) {
    return 0;
  }
#if defined(__linux__)
  struct sysinfo info {};
  if (::sysinfo(&info) != 0) {
    return 0;
  }
  return static_cast<std::int64_t>(info.uptime);
#else
  return 0;
#endif
}

auto HostSampler::hostname() -> std::string {
#if defined(__linux__)
  std::array<char, 256> buf{};
  if (::gethostname(buf.data(), buf.size() - 1) == 0) {
    return buf.data();
  }
#endif
  return "unknown";
}

auto HostSampler::platform() -> std::string {
#if defined(__linux__)
  struct utsname u {};
  if (::uname(&u) == 0) {
    return std::string{u.sysname} + " " + u.release;
  }
#endif
  return "unknown";
}

auto HostSampler::cpu_count() noexcept -> unsigned {
  // hardware_concurrency() may report 0 when it cannot tell.
  return std::max(1u, std::thread::hardware_concurrency());
}

auto HostSampler::process_id() noexcept -> std::int64_t {
#if defined(__linux__)
  return static_cast<std::int64_t>(::getpid());
#else
  return 0;
#endif
}

auto HostSampler::runtime() -> std::string {
#if defined(__clang__)
  return "clang " __clang_version__;
#elif defined(__GNUC__)
  return "gcc " __VERSION__;
#else
  return "c++ " + std::to_string(__cplusplus);
#endif
}

} // namespace statmon
