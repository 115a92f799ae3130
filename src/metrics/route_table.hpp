#pragma once
/// @file route_table.hpp
/// @brief Per-route request statistics, global request counters and the
///        recent-error log.

#include "metrics/clock.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <limits>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace statmon {

/// @brief Maps a raw request path to a bounded-cardinality route key.
using PathNormalizer = std::function<std::string(std::string_view)>;

/// @brief Replace UUIDs with ":uuid", 24-hex ids and numeric segments with
/// ":id", then keep at most the first four '/'-separated pieces.
[[nodiscard]] auto default_normalize_path(std::string_view path)
    -> std::string;

/// @brief Identity of a route: HTTP method plus normalized path.
struct RouteKey {
  std::string method;
  std::string path;

  [[nodiscard]] auto str() const -> std::string { return method + ":" + path; }
};

/// @brief Aggregate counters for one route.
///
/// avg_time == total_time / count whenever count > 0. min_time starts at
/// +infinity and only decreases; max_time only increases.
struct RouteStats {
  std::string path;
  std::string method;
  std::uint64_t count = 0;
  double total_time = 0.0; ///< Sum of durations (ms).
  double avg_time = 0.0;
  double min_time = std::numeric_limits<double>::infinity();
  double max_time = 0.0;
  std::uint64_t error_count = 0; ///< Completions with status >= 400.
  std::int64_t last_access = 0;  ///< Epoch ms.

  [[nodiscard]] auto key() const -> RouteKey { return {method, path}; }
};

/// @brief One failed request, kept in a most-recent-first bounded log.
struct ErrorEntry {
  std::int64_t timestamp = 0;
  std::string path;
  std::string method;
  int status = 0;
  std::string message;
};

/// @brief Response count per HTTP status code, keyed by the decimal code.
using StatusCodeCounts = std::map<std::string, std::uint64_t>;

struct RateLimitStats {
  std::uint64_t blocked = 0;
  std::uint64_t total = 0;
};

/// @brief Counters accumulated between two rollover ticks.
struct IntervalCounters {
  std::uint64_t requests = 0;         ///< Requests started.
  double response_time_sum = 0.0;     ///< Sum of completed durations (ms).
  std::uint64_t response_count = 0;   ///< Completions.
};

/// @brief Ordering used to build the ranked route lists.
enum class RouteRanking {
  ByCount,   ///< Descending count.
  BySlowest, ///< count > 0, descending avg_time.
  ByErrors,  ///< error_count > 0, descending error_count.
};

/// @brief Filter and order @p routes, keeping at most @p limit entries.
///
/// The sort is stable, so routes with equal keys keep their input order.
[[nodiscard]] auto rank_routes(std::vector<RouteStats> routes,
                               RouteRanking ranking, std::size_t limit)
    -> std::vector<RouteStats>;

/// @brief Route analytics table plus the process-wide request counters.
///
/// Owned by the collecting process and mutated synchronously from request
/// handlers; not internally synchronized.
class RouteTable {
public:
  RouteTable(PathNormalizer normalizer, std::size_t max_recent_errors,
             NowFn now = wall_clock_ms);

  /// @brief A request entered the server: create its route entry if absent
  /// and bump the in-flight and total counters.
  void record_start(std::string_view path, std::string_view method);

  /// @brief A request finished. Updates status counts, the interval
  /// accumulators and the route entry (if one was started). Status >= 400
  /// counts as an error and is prepended to the recent-error log.
  void record_complete(std::string_view path, std::string_view method,
                       double duration_ms, int status);

  void record_rate_limit(bool blocked) noexcept;

  [[nodiscard]] auto top_by_count(std::size_t n) const
      -> std::vector<RouteStats>;
  [[nodiscard]] auto slowest_by_avg(std::size_t n) const
      -> std::vector<RouteStats>;
  [[nodiscard]] auto most_errors(std::size_t n) const
      -> std::vector<RouteStats>;

  /// @brief Every route in insertion order.
  [[nodiscard]] auto routes() const noexcept
      -> const std::vector<RouteStats> & {
    return routes_;
  }

  [[nodiscard]] auto total_errors() const -> std::uint64_t;

  /// @brief Errors as a percentage of all requests (2 decimals), 0 if none.
  [[nodiscard]] auto error_rate() const -> double;

  [[nodiscard]] auto total_requests() const noexcept -> std::uint64_t {
    return total_requests_;
  }
  [[nodiscard]] auto active_connections() const noexcept -> std::uint64_t {
    return active_connections_;
  }
  [[nodiscard]] auto status_codes() const noexcept -> const StatusCodeCounts & {
    return status_codes_;
  }
  [[nodiscard]] auto rate_limit() const noexcept -> RateLimitStats {
    return rate_limit_;
  }
  [[nodiscard]] auto recent_errors() const -> std::vector<ErrorEntry> {
    return {recent_errors_.begin(), recent_errors_.end()};
  }

  /// @brief Return the counters accumulated since the previous call and
  /// start a new interval.
  auto take_interval() noexcept -> IntervalCounters;

private:
  [[nodiscard]] auto normalize(std::string_view path) const -> std::string;

  PathNormalizer normalizer_;
  std::size_t max_recent_errors_;
  NowFn now_;

  std::vector<RouteStats> routes_;
  std::unordered_map<std::string, std::size_t> index_; // key.str() -> slot
  std::deque<ErrorEntry> recent_errors_;

  std::uint64_t total_requests_ = 0;
  std::uint64_t active_connections_ = 0;
  StatusCodeCounts status_codes_;
  RateLimitStats rate_limit_;
  IntervalCounters interval_;
};

} // namespace statmon
