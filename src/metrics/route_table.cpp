/// @file route_table.cpp
/// @brief Implementation of RouteTable and path normalization.

#include "metrics/route_table.hpp"
#include "metrics/numeric.hpp"

#include <algorithm>
#include <numeric>
#include <regex>
#include <utility>

namespace statmon {

// ─── Path normalization ─────────────────────────────────────────────────

namespace {

constexpr std::size_t kMaxPathPieces = 4;

auto uuid_pattern() -> const std::regex & {
  static const std::regex re{
      "[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12}",
      std::regex::icase};
  return re;
}

auto object_id_pattern() -> const std::regex & {
  static const std::regex re{"[0-9a-f]{24}", std::regex::icase};
  return re;
}

auto numeric_segment_pattern() -> const std::regex & {
  static const std::regex re{"/[0-9]+"};
  return re;
}

} // namespace

auto default_normalize_path(std::string_view path) -> std::string {
  std::string out{path};
  out = std::regex_replace(out, uuid_pattern(), ":uuid");
  out = std::regex_replace(out, object_id_pattern(), ":id");
  out = std::regex_replace(out, numeric_segment_pattern(), "/:id");

  // A leading '/' yields an empty first piece, so "/a/b/c/d" keeps "/a/b/c".
  std::size_t pieces = 0;
  for (std::size_t i = 0; i < out.size(); ++i) {
    if (out[i] == '/' && ++pieces == kMaxPathPieces) {
      out.resize(i);
      break;
    }
  }
  return out;
}

// ─── Ranking ────────────────────────────────────────────────────────────

auto rank_routes(std::vector<RouteStats> routes, RouteRanking ranking,
                 std::size_t limit) -> std::vector<RouteStats> {
  switch (ranking) {
  case RouteRanking::ByCount:
    std::stable_sort(routes.begin(), routes.end(),
                     [](const auto &a, const auto &b) {
                       return a.count > b.count;
                     });
    break;
  case RouteRanking::BySlowest:
    std::erase_if(routes, [](const auto &r) { return r.count == 0; });
    std::stable_sort(routes.begin(), routes.end(),
                     [](const auto &a, const auto &b) {
                       return a.avg_time > b.avg_time;
                     });
    break;
  case RouteRanking::ByErrors:
    std::erase_if(routes, [](const auto &r) { return r.error_count == 0; });
    std::stable_sort(routes.begin(), routes.end(),
                     [](const auto &a, const auto &b) {
                       return a.error_count > b.error_count;
                     });
    break;
  }

  if (routes.size() > limit) {
    routes.resize(limit);
  }
  return routes;
}

// ─── RouteTable ─────────────────────────────────────────────────────────

RouteTable::RouteTable(PathNormalizer normalizer,
                       std::size_t max_recent_errors, NowFn now)
    : normalizer_{std::move(normalizer)},
      max_recent_errors_{max_recent_errors}, now_{std::move(now)} {}

auto RouteTable::normalize(std::string_view path) const -> std::string {
  return normalizer_ ? normalizer_(path) : default_normalize_path(path);
}

void RouteTable::record_start(std::string_view path, std::string_view method) {
  ++interval_.requests;
  ++total_requests_;
  ++active_connections_;

  RouteKey key{std::string{method}, normalize(path)};
  auto id = key.str();
  if (index_.contains(id)) {
    return;
  }

  index_.emplace(std::move(id), routes_.size());
  routes_.push_back(RouteStats{
      .path = std::move(key.path),
      .method = std::move(key.method),
      .last_access = now_(),
  });
}

void RouteTable::record_complete(std::string_view path,
                                 std::string_view method, double duration_ms,
                                 int status) {
  if (active_connections_ > 0) {
    --active_connections_;
  }

  interval_.response_time_sum += duration_ms;
  ++interval_.response_count;
  ++status_codes_[std::to_string(status)];

  const RouteKey key{std::string{method}, normalize(path)};
  auto it = index_.find(key.str());
  if (it == index_.end()) {
    return;
  }

  const auto now = now_();
  auto &stats = routes_[it->second];
  ++stats.count;
  stats.total_time += duration_ms;
  stats.avg_time = stats.total_time / static_cast<double>(stats.count);
  stats.min_time = std::min(stats.min_time, duration_ms);
  stats.max_time = std::max(stats.max_time, duration_ms);
  stats.last_access = now;

  if (status < 400) {
    return;
  }

  ++stats.error_count;
  recent_errors_.push_front(ErrorEntry{
      .timestamp = now,
      .path = key.path,
      .method = key.method,
      .status = status,
      .message = key.method + " " + key.path + " returned " +
                 std::to_string(status),
  });
  while (recent_errors_.size() > max_recent_errors_) {
    recent_errors_.pop_back();
  }
}

void RouteTable::record_rate_limit(bool blocked) noexcept {
  ++rate_limit_.total;
  if (blocked) {
    ++rate_limit_.blocked;
  }
}

auto RouteTable::top_by_count(std::size_t n) const -> std::vector<RouteStats> {
  return rank_routes(routes_, RouteRanking::ByCount, n);
}

auto RouteTable::slowest_by_avg(std::size_t n) const
    -> std::vector<RouteStats> {
  return rank_routes(routes_, RouteRanking::BySlowest, n);
}

auto RouteTable::most_errors(std::size_t n) const -> std::vector<RouteStats> {
  return rank_routes(routes_, RouteRanking::ByErrors, n);
}

auto RouteTable::total_errors() const -> std::uint64_t {
  return std::accumulate(
      routes_.begin(), routes_.end(), std::uint64_t{0},
      [](std::uint64_t sum, const auto &r) { return sum + r.error_count; });
}

auto RouteTable::error_rate() const -> double {
  if (total_requests_ == 0) {
    return 0.0;
  }
  return round_to(static_cast<double>(total_errors()) /
                      static_cast<double>(total_requests_) * 100.0,
                  2);
}

auto RouteTable::take_interval() noexcept -> IntervalCounters {
  return std::exchange(interval_, IntervalCounters{});
}

} // namespace statmon
