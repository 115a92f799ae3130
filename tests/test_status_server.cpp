/// @file test_status_server.cpp
/// @brief Tests for the HTTP status endpoint.

#include "server/status_server.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <thread>
#include <vector>

using namespace statmon;

namespace {

auto get(std::string target) -> http::request<http::string_body> {
  http::request<http::string_body> req{http::verb::get, target, 11};
  req.set(http::field::host, "localhost");
  return req;
}

auto make_config() -> MonitorConfig {
  MonitorConfig cfg;
  cfg.capabilities = Capabilities::reduced();
  cfg.cluster_mode = false;
  return cfg;
}

} // namespace

TEST(StatusRequest, MetricsReturnsSnapshot) {
  StatusMonitor monitor{make_config()};
  monitor.on_request_start("/api/a", "GET");
  monitor.on_request_complete("/api/a", "GET", 3.0, 200);

  auto res = handle_status_request(monitor, get("/status/metrics"));
  EXPECT_EQ(res.result(), http::status::ok);
  EXPECT_EQ(res[http::field::content_type], "application/json");

  auto j = nlohmann::json::parse(res.body());
  EXPECT_EQ(j["totalRequests"], 1);
  EXPECT_EQ(j["statusCodes"]["200"], 1);
  EXPECT_TRUE(j["reducedMode"].get<bool>());
}

TEST(StatusRequest, ChartsReturnsEverySeries) {
  StatusMonitor monitor{make_config()};
  monitor.tick();

  auto res = handle_status_request(monitor, get("/status/charts?range=60"));
  ASSERT_EQ(res.result(), http::status::ok);

  auto j = nlohmann::json::parse(res.body());
  for (auto name : series::kAll) {
    EXPECT_TRUE(j.contains(std::string{name})) << name;
  }
  EXPECT_EQ(j["rps"].size(), 1u);
}

TEST(StatusRequest, UnknownTargetIs404) {
  StatusMonitor monitor{make_config()};
  auto res = handle_status_request(monitor, get("/status/nope"));
  EXPECT_EQ(res.result(), http::status::not_found);
}

TEST(StatusRequest, PostIs404) {
  StatusMonitor monitor{make_config()};
  auto req = get("/status/metrics");
  req.method(http::verb::post);
  EXPECT_EQ(handle_status_request(monitor, req).result(),
            http::status::not_found);
}

namespace {

auto fetch(unsigned short port, const std::string &target)
    -> http::response<http::string_body> {
  net::io_context client_ioc;
  tcp::socket socket{client_ioc};
  socket.connect(tcp::endpoint{net::ip::make_address("127.0.0.1"), port});

  auto req = get(target);
  http::write(socket, req);

  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  http::read(socket, buffer, res);
  return res;
}

} // namespace

TEST(StatusServer, PollsAreNotCountedInServedSnapshots) {
  StatusMonitor monitor{make_config()};
  monitor.on_request_start("/api/users", "GET");
  monitor.on_request_complete("/api/users", "GET", 4.0, 200);
  monitor.on_request_start("/api/users", "GET");
  monitor.on_request_complete("/api/users", "GET", 6.0, 200);

  net::io_context ioc;
  StatusServer server{ioc, 0, monitor};
  server.start();
  const auto port = server.port();
  std::thread io_thread([&ioc] { ioc.run(); });

  std::vector<nlohmann::json> served;
  for (int i = 0; i < 3; ++i) {
    auto res = fetch(port, "/status/metrics");
    ASSERT_EQ(res.result(), http::status::ok);
    served.push_back(nlohmann::json::parse(res.body()));
  }
  EXPECT_EQ(fetch(port, "/status/charts").result(), http::status::ok);

  server.stop();
  ioc.stop();
  io_thread.join();

  for (const auto &j : served) {
    std::uint64_t route_sum = 0;
    for (const auto &route : j["topRoutes"]) {
      route_sum += route["count"].get<std::uint64_t>();
    }
    EXPECT_EQ(j["totalRequests"].get<std::uint64_t>(), route_sum);
    EXPECT_EQ(j["totalRequests"], 2);
    EXPECT_EQ(j["activeConnections"], 0);
  }
  EXPECT_EQ(monitor.routes().total_requests(), 2u);
  ASSERT_EQ(monitor.routes().routes().size(), 1u);
  EXPECT_EQ(monitor.routes().routes().front().path, "/api/users");
}

TEST(StatusServer, RequestsOutsideStatusAreRecorded) {
  StatusMonitor monitor{make_config()};
  net::io_context ioc;
  StatusServer server{ioc, 0, monitor};
  server.start();
  const auto port = server.port();
  std::thread io_thread([&ioc] { ioc.run(); });

  auto res = fetch(port, "/favicon.ico");

  server.stop();
  ioc.stop();
  io_thread.join();

  EXPECT_EQ(res.result(), http::status::not_found);
  EXPECT_EQ(monitor.routes().total_requests(), 1u);
  EXPECT_EQ(monitor.routes().status_codes().at("404"), 1u);
}
