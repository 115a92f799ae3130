/// @file status_server.cpp
/// @brief Implementation of the Boost.Beast status HTTP server.

#include "server/status_server.hpp"

#include "serialization/json_serializer.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <string_view>

namespace statmon {

namespace {

constexpr std::string_view kMetricsTarget = "/status/metrics";
constexpr std::string_view kChartsTarget = "/status/charts";
constexpr std::string_view kStatusPrefix = "/status/";

auto make_response(http::status status, unsigned version, std::string body,
                   const char *content_type)
    -> http::response<http::string_body> {
  http::response<http::string_body> res{status, version};
  res.set(http::field::server, "statmon/0.1");
  res.set(http::field::content_type, content_type);
  res.set(http::field::access_control_allow_origin, "*");
  res.body() = std::move(body);
  // One request per connection.
  res.keep_alive(false);
  res.prepare_payload();
  return res;
}

// Drop the query string so "/status/metrics?x=1" still routes.
auto target_path(std::string_view target) -> std::string_view {
  auto q = target.find('?');
  return q == std::string_view::npos ? target : target.substr(0, q);
}

} // namespace

auto handle_status_request(StatusMonitor &monitor,
                           const http::request<http::string_body> &req)
    -> http::response<http::string_body> {
  auto path = target_path(std::string_view{req.target().data(),
                                           req.target().size()});

  if (req.method() == http::verb::get && path == kMetricsTarget) {
    nlohmann::json j = monitor.snapshot();
    return make_response(http::status::ok, req.version(), j.dump(),
                         "application/json");
  }
  if (req.method() == http::verb::get && path == kChartsTarget) {
    auto j = charts_to_json(monitor.charts());
    return make_response(http::status::ok, req.version(), j.dump(),
                         "application/json");
  }
  return make_response(http::status::not_found, req.version(),
                       "404 Not Found: " + std::string{path}, "text/plain");
}

// ─── StatusSession ──────────────────────────────────────────────────────

StatusSession::StatusSession(tcp::socket socket, StatusMonitor &monitor)
    : stream_{std::move(socket)}, monitor_{monitor} {}

void StatusSession::run() {
  http::async_read(stream_, buffer_, req_,
                   [self = shared_from_this()](beast::error_code ec,
                                               std::size_t) {
                     self->on_read(ec);
                   });
}

void StatusSession::on_read(beast::error_code ec) {
  if (ec)
    return;

  auto target = std::string(req_.target());
  auto path = target_path(target);
  auto method = std::string(req_.method_string());

  // Status polls are not traffic and are never recorded.
  const bool tracked = !path.starts_with(kStatusPrefix);
  auto started = std::chrono::steady_clock::now();
  if (tracked)
    monitor_.on_request_start(path, method);

  res_ = std::make_shared<http::response<http::string_body>>(
      handle_status_request(monitor_, req_));

  if (tracked) {
    std::chrono::duration<double, std::milli> elapsed =
        std::chrono::steady_clock::now() - started;
    monitor_.on_request_complete(path, method, elapsed.count(),
                                 static_cast<int>(res_->result_int()));
  }

  http::async_write(stream_, *res_,
                    [self = shared_from_this()](beast::error_code ec2,
                                                std::size_t) {
                      self->on_write(ec2);
                    });
}

void StatusSession::on_write(beast::error_code /*ec*/) {
  beast::error_code ignored;
  stream_.socket().shutdown(tcp::socket::shutdown_send, ignored);
}

// ─── StatusServer ───────────────────────────────────────────────────────

StatusServer::StatusServer(net::io_context &ioc, unsigned short port,
                           StatusMonitor &monitor)
    : acceptor_{ioc, tcp::endpoint{tcp::v4(), port}}, monitor_{monitor} {
  acceptor_.set_option(net::socket_base::reuse_address(true));
}

void StatusServer::start() {
  std::cout << "[StatusServer] Listening on http://localhost:" << port()
            << kMetricsTarget << "\n";
  do_accept();
}

void StatusServer::stop() {
  beast::error_code ignored;
  acceptor_.close(ignored);
}

auto StatusServer::port() const -> unsigned short {
  return acceptor_.local_endpoint().port();
}

void StatusServer::do_accept() {
  acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
    if (ec)
      return;

    std::make_shared<StatusSession>(std::move(socket), monitor_)->run();

    do_accept();
  });
}

} // namespace statmon
