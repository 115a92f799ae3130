#pragma once
/// @file status_server.hpp
/// @brief Boost.Beast HTTP server exposing the monitor's snapshot and charts.

#include "monitor/status_monitor.hpp"

#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include <memory>
#include <string>

namespace statmon {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;

/// @brief Route one request to a response. Exposed for tests.
///
/// GET /status/metrics returns the snapshot, GET /status/charts the chart
/// bundle; every other target is 404.
[[nodiscard]] auto handle_status_request(StatusMonitor &monitor,
                                         const http::request<http::string_body> &req)
    -> http::response<http::string_body>;

/// @brief A single HTTP connection: one request, one response, close.
class StatusSession : public std::enable_shared_from_this<StatusSession> {
public:
  StatusSession(tcp::socket socket, StatusMonitor &monitor);

  void run();

private:
  void on_read(beast::error_code ec);
  void on_write(beast::error_code ec);

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  http::request<http::string_body> req_;
  std::shared_ptr<http::response<http::string_body>> res_;
  StatusMonitor &monitor_;
};

/// @brief Accepts connections on the shared io_context and serves each one
/// with a StatusSession. Requests outside /status/ are recorded in the
/// monitor.
class StatusServer {
public:
  /// @param port 0 picks an ephemeral port; see port().
  StatusServer(net::io_context &ioc, unsigned short port,
               StatusMonitor &monitor);

  /// @brief Begin accepting. Returns immediately; the caller runs @p ioc.
  void start();

  void stop();

  [[nodiscard]] auto port() const -> unsigned short;

private:
  void do_accept();

  tcp::acceptor acceptor_;
  StatusMonitor &monitor_;
};

} // namespace statmon
