#pragma once
/// @file local_socket_channel.hpp
/// @brief Channel over a Unix domain stream socket carrying
///        newline-delimited JSON.

#include "cluster/channel.hpp"

#include <boost/asio.hpp>

#include <expected>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace statmon {

namespace net = boost::asio;
using local_stream = net::local::stream_protocol;

/// @brief One-way local socket transport between workers and a coordinator.
///
/// A coordinator listen()s and receives from any number of workers; its
/// send() drops everything. A worker connect()s and sends; its handler is
/// never invoked. Sends are dropped while disconnected or while the
/// previous write is still in flight.
class LocalSocketChannel
    : public Channel,
      public std::enable_shared_from_this<LocalSocketChannel> {
public:
  /// @brief Coordinator side: bind @p path (replacing a stale socket file)
  /// and start accepting workers.
  /// @return The channel, or the bind/listen error.
  [[nodiscard]] static auto listen(net::io_context &ioc,
                                   const std::string &path)
      -> std::expected<std::shared_ptr<LocalSocketChannel>, std::error_code>;

  /// @brief Worker side: start connecting to @p path. Messages sent before
  /// the connection completes are dropped.
  [[nodiscard]] static auto connect(net::io_context &ioc,
                                    const std::string &path)
      -> std::shared_ptr<LocalSocketChannel>;

  ~LocalSocketChannel() override;

  void send(const nlohmann::json &message) override;
  void on_message(MessageHandler handler) override;

  /// @brief Stop accepting, close every socket and remove the socket file
  /// if this side created it.
  void close();

  [[nodiscard]] auto connected() const noexcept -> bool { return connected_; }

  [[nodiscard]] auto peer_count() const noexcept -> std::size_t;

  // Public for std::make_shared; use listen() or connect().
  LocalSocketChannel(net::io_context &ioc, std::string path);

private:
  class Peer;

  void do_accept();
  void dispatch(const std::string &line);

  net::io_context &ioc_;
  std::string path_;
  std::unique_ptr<local_stream::acceptor> acceptor_;
  std::vector<std::weak_ptr<Peer>> peers_;
  local_stream::socket socket_;
  bool connected_ = false;
  bool writing_ = false;
  MessageHandler handler_;
};

} // namespace statmon
