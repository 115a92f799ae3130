/// @file local_socket_channel.cpp
/// @brief Implementation of LocalSocketChannel.

#include "cluster/local_socket_channel.hpp"

#include <algorithm>
#include <cstdio>
#include <istream>
#include <iostream>
#include <utility>

namespace statmon {

// ─── Peer (one connected worker, coordinator side) ──────────────────────

class LocalSocketChannel::Peer
    : public std::enable_shared_from_this<LocalSocketChannel::Peer> {
public:
  Peer(local_stream::socket socket, std::weak_ptr<LocalSocketChannel> owner)
      : socket_{std::move(socket)}, owner_{std::move(owner)} {}

  void run() { do_read(); }

  void close() {
    boost::system::error_code ignored;
    socket_.close(ignored);
  }

  [[nodiscard]] auto is_open() const -> bool { return socket_.is_open(); }

private:
  void do_read() {
    net::async_read_until(
        socket_, buffer_, '\n',
        [self = shared_from_this()](const boost::system::error_code &ec,
                                    std::size_t) { self->on_read(ec); });
  }

  void on_read(const boost::system::error_code &ec) {
    if (ec) {
      close(); // Worker went away; its record ages out in the aggregator.
      return;
    }

    std::istream in(&buffer_);
    std::string line;
    std::getline(in, line);

    if (auto owner = owner_.lock()) {
      owner->dispatch(line);
      do_read();
    }
  }

  local_stream::socket socket_;
  net::streambuf buffer_;
  std::weak_ptr<LocalSocketChannel> owner_;
};

// ─── LocalSocketChannel ─────────────────────────────────────────────────

LocalSocketChannel::LocalSocketChannel(net::io_context &ioc, std::string path)
    : ioc_{ioc}, path_{std::move(path)}, socket_{ioc} {}

LocalSocketChannel::~LocalSocketChannel() { close(); }

auto LocalSocketChannel::listen(net::io_context &ioc, const std::string &path)
    -> std::expected<std::shared_ptr<LocalSocketChannel>, std::error_code> {
  auto channel = std::make_shared<LocalSocketChannel>(ioc, path);
  auto acceptor = std::make_unique<local_stream::acceptor>(ioc);

  // A previous coordinator may have left its socket file behind.
  std::remove(path.c_str());

  boost::system::error_code ec;
  acceptor->open(local_stream{}, ec);
  if (!ec) {
    acceptor->bind(local_stream::endpoint{path}, ec);
  }
  if (!ec) {
    acceptor->listen(net::socket_base::max_listen_connections, ec);
  }
  if (ec) {
    return std::unexpected(std::error_code{ec.value(), std::system_category()});
  }

  channel->acceptor_ = std::move(acceptor);
  channel->do_accept();
  std::cout << "[LocalSocketChannel] listening on " << path << "\n";
  return channel;
}

auto LocalSocketChannel::connect(net::io_context &ioc, const std::string &path)
    -> std::shared_ptr<LocalSocketChannel> {
  auto channel = std::make_shared<LocalSocketChannel>(ioc, path);
  channel->socket_.async_connect(
      local_stream::endpoint{path},
      [weak = std::weak_ptr<LocalSocketChannel>{channel}](
          const boost::system::error_code &ec) {
        auto self = weak.lock();
        if (!self) {
          return;
        }
        if (ec) {
          std::cerr << "[LocalSocketChannel] connect to " << self->path_
                    << " failed: " << ec.message() << "\n";
          return;
        }
        self->connected_ = true;
        std::cout << "[LocalSocketChannel] connected to " << self->path_
                  << "\n";
      });
  return channel;
}

void LocalSocketChannel::do_accept() {
  acceptor_->async_accept([weak = weak_from_this()](
                              const boost::system::error_code &ec,
                              local_stream::socket socket) {
    auto self = weak.lock();
    if (!self || !self->acceptor_) {
      return;
    }
    if (!ec) {
      auto peer = std::make_shared<Peer>(std::move(socket), weak);
      std::erase_if(self->peers_,
                    [](const auto &p) { return p.expired(); });
      self->peers_.push_back(peer);
      peer->run();
    }
    if (self->acceptor_->is_open()) {
      self->do_accept();
    }
  });
}

void LocalSocketChannel::dispatch(const std::string &line) {
  if (line.empty() || !handler_) {
    return;
  }
  auto message = nlohmann::json::parse(line, nullptr, false);
  if (message.is_discarded()) {
    std::cerr << "[LocalSocketChannel] dropping unparsable message ("
              << line.size() << " bytes)\n";
    return;
  }
  handler_(message);
}

void LocalSocketChannel::send(const nlohmann::json &message) {
  if (!connected_ || writing_) {
    return;
  }

  auto payload = std::make_shared<std::string>(message.dump());
  payload->push_back('\n');
  writing_ = true;

  net::async_write(
      socket_, net::buffer(*payload),
      [weak = weak_from_this(), payload](const boost::system::error_code &ec,
                                         std::size_t) {
        auto self = weak.lock();
        if (!self) {
          return;
        }
        self->writing_ = false;
        if (ec) {
          // Coordinator gone: stop sending, no retry.
          self->connected_ = false;
          boost::system::error_code ignored;
          self->socket_.close(ignored);
        }
      });
}

void LocalSocketChannel::on_message(MessageHandler handler) {
  handler_ = std::move(handler);
}

auto LocalSocketChannel::peer_count() const noexcept -> std::size_t {
  return static_cast<std::size_t>(
      std::count_if(peers_.begin(), peers_.end(), [](const auto &weak) {
        auto p = weak.lock();
        return p && p->is_open();
      }));
}

void LocalSocketChannel::close() {
  boost::system::error_code ignored;
  if (acceptor_) {
    acceptor_->close(ignored);
    acceptor_.reset();
    std::remove(path_.c_str());
  }
  for (auto &weak : peers_) {
    if (auto p = weak.lock()) {
      p->close();
    }
  }
  peers_.clear();
  socket_.close(ignored);
  connected_ = false;
}

} // namespace statmon
