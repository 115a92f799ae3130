#pragma once
/// @file channel.hpp
/// @brief Abstract inter-process message channel.

#include <nlohmann/json.hpp>

#include <functional>

namespace statmon {

/// @brief Callback invoked for every inbound message.
using MessageHandler = std::function<void(const nlohmann::json &)>;

/// @brief Fire-and-forget message transport between cooperating processes.
///
/// No acknowledgement, retry or backpressure: a message that cannot be
/// delivered is dropped without telling the sender.
class Channel {
public:
  virtual ~Channel() = default;

  virtual void send(const nlohmann::json &message) = 0;

  /// @brief Install the inbound handler, replacing any previous one.
  virtual void on_message(MessageHandler handler) = 0;
};

} // namespace statmon
