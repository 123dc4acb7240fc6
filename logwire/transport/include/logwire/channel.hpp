#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace logwire {

// One bidirectional text message channel (one WebSocket connection in production).
//
// Callbacks are invoked from a thread owned by the channel, never from within open(), send() or close().
// onClose fires at most once per channel, also when open() fails, and no callback follows it.
// A channel is single use: once closed, a new one must be created.
class Channel {
 public:
  struct Callbacks {
    std::function<void()> onOpen;
    std::function<void(std::string_view text)> onMessage;
    std::function<void(std::string_view reason)> onClose;
  };

  virtual ~Channel() = default;

  // Start connecting. Returns immediately, the outcome is reported through the callbacks.
  virtual void open(Callbacks callbacks) = 0;

  // Queue one text message. Messages are written in call order. Ignored once the channel is closed.
  virtual void send(std::string text) = 0;

  // Start an orderly close. Idempotent.
  virtual void close() = 0;
};

using ChannelFactory = std::function<std::unique_ptr<Channel>()>;

}  // namespace logwire
