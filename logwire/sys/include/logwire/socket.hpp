#pragma once

#include <cstdint>

#include "logwire/base-fd.hpp"

namespace logwire {

// Simple RAII class wrapping a listening TCP socket bound to the loopback interface.
class Socket {
 public:
  Socket() noexcept = default;

  // Bind to 127.0.0.1 and start listening. If port is 0, an ephemeral port is chosen and updated in the argument.
  // Throws std::system_error on failure.
  void bindAndListen(uint16_t& port);

  // Accept a pending connection as a non-blocking socket. Returns a closed BaseFd if none is pending.
  // Throws std::system_error on unexpected failure.
  [[nodiscard]] BaseFd accept() const;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace logwire
