#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace logwire {

// Indicates what the transport layer needs to proceed after a non-blocking I/O operation.
enum class TransportHint : uint8_t {
  None,        // Operation completed
  ReadReady,   // Need socket readable before operation can proceed
  WriteReady,  // Need socket writable before operation can proceed
  Error
};

// Byte stream abstraction over a connected non-blocking socket, allowing transparent TLS or plain IO.
class ITransport {
 public:
  virtual ~ITransport() = default;

  struct TransportResult {
    std::size_t bytesProcessed;
    TransportHint want;
  };

  // Non-blocking read. bytesProcessed == 0 with TransportHint::None means the peer closed the stream.
  virtual TransportResult read(char* buf, std::size_t len) = 0;

  // Non-blocking write. bytesProcessed may be less than data.size(), in which case 'want' tells why.
  virtual TransportResult write(std::string_view data) = 0;

  // Drive a pending handshake. Returns TransportHint::None once established.
  virtual TransportHint handshake() { return TransportHint::None; }

  [[nodiscard]] virtual bool handshakeDone() const noexcept { return true; }

  // Best effort orderly shutdown of the stream.
  virtual void shutdown() noexcept {}
};

// Plain transport directly operates on a non-blocking fd.
class PlainTransport : public ITransport {
 public:
  explicit PlainTransport(int fd) : _fd(fd) {}

  TransportResult read(char* buf, std::size_t len) override;

  TransportResult write(std::string_view data) override;

  void shutdown() noexcept override;

 private:
  int _fd;
};

}  // namespace logwire
