#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace logwire {

// Base of all failures surfaced by the transport session and the upload client.
class TransportError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// The channel could not be established, or was lost.
class ConnectionError : public TransportError {
 public:
  using TransportError::TransportError;
};

// No message of the expected type(s) arrived before the deadline.
class ProtocolTimeoutError : public TransportError {
 public:
  ProtocolTimeoutError(std::string what, std::vector<std::string> expectedTypes)
      : TransportError(std::move(what)), _expectedTypes(std::move(expectedTypes)) {}

  [[nodiscard]] const std::vector<std::string>& expectedTypes() const noexcept { return _expectedTypes; }

 private:
  std::vector<std::string> _expectedTypes;
};

// The server sent an explicit 'error' message. what() is the server message verbatim.
class ServerReportedError : public TransportError {
 public:
  explicit ServerReportedError(std::string message, std::optional<std::string> code = std::nullopt)
      : TransportError(std::move(message)), _code(std::move(code)) {}

  [[nodiscard]] const std::optional<std::string>& code() const noexcept { return _code; }

 private:
  std::optional<std::string> _code;
};

// A server message lacks something the protocol requires (ack without id, malformed payload...).
class ProtocolError : public TransportError {
 public:
  using TransportError::TransportError;
};

}  // namespace logwire
