#pragma once

#include <cstdint>
#include <string_view>

#include "logwire/base-fd.hpp"

namespace logwire {

struct ConnectResult {
  BaseFd fd;
  bool connectPending{false};
  bool failure{false};
};

// Resolve host:port and start a non-blocking connect to the first address that accepts it.
// On success the returned socket is owned by the ConnectResult and 'connectPending' tells whether completion
// must be awaited (writability, then PendingConnectError). On failure 'failure' is set (details are logged).
[[nodiscard]] ConnectResult ConnectTCP(std::string_view host, uint16_t port);

// Retrieve the outcome of a pending non-blocking connect on 'fd' (SO_ERROR). Returns 0 on success.
[[nodiscard]] int PendingConnectError(int fd) noexcept;

}  // namespace logwire
