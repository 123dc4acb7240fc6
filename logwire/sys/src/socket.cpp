#include "logwire/socket.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstdint>

#include "logwire/base-fd.hpp"
#include "logwire/errno-throw.hpp"
#include "logwire/log.hpp"

namespace logwire {

void Socket::bindAndListen(uint16_t& port) {
  _baseFd = BaseFd(::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
  if (!_baseFd) {
    throw_errno("Unable to create a new socket");
  }

  static constexpr int kOne = 1;
  if (::setsockopt(fd(), SOL_SOCKET, SO_REUSEADDR, &kOne, sizeof(kOne)) != 0) {
    throw_errno("setsockopt(SO_REUSEADDR) failed");
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = htons(port);
  if (::bind(fd(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
    throw_errno("bind failed on port {}", port);
  }
  if (::listen(fd(), SOMAXCONN) != 0) {
    throw_errno("listen failed on port {}", port);
  }
  if (port == 0) {
    socklen_t len = sizeof(addr);
    if (::getsockname(fd(), reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
      throw_errno("getsockname failed");
    }
    port = ntohs(addr.sin_port);
  }
  log::debug("Socket fd # {} listening on port {}", fd(), port);
}

BaseFd Socket::accept() const {
  BaseFd client(::accept4(fd(), nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC));
  if (!client && errno != EAGAIN && errno != EINTR) {
    throw_errno("accept failed on fd # {}", fd());
  }
  return client;
}

}  // namespace logwire
