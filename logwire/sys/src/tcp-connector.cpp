#include "logwire/tcp-connector.hpp"

#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>

#include "logwire/base-fd.hpp"
#include "logwire/log.hpp"

namespace logwire {

ConnectResult ConnectTCP(std::string_view host, uint16_t port) {
  // getaddrinfo expects null-terminated strings.
  const std::string hostStr(host);
  const std::string portStr = std::to_string(port);

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo* res = nullptr;
  const int gai = ::getaddrinfo(hostStr.c_str(), portStr.c_str(), &hints, &res);
  std::unique_ptr<addrinfo, void (*)(addrinfo*)> resRAII(res, &::freeaddrinfo);
  ConnectResult connectResult;

  if (gai != 0) [[unlikely]] {
    log::error("ConnectTCP: getaddrinfo('{}', '{}') failed: {}", hostStr, portStr, ::gai_strerror(gai));
    connectResult.failure = true;
    return connectResult;
  }

  for (addrinfo* rp = res; rp != nullptr; rp = rp->ai_next) {
    const int socktype = rp->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC;

    connectResult.fd = BaseFd(::socket(rp->ai_family, socktype, rp->ai_protocol));
    if (!connectResult.fd) [[unlikely]] {
      const int saved = errno;
      log::error("ConnectTCP: socket() failed (family={}): errno={}, msg={}", rp->ai_family, saved,
                 std::strerror(saved));
      if (saved == EMFILE || saved == ENFILE) {
        break;
      }
      continue;
    }

    static constexpr int kOne = 1;
    if (::setsockopt(connectResult.fd.fd(), IPPROTO_TCP, TCP_NODELAY, &kOne, sizeof(kOne)) != 0) {
      log::warn("ConnectTCP: unable to set TCP_NODELAY: {}", std::strerror(errno));
    }

    if (::connect(connectResult.fd.fd(), rp->ai_addr, rp->ai_addrlen) == 0) {
      return connectResult;
    }

    const int connectErr = errno;
    if (connectErr == EINPROGRESS || connectErr == EALREADY) {
      connectResult.connectPending = true;
      return connectResult;
    }
    log::debug("ConnectTCP: connect() to {}:{} failed (family={}): errno={}, msg={}", hostStr, portStr, rp->ai_family,
               connectErr, std::strerror(connectErr));
  }
  connectResult.fd.close();
  connectResult.failure = true;
  return connectResult;
}

int PendingConnectError(int fd) noexcept {
  int err = 0;
  socklen_t len = sizeof(err);
  if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) != 0) {
    return errno;
  }
  return err;
}

}  // namespace logwire
