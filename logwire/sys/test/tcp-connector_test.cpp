#include "logwire/tcp-connector.hpp"

#include <gtest/gtest.h>
#include <poll.h>

#include <array>
#include <cstdint>
#include <string_view>

#include "logwire/base-fd.hpp"
#include "logwire/socket.hpp"
#include "logwire/transport.hpp"

namespace logwire {

namespace {

bool WaitFor(int fd, short events) {
  pollfd pfd{fd, events, 0};
  return ::poll(&pfd, 1, 2000) == 1;
}

}  // namespace

TEST(TcpConnectorTest, ConnectsToLocalListener) {
  Socket listener;
  uint16_t port = 0;
  listener.bindAndListen(port);
  ASSERT_NE(port, 0);

  auto result = ConnectTCP("127.0.0.1", port);
  ASSERT_FALSE(result.failure);
  ASSERT_TRUE(result.fd);
  if (result.connectPending) {
    ASSERT_TRUE(WaitFor(result.fd.fd(), POLLOUT));
  }
  EXPECT_EQ(PendingConnectError(result.fd.fd()), 0);

  ASSERT_TRUE(WaitFor(listener.fd(), POLLIN));
  BaseFd accepted = listener.accept();
  ASSERT_TRUE(accepted);

  PlainTransport clientSide(result.fd.fd());
  PlainTransport serverSide(accepted.fd());
  auto written = clientSide.write("hello");
  EXPECT_EQ(written.bytesProcessed, 5U);
  EXPECT_EQ(written.want, TransportHint::None);

  ASSERT_TRUE(WaitFor(accepted.fd(), POLLIN));
  std::array<char, 16> buf{};
  auto nbRead = serverSide.read(buf.data(), buf.size());
  EXPECT_EQ(std::string_view(buf.data(), nbRead.bytesProcessed), "hello");

  auto again = serverSide.read(buf.data(), buf.size());
  EXPECT_EQ(again.want, TransportHint::ReadReady);

  clientSide.shutdown();
  ASSERT_TRUE(WaitFor(accepted.fd(), POLLIN));
  auto eof = serverSide.read(buf.data(), buf.size());
  EXPECT_EQ(eof.bytesProcessed, 0U);
  EXPECT_EQ(eof.want, TransportHint::None);
}

TEST(TcpConnectorTest, UnresolvableHostFails) {
  auto result = ConnectTCP("invalid host name with spaces", 80);
  EXPECT_TRUE(result.failure);
  EXPECT_FALSE(result.fd);
}

TEST(TcpConnectorTest, RefusedConnectionReportsError) {
  uint16_t port = 0;
  {
    Socket listener;
    listener.bindAndListen(port);
  }
  auto result = ConnectTCP("127.0.0.1", port);
  if (result.failure) {
    SUCCEED();
    return;
  }
  ASSERT_TRUE(result.connectPending);
  ASSERT_TRUE(WaitFor(result.fd.fd(), POLLOUT));
  EXPECT_NE(PendingConnectError(result.fd.fd()), 0);
}

}  // namespace logwire
