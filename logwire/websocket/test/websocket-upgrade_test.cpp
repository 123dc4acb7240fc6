#include "logwire/websocket-upgrade.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

#include "logwire/websocket-url.hpp"

namespace logwire::websocket {

namespace {
constexpr std::string_view kRfcKey = "dGhlIHNhbXBsZSBub25jZQ==";
constexpr std::string_view kRfcAccept = "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=";

std::string_view AsView(const B64EncodedSha1& accept) { return {accept.data(), accept.size()}; }
}  // namespace

TEST(WebSocketUpgradeTest, ComputeAcceptMatchesRfcExample) {
  EXPECT_EQ(AsView(ComputeWebSocketAccept(kRfcKey)), kRfcAccept);
}

TEST(WebSocketUpgradeTest, ComputeAcceptOtherKeys) {
  EXPECT_EQ(AsView(ComputeWebSocketAccept("x3JJHMbDL1EzLkh9GBhXDw==")), "HSmrc0sMlYUkAGmm5OPpG2HaGWk=");
  EXPECT_NE(AsView(ComputeWebSocketAccept("x3JJHMbDL1EzLkh9GBhXDw==")), AsView(ComputeWebSocketAccept(kRfcKey)));
}

TEST(WebSocketUpgradeTest, GeneratedKeysAreValidAndDistinct) {
  const std::string key1 = GenerateWebSocketKey();
  const std::string key2 = GenerateWebSocketKey();
  EXPECT_TRUE(IsValidWebSocketKey(key1));
  EXPECT_TRUE(IsValidWebSocketKey(key2));
  EXPECT_NE(key1, key2);
}

TEST(WebSocketUpgradeTest, KeyValidation) {
  EXPECT_TRUE(IsValidWebSocketKey(kRfcKey));
  EXPECT_FALSE(IsValidWebSocketKey(""));
  EXPECT_FALSE(IsValidWebSocketKey("dGhlIHNhbXBsZSBub25jZQ="));
  EXPECT_FALSE(IsValidWebSocketKey("dGhlIHNhbXBsZSBub25jZQ!="));
  EXPECT_FALSE(IsValidWebSocketKey("dGhlIHNhbXBsZSBub25jZQab"));
}

TEST(WebSocketUpgradeTest, RequestIsAcceptedByServerParser) {
  const std::string request = BuildUpgradeRequest("example.com:8080", "/api/ws/uploads", kRfcKey);
  EXPECT_TRUE(request.starts_with("GET /api/ws/uploads HTTP/1.1\r\n"));
  EXPECT_NE(request.find("Host: example.com:8080\r\n"), std::string::npos);

  const auto parsed = ParseUpgradeRequest(request);
  ASSERT_EQ(parsed.status, UpgradeRequest::Status::Valid);
  EXPECT_EQ(parsed.target, "/api/ws/uploads");
  EXPECT_EQ(parsed.key, kRfcKey);
  EXPECT_EQ(parsed.headSize, request.size());
}

TEST(WebSocketUpgradeTest, ServerParserRejectsMissingHeaders) {
  EXPECT_EQ(ParseUpgradeRequest("GET / HTTP/1.1\r\nHost: x\r\n").status, UpgradeRequest::Status::Incomplete);
  EXPECT_EQ(ParseUpgradeRequest("GET / HTTP/1.1\r\nHost: x\r\n\r\n").status, UpgradeRequest::Status::Invalid);
  EXPECT_EQ(ParseUpgradeRequest("POST / HTTP/1.1\r\nUpgrade: websocket\r\nConnection: Upgrade\r\n"
                                "Sec-WebSocket-Version: 13\r\nSec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n\r\n")
                .status,
            UpgradeRequest::Status::Invalid);
}

TEST(WebSocketUpgradeTest, ResponseIsAcceptedByClientParser) {
  std::string response = BuildUpgradeResponse(kRfcKey);
  const std::size_t headSize = response.size();
  response.append("\x81\x02hi");

  const auto parsed = ParseUpgradeResponse(response, kRfcKey);
  ASSERT_EQ(parsed.status, UpgradeResponse::Status::Accepted);
  EXPECT_EQ(parsed.statusCode, 101);
  EXPECT_EQ(parsed.headSize, headSize);
}

TEST(WebSocketUpgradeTest, ClientParserHeaderNamesAreCaseInsensitive) {
  const std::string response = std::string("HTTP/1.1 101 Switching Protocols\r\nupgrade: WebSocket\r\n"
                                           "connection: keep-alive, Upgrade\r\nsec-websocket-accept: ") +
                               std::string(kRfcAccept) + "\r\n\r\n";
  EXPECT_EQ(ParseUpgradeResponse(response, kRfcKey).status, UpgradeResponse::Status::Accepted);
}

TEST(WebSocketUpgradeTest, ClientParserRejections) {
  EXPECT_EQ(ParseUpgradeResponse("HTTP/1.1 101 Switching", kRfcKey).status, UpgradeResponse::Status::Incomplete);

  const auto notFound = ParseUpgradeResponse("HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\n\r\n", kRfcKey);
  EXPECT_EQ(notFound.status, UpgradeResponse::Status::Rejected);
  EXPECT_EQ(notFound.statusCode, 404);

  const auto wrongAccept = ParseUpgradeResponse(
      "HTTP/1.1 101 Switching Protocols\r\nUpgrade: websocket\r\nConnection: Upgrade\r\n"
      "Sec-WebSocket-Accept: AAAAAAAAAAAAAAAAAAAAAAAAAAA=\r\n\r\n",
      kRfcKey);
  EXPECT_EQ(wrongAccept.status, UpgradeResponse::Status::Rejected);

  EXPECT_EQ(ParseUpgradeResponse("garbage\r\n\r\n", kRfcKey).status, UpgradeResponse::Status::Rejected);
}

TEST(WebSocketUrlTest, ParseDefaults) {
  const auto url = WebSocketUrl::Parse("ws://localhost");
  EXPECT_EQ(url.host, "localhost");
  EXPECT_EQ(url.port, 80);
  EXPECT_EQ(url.target, kDefaultUploadPath);
  EXPECT_FALSE(url.secure);
  EXPECT_EQ(url.authority(), "localhost");

  const auto secure = WebSocketUrl::Parse("WSS://logs.example.com/");
  EXPECT_TRUE(secure.secure);
  EXPECT_EQ(secure.port, 443);
  EXPECT_EQ(secure.target, "/");
}

TEST(WebSocketUrlTest, ParseExplicitPortPathAndQuery) {
  const auto url = WebSocketUrl::Parse("ws://127.0.0.1:3001/api/ws/uploads?client=cli#frag");
  EXPECT_EQ(url.host, "127.0.0.1");
  EXPECT_EQ(url.port, 3001);
  EXPECT_EQ(url.target, "/api/ws/uploads?client=cli");
  EXPECT_EQ(url.authority(), "127.0.0.1:3001");

  const auto queryOnly = WebSocketUrl::Parse("ws://host:81?x=1");
  EXPECT_EQ(queryOnly.target, "/api/ws/uploads?x=1");
}

TEST(WebSocketUrlTest, ParseIpv6) {
  const auto url = WebSocketUrl::Parse("ws://[::1]:9000/ws");
  EXPECT_EQ(url.host, "::1");
  EXPECT_EQ(url.port, 9000);
  EXPECT_EQ(url.authority(), "[::1]:9000");
}

TEST(WebSocketUrlTest, ParseErrors) {
  EXPECT_THROW(WebSocketUrl::Parse("localhost:80"), std::invalid_argument);
  EXPECT_THROW(WebSocketUrl::Parse("http://localhost"), std::invalid_argument);
  EXPECT_THROW(WebSocketUrl::Parse("ws://:80/"), std::invalid_argument);
  EXPECT_THROW(WebSocketUrl::Parse("ws://host:0/"), std::invalid_argument);
  EXPECT_THROW(WebSocketUrl::Parse("ws://host:65536/"), std::invalid_argument);
  EXPECT_THROW(WebSocketUrl::Parse("ws://host:8x/"), std::invalid_argument);
  EXPECT_THROW(WebSocketUrl::Parse("ws://[::1/"), std::invalid_argument);
  EXPECT_THROW(WebSocketUrl::Parse("ws://user@host/"), std::invalid_argument);
}

}  // namespace logwire::websocket
