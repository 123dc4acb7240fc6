#include "logwire/websocket-upgrade.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include "logwire/base64.hpp"
#include "logwire/fmt.hpp"
#include "logwire/random-bytes.hpp"
#include "logwire/string-equal-ignore-case.hpp"
#include "logwire/websocket-constants.hpp"

namespace logwire::websocket {

namespace {

constexpr std::string_view kCRLF = "\r\n";
constexpr std::string_view kEndOfHead = "\r\n\r\n";
constexpr std::size_t kKeyBytes = 16;

// Check if a character is valid base64
[[nodiscard]] constexpr bool IsBase64Char(char ch) noexcept {
  return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') || ch == '+' || ch == '/' ||
         ch == '=';
}

constexpr std::string_view TrimOws(std::string_view str) noexcept {
  while (!str.empty() && (str.front() == ' ' || str.front() == '\t')) {
    str.remove_prefix(1);
  }
  while (!str.empty() && (str.back() == ' ' || str.back() == '\t')) {
    str.remove_suffix(1);
  }
  return str;
}

// Header lines of an HTTP head, the first (start) line excluded.
struct HeadFields {
  std::string_view upgrade;
  std::string_view connection;
  std::string_view key;
  std::string_view accept;
  std::string_view version;
};

HeadFields ParseHeaderLines(std::string_view lines) {
  HeadFields fields;
  while (!lines.empty()) {
    const auto eol = lines.find(kCRLF);
    const std::string_view line = lines.substr(0, eol);
    lines = eol == std::string_view::npos ? std::string_view{} : lines.substr(eol + kCRLF.size());

    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
      continue;
    }
    const std::string_view name = line.substr(0, colon);
    const std::string_view value = TrimOws(line.substr(colon + 1));
    if (CaseInsensitiveEqual(name, "Upgrade")) {
      fields.upgrade = value;
    } else if (CaseInsensitiveEqual(name, "Connection")) {
      fields.connection = value;
    } else if (CaseInsensitiveEqual(name, SecWebSocketKey)) {
      fields.key = value;
    } else if (CaseInsensitiveEqual(name, SecWebSocketAccept)) {
      fields.accept = value;
    } else if (CaseInsensitiveEqual(name, SecWebSocketVersion)) {
      fields.version = value;
    }
  }
  return fields;
}

}  // namespace

std::string GenerateWebSocketKey() {
  std::array<std::byte, kKeyBytes> nonce;
  FillRandomBytes(nonce);
  return B64Encode(nonce);
}

bool IsValidWebSocketKey(std::string_view key) {
  // 16 bytes -> 22 chars + 2 padding
  return key.size() == B64EncodedLen(kKeyBytes) && std::ranges::all_of(key, IsBase64Char) && key[22] == '=' &&
         key[23] == '=';
}

B64EncodedSha1 ComputeWebSocketAccept(std::string_view key) {
  std::string input;
  input.reserve(key.size() + kGUID.size());
  input.append(key);
  input.append(kGUID);

  std::array<unsigned char, 20> hash;
  unsigned int hashLen = 0;
  if (EVP_Digest(input.data(), input.size(), hash.data(), &hashLen, EVP_sha1(), nullptr) != 1 ||
      hashLen != hash.size()) {
    throw std::runtime_error("SHA-1 digest of the WebSocket key failed");
  }

  static_assert(B64EncodedLen(sizeof(hash)) == B64EncodedSha1{}.size(), "Unexpected B64EncodedSha1 size");

  B64EncodedSha1 ret;
  B64Encode(std::as_bytes(std::span(hash)), ret.data());
  return ret;
}

std::string BuildUpgradeRequest(std::string_view authority, std::string_view target, std::string_view key) {
  return fmt::format(
      "GET {} HTTP/1.1\r\n"
      "Host: {}\r\n"
      "Upgrade: {}\r\n"
      "Connection: Upgrade\r\n"
      "{}: {}\r\n"
      "{}: {}\r\n"
      "\r\n",
      target, authority, UpgradeValue, SecWebSocketKey, key, SecWebSocketVersion, kWebSocketVersion);
}

UpgradeResponse ParseUpgradeResponse(std::string_view data, std::string_view key) {
  UpgradeResponse response;

  const auto endOfHead = data.find(kEndOfHead);
  if (endOfHead == std::string_view::npos) {
    return response;
  }
  response.headSize = endOfHead + kEndOfHead.size();
  response.status = UpgradeResponse::Status::Rejected;

  const std::string_view head = data.substr(0, endOfHead);
  const auto eol = head.find(kCRLF);
  const std::string_view statusLine = head.substr(0, eol);

  // HTTP/1.1 101 Switching Protocols
  static constexpr std::string_view kHttpPrefix = "HTTP/1.";
  if (!statusLine.starts_with(kHttpPrefix) || statusLine.size() < kHttpPrefix.size() + 5) {
    response.errorMessage = "Malformed status line";
    return response;
  }
  const std::string_view codeStr = statusLine.substr(kHttpPrefix.size() + 2, 3);
  const auto [ptr, errc] = std::from_chars(codeStr.data(), codeStr.data() + codeStr.size(), response.statusCode);
  if (errc != std::errc{} || ptr != codeStr.data() + codeStr.size()) {
    response.errorMessage = "Malformed status code";
    return response;
  }
  if (response.statusCode != 101) {
    response.errorMessage = "Server refused the WebSocket upgrade";
    return response;
  }

  const HeadFields fields =
      ParseHeaderLines(eol == std::string_view::npos ? std::string_view{} : head.substr(eol + kCRLF.size()));
  if (!CaseInsensitiveEqual(fields.upgrade, UpgradeValue) || !HeaderListContainsToken(fields.connection, "upgrade")) {
    response.errorMessage = "Missing upgrade headers";
    return response;
  }
  const B64EncodedSha1 expectedAccept = ComputeWebSocketAccept(key);
  if (fields.accept != std::string_view(expectedAccept.data(), expectedAccept.size())) {
    response.errorMessage = "Invalid Sec-WebSocket-Accept";
    return response;
  }

  response.status = UpgradeResponse::Status::Accepted;
  return response;
}

UpgradeRequest ParseUpgradeRequest(std::string_view data) {
  UpgradeRequest request;

  const auto endOfHead = data.find(kEndOfHead);
  if (endOfHead == std::string_view::npos) {
    return request;
  }
  request.headSize = endOfHead + kEndOfHead.size();
  request.status = UpgradeRequest::Status::Invalid;

  const std::string_view head = data.substr(0, endOfHead);
  const auto eol = head.find(kCRLF);
  std::string_view requestLine = head.substr(0, eol);

  // GET <target> HTTP/1.1
  static constexpr std::string_view kGet = "GET ";
  if (!requestLine.starts_with(kGet)) {
    return request;
  }
  requestLine.remove_prefix(kGet.size());
  const auto spacePos = requestLine.find(' ');
  if (spacePos == std::string_view::npos || spacePos == 0) {
    return request;
  }
  request.target = requestLine.substr(0, spacePos);

  const HeadFields fields =
      ParseHeaderLines(eol == std::string_view::npos ? std::string_view{} : head.substr(eol + kCRLF.size()));
  if (!CaseInsensitiveEqual(fields.upgrade, UpgradeValue) || !HeaderListContainsToken(fields.connection, "upgrade") ||
      fields.version != kWebSocketVersion || !IsValidWebSocketKey(fields.key)) {
    return request;
  }

  request.key = fields.key;
  request.status = UpgradeRequest::Status::Valid;
  return request;
}

std::string BuildUpgradeResponse(std::string_view key) {
  const B64EncodedSha1 accept = ComputeWebSocketAccept(key);
  return fmt::format(
      "HTTP/1.1 101 Switching Protocols\r\n"
      "Upgrade: {}\r\n"
      "Connection: Upgrade\r\n"
      "{}: {}\r\n"
      "\r\n",
      UpgradeValue, SecWebSocketAccept, std::string_view(accept.data(), accept.size()));
}

}  // namespace logwire::websocket
