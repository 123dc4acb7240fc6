#include "logwire/temp-file.hpp"

#include <array>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "logwire/fmt.hpp"
#include "logwire/log.hpp"
#include "logwire/random-bytes.hpp"

namespace logwire::test {

namespace {

std::string RandomHex() {
  static constexpr char kHex[] = "0123456789abcdef";
  std::array<std::byte, 8> bytes;
  FillRandomBytes(bytes);
  std::string out;
  out.reserve(2 * bytes.size());
  for (std::byte byte : bytes) {
    out.push_back(kHex[std::to_integer<unsigned>(byte) >> 4U]);
    out.push_back(kHex[std::to_integer<unsigned>(byte) & 0xFU]);
  }
  return out;
}

}  // namespace

ScopedTempDir::ScopedTempDir(std::string_view prefix) {
  const auto base = std::filesystem::temp_directory_path();
  for (int attempt = 0; attempt < 100; ++attempt) {
    auto candidate = base / (std::string(prefix) + RandomHex());
    std::error_code ec;
    if (std::filesystem::create_directories(candidate, ec)) {
      _dir = std::move(candidate);
      return;
    }
  }
  throw std::runtime_error("ScopedTempDir: Failed to create temp dir");
}

ScopedTempDir::ScopedTempDir(ScopedTempDir&& other) noexcept : _dir(std::move(other._dir)) { other._dir.clear(); }

ScopedTempDir& ScopedTempDir::operator=(ScopedTempDir&& other) noexcept {
  if (this != &other) {
    cleanup();
    _dir = std::move(other._dir);
    other._dir.clear();
  }
  return *this;
}

ScopedTempDir::~ScopedTempDir() { cleanup(); }

std::filesystem::path ScopedTempDir::writeFile(std::string_view name, std::string_view content) const {
  auto path = _dir / name;
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  if (!out) {
    throw std::runtime_error(fmt::format("ScopedTempDir: unable to write {}", path.string()));
  }
  return path;
}

void ScopedTempDir::cleanup() noexcept {
  if (!_dir.empty()) {
    std::error_code ec;
    std::filesystem::remove_all(_dir, ec);
    if (ec) {
      log::error("ScopedTempDir::cleanup: remove_all({}) failed: {}", _dir.string(), ec.message());
    }
    _dir.clear();
  }
}

}  // namespace logwire::test
