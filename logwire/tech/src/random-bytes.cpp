#include "logwire/random-bytes.hpp"

#include <cstddef>
#include <cstdint>
#include <random>
#include <span>

namespace logwire {

namespace {

std::mt19937_64& ThreadRng() {
  thread_local std::mt19937_64 engine = [] {
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd()};
    return std::mt19937_64(seq);
  }();
  return engine;
}

}  // namespace

void FillRandomBytes(std::span<std::byte> out) {
  auto& rng = ThreadRng();
  std::size_t pos = 0;
  while (pos < out.size()) {
    uint64_t word = rng();
    for (int idx = 0; idx < 8 && pos < out.size(); ++idx, ++pos) {
      out[pos] = static_cast<std::byte>(word & 0xFF);
      word >>= 8;
    }
  }
}

}  // namespace logwire
