#pragma once

#include <cstddef>
#include <span>

namespace logwire {

// Fills 'out' from a per-thread generator seeded once from std::random_device.
// Suitable for WebSocket nonces and masking keys, not for key material.
void FillRandomBytes(std::span<std::byte> out);

}  // namespace logwire
