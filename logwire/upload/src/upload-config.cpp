#include "logwire/upload-config.hpp"

#include <chrono>
#include <stdexcept>

namespace logwire {

void UploadConfig::validate() const {
  if (chunkSize == 0) {
    throw std::invalid_argument("Chunk size should be strictly positive");
  }
  if (ackTimeout <= std::chrono::milliseconds{0} || completeTimeout <= std::chrono::milliseconds{0} ||
      metadataTimeout <= std::chrono::milliseconds{0}) {
    throw std::invalid_argument("Upload timeouts should be strictly positive");
  }
  if (pacingDelay < std::chrono::milliseconds{0}) {
    throw std::invalid_argument("Pacing delay should not be negative");
  }
  compression.validate();
}

}  // namespace logwire
