#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

#include "logwire/compression-config.hpp"

namespace logwire {

struct UploadConfig {
  static constexpr std::size_t kDefaultChunkSize = 5UL * 1024UL * 1024UL;

  // Throws std::invalid_argument if the configuration is not usable.
  void validate() const;

  UploadConfig& withChunkSize(std::size_t value) {
    chunkSize = value;
    return *this;
  }

  UploadConfig& withCompression(const CompressionConfig& value) {
    compression = value;
    return *this;
  }

  UploadConfig& withAckTimeout(std::chrono::milliseconds value) {
    ackTimeout = value;
    return *this;
  }

  UploadConfig& withCompleteTimeout(std::chrono::milliseconds value) {
    completeTimeout = value;
    return *this;
  }

  UploadConfig& withMetadataTimeout(std::chrono::milliseconds value) {
    metadataTimeout = value;
    return *this;
  }

  // A pause of 'delay' after every 'nbChunks' chunks. 0 chunks disables pacing.
  UploadConfig& withPacing(uint32_t nbChunks, std::chrono::milliseconds delay) {
    pacingInterval = nbChunks;
    pacingDelay = delay;
    return *this;
  }

  // Size of one chunk of the (possibly compressed) payload, before base64 encoding.
  std::size_t chunkSize{kDefaultChunkSize};

  CompressionConfig compression;

  // Deadline for the 'ack' answering 'upload:init'.
  std::chrono::milliseconds ackTimeout{std::chrono::seconds{10}};

  // Deadline for 'complete' or 'error' after 'upload:complete', covering server side processing.
  std::chrono::milliseconds completeTimeout{std::chrono::seconds{120}};

  // Deadline for 'complete' or 'error' after a single message upload.
  std::chrono::milliseconds metadataTimeout{std::chrono::seconds{30}};

  uint32_t pacingInterval{5};
  std::chrono::milliseconds pacingDelay{10};
};

}  // namespace logwire
