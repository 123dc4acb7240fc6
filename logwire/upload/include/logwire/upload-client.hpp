#pragma once

#include <cstddef>
#include <filesystem>
#include <span>
#include <string_view>

#include "logwire/protocol-message.hpp"
#include "logwire/transport-session.hpp"
#include "logwire/upload-config.hpp"
#include "logwire/upload-payloads.hpp"
#include "logwire/upload-progress.hpp"

namespace logwire {

// Drives uploads over a TransportSession owned by the caller.
//
// A chunked file upload goes through:
//   compress (whole payload, kept only if worth it) -> upload:init / ack -> upload:chunk x N -> upload:complete
//   -> complete or error.
// Map, rules and carrier files are sent as a single message answered by complete or error.
//
// All methods block until the outcome is known and throw on failure:
//   - ConnectionError if the session cannot connect,
//   - ProtocolTimeoutError if an answer does not arrive in time,
//   - ServerReportedError if the server sends 'error',
//   - ProtocolError if an answer lacks a required field.
// Nothing is retried. Only one upload at a time may run on a given session.
class UploadClient {
 public:
  // Throws std::invalid_argument if 'config' is invalid.
  explicit UploadClient(TransportSession& session, UploadConfig config = {});

  FileInfo uploadFile(std::string_view fileName, std::span<const std::byte> content,
                      const ProgressCallback& onProgress = {});

  // Reads the file at 'path' and uploads it under its file name.
  FileInfo uploadFile(const std::filesystem::path& path, const ProgressCallback& onProgress = {});

  FileInfo uploadMap(std::string_view fileName, std::span<const std::byte> content);
  FileInfo uploadMap(const std::filesystem::path& path);

  RulesInfo uploadRules(std::string_view fileName, std::span<const std::byte> content);
  RulesInfo uploadRules(const std::filesystem::path& path);

  CarrierUploadResult uploadCarrierLog(std::string_view fileName, std::span<const std::byte> content);
  CarrierUploadResult uploadCarrierLog(const std::filesystem::path& path);

  [[nodiscard]] const UploadConfig& config() const noexcept { return _config; }

 private:
  // Sends one FileUploadPayload message of 'type' and returns the 'complete' answer.
  ProtocolMessage uploadSingleMessage(std::string_view type, std::string_view fileName,
                                      std::span<const std::byte> content);

  TransportSession& _session;
  UploadConfig _config;
};

}  // namespace logwire
