#include "logwire/upload-client.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include "logwire/base64.hpp"
#include "logwire/chunk-plan.hpp"
#include "logwire/compression-ratio.hpp"
#include "logwire/encoding.hpp"
#include "logwire/file.hpp"
#include "logwire/fmt.hpp"
#include "logwire/log.hpp"
#include "logwire/payload-compression.hpp"
#include "logwire/protocol-message.hpp"
#include "logwire/transport-errors.hpp"
#include "logwire/transport-session.hpp"
#include "logwire/upload-config.hpp"
#include "logwire/upload-payloads.hpp"
#include "logwire/upload-progress.hpp"

namespace logwire {

namespace {

void Report(const ProgressCallback& onProgress, int progress, std::string_view stage) {
  log::debug("Upload progress {}%: {}", progress, stage);
  if (onProgress) {
    onProgress(progress, stage);
  }
}

// Removes a handler when going out of scope.
class HandlerGuard {
 public:
  explicit HandlerGuard(Unsubscribe unsubscribe) : _unsubscribe(std::move(unsubscribe)) {}

  HandlerGuard(const HandlerGuard&) = delete;
  HandlerGuard(HandlerGuard&&) = delete;
  HandlerGuard& operator=(const HandlerGuard&) = delete;
  HandlerGuard& operator=(HandlerGuard&&) = delete;

  ~HandlerGuard() { _unsubscribe(); }

 private:
  Unsubscribe _unsubscribe;
};

[[noreturn]] void ThrowServerError(const ProtocolMessage& msg) {
  auto error = msg.payloadAs<ErrorPayload>();
  if (error.message.empty()) {
    error.message = "Server reported an error without message";
  }
  log::error("Server error{}: {}", error.code ? fmt::format(" ({})", *error.code) : std::string(), error.message);
  throw ServerReportedError(std::move(error.message), std::move(error.code));
}

// Outcome of a complete/error race: the complete message, or the server error thrown.
ProtocolMessage AwaitOutcome(PendingMessage& pending, std::chrono::milliseconds timeout) {
  auto msg = pending.wait(timeout);
  if (msg.type == msgtype::kError) {
    ThrowServerError(msg);
  }
  return msg;
}

}  // namespace

UploadClient::UploadClient(TransportSession& session, UploadConfig config)
    : _session(session), _config(std::move(config)) {
  _config.validate();
}

FileInfo UploadClient::uploadFile(std::string_view fileName, std::span<const std::byte> content,
                                  const ProgressCallback& onProgress) {
  _session.connect();

  Report(onProgress, progress::kPreparing, "Preparing...");
  const PreparedPayload prepared = PreparePayload(content, _config.compression);
  const auto payload = prepared.bytes();
  const std::string_view encoding = GetEncodingStr(prepared.encoding);
  const ChunkPlan plan(payload.size(), _config.chunkSize);
  log::info("Uploading '{}': {} -> {} bytes ({}), {} chunk(s)", fileName, content.size(), payload.size(),
            CompressionRatio(content.size(), payload.size()), plan.nbChunks());

  std::string uploadId;
  {
    auto pendingAck = _session.expect({std::string(msgtype::kAck), std::string(msgtype::kError)});
    _session.send(MakeMessage(msgtype::kUploadInit, UploadInitPayload{.fileName = std::string(fileName),
                                                                       .totalChunks = plan.nbChunks(),
                                                                       .totalSize = content.size(),
                                                                       .encoding = std::string(encoding)}));
    const auto ack = AwaitOutcome(pendingAck, _config.ackTimeout);
    if (!ack.id || ack.id->empty()) {
      throw ProtocolError("Server acknowledged upload:init without an upload id");
    }
    uploadId = *ack.id;
  }
  log::debug("Upload '{}' got id {}", fileName, uploadId);

  // Registered before the first chunk, so that an error sent while chunks are in flight aborts the upload.
  auto pendingOutcome = _session.expect({std::string(msgtype::kComplete), std::string(msgtype::kError)});

  Report(onProgress, progress::kUploading, "Uploading chunks...");
  const uint32_t nbChunks = plan.nbChunks();
  for (uint32_t chunkIndex = 0; chunkIndex < nbChunks; ++chunkIndex) {
    if (auto early = pendingOutcome.tryGet(); early && early->type == msgtype::kError) {
      ThrowServerError(*early);
    }
    const auto chunk = plan.chunk(payload, chunkIndex);
    _session.send(MakeMessage(msgtype::kUploadChunk, UploadChunkPayload{.uploadId = uploadId,
                                                                         .chunkIndex = chunkIndex,
                                                                         .data = B64Encode(chunk),
                                                                         .isLast = plan.isLast(chunkIndex)}));
    Report(onProgress, progress::AfterChunk(chunkIndex, nbChunks),
           fmt::format("Uploading chunk {}/{}...", chunkIndex + 1U, nbChunks));

    if (_config.pacingInterval != 0 && (chunkIndex + 1U) % _config.pacingInterval == 0 && !plan.isLast(chunkIndex)) {
      std::this_thread::sleep_for(_config.pacingDelay);
    }
  }

  Report(onProgress, progress::kProcessing, "Processing...");
  // The handler may still run shortly after being unsubscribed, so it owns what it uses.
  HandlerGuard processingGuard(_session.on(msgtype::kProcessing, [onProgress, uploadId](const ProtocolMessage& msg) {
    if (msg.id != uploadId) {
      return;
    }
    const auto processing = msg.payloadAs<ProgressPayload>();
    Report(onProgress, progress::FromServerProcessing(processing.progress),
           processing.message.empty() ? processing.stage : processing.message);
  }));

  _session.send(MakeMessage(msgtype::kUploadComplete, UploadCompletePayload{.uploadId = uploadId,
                                                                             .fileName = std::string(fileName),
                                                                             .totalChunks = nbChunks,
                                                                             .originalSize = content.size(),
                                                                             .compressedSize = payload.size(),
                                                                             .encoding = std::string(encoding)}));

  const auto complete = AwaitOutcome(pendingOutcome, _config.completeTimeout);
  auto response = complete.payloadAs<CompletePayload<glz::raw_json>>();
  if (!response.fileInfo) {
    throw ProtocolError(fmt::format("Upload {} completed without file information", uploadId));
  }
  Report(onProgress, progress::kComplete, "Complete!");
  log::info("Upload '{}' complete as file {}", fileName, response.fileInfo->id);
  return std::move(*response.fileInfo);
}

FileInfo UploadClient::uploadFile(const std::filesystem::path& path, const ProgressCallback& onProgress) {
  const File file(path.string());
  const auto content = file.loadAllContent();
  return uploadFile(file.fileName(), content, onProgress);
}

FileInfo UploadClient::uploadMap(std::string_view fileName, std::span<const std::byte> content) {
  auto response =
      uploadSingleMessage(msgtype::kMapUpload, fileName, content).payloadAs<CompletePayload<glz::raw_json>>();
  if (!response.fileInfo) {
    throw ProtocolError(fmt::format("Map upload of '{}' completed without file information", fileName));
  }
  return std::move(*response.fileInfo);
}

FileInfo UploadClient::uploadMap(const std::filesystem::path& path) {
  const File file(path.string());
  return uploadMap(file.fileName(), file.loadAllContent());
}

RulesInfo UploadClient::uploadRules(std::string_view fileName, std::span<const std::byte> content) {
  auto response = uploadSingleMessage(msgtype::kRulesUpload, fileName, content).payloadAs<CompletePayload<RulesInfo>>();
  if (!response.result) {
    throw ProtocolError(fmt::format("Rules upload of '{}' completed without result", fileName));
  }
  return std::move(*response.result);
}

RulesInfo UploadClient::uploadRules(const std::filesystem::path& path) {
  const File file(path.string());
  return uploadRules(file.fileName(), file.loadAllContent());
}

CarrierUploadResult UploadClient::uploadCarrierLog(std::string_view fileName, std::span<const std::byte> content) {
  auto response = uploadSingleMessage(msgtype::kCarrierUpload, fileName, content)
                      .payloadAs<CompletePayload<CarrierUploadResult>>();
  if (!response.result) {
    throw ProtocolError(fmt::format("Carrier log upload of '{}' completed without result", fileName));
  }
  return std::move(*response.result);
}

CarrierUploadResult UploadClient::uploadCarrierLog(const std::filesystem::path& path) {
  const File file(path.string());
  return uploadCarrierLog(file.fileName(), file.loadAllContent());
}

ProtocolMessage UploadClient::uploadSingleMessage(std::string_view type, std::string_view fileName,
                                                  std::span<const std::byte> content) {
  _session.connect();
  log::info("Sending '{}' as {} ({} bytes)", fileName, type, content.size());
  auto pendingOutcome = _session.expect({std::string(msgtype::kComplete), std::string(msgtype::kError)});
  _session.send(
      MakeMessage(type, FileUploadPayload{.name = std::string(fileName), .data = B64Encode(content)}));
  return AwaitOutcome(pendingOutcome, _config.metadataTimeout);
}

}  // namespace logwire
