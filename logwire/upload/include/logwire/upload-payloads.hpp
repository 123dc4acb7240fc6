#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "logwire/json-serializer.hpp"

namespace logwire {

// client -> server

struct UploadInitPayload {
  std::string fileName;
  uint32_t totalChunks{};
  uint64_t totalSize{};  // before compression
  std::string encoding;
};

struct UploadChunkPayload {
  std::string uploadId;
  uint32_t chunkIndex{};
  std::string data;  // base64
  bool isLast{};
};

struct UploadCompletePayload {
  std::string uploadId;
  std::string fileName;
  uint32_t totalChunks{};
  uint64_t originalSize{};
  uint64_t compressedSize{};  // size of the transmitted payload
  std::string encoding;
};

// Single message upload of a small file (map, rules, carrier log).
struct FileUploadPayload {
  std::string name;
  std::string data;  // base64
};

// server -> client

// 'progress' and 'processing' payloads. progress is a percentage in [0, 100].
struct ProgressPayload {
  std::string type;
  std::string uploadId;
  double progress{};
  std::string stage;
  std::string message;
};

struct ErrorPayload {
  std::string type;
  std::string message;
  std::optional<std::string> code;
};

struct FileInfo {
  std::string id;
  std::string name;
  int64_t size{};
  std::string uploadedAt;
  std::string status;
};

struct RulesInfo {
  std::string id;
  std::string name;
  std::string uploadedAt;
  int64_t rulesCount{};
  int64_t deviceCount{};
};

struct CarrierUploadResult {
  std::string sessionId;
  std::string fileId;
  std::string fileName;
};

// 'complete' payload. File uploads fill fileInfo, other uploads fill result.
template <class Result>
struct CompletePayload {
  std::string type;
  std::optional<std::string> uploadId;
  std::optional<FileInfo> fileInfo;
  std::optional<Result> result;
};

}  // namespace logwire

template <>
struct glz::meta<logwire::UploadInitPayload> {
  using T = logwire::UploadInitPayload;
  static constexpr auto value = glz::object("fileName", &T::fileName, "totalChunks", &T::totalChunks, "totalSize",
                                            &T::totalSize, "encoding", &T::encoding);
};

template <>
struct glz::meta<logwire::UploadChunkPayload> {
  using T = logwire::UploadChunkPayload;
  static constexpr auto value = glz::object("uploadId", &T::uploadId, "chunkIndex", &T::chunkIndex, "data",
                                            &T::data, "isLast", &T::isLast);
};

template <>
struct glz::meta<logwire::UploadCompletePayload> {
  using T = logwire::UploadCompletePayload;
  static constexpr auto value =
      glz::object("uploadId", &T::uploadId, "fileName", &T::fileName, "totalChunks", &T::totalChunks, "originalSize",
                  &T::originalSize, "compressedSize", &T::compressedSize, "encoding", &T::encoding);
};

template <>
struct glz::meta<logwire::FileUploadPayload> {
  using T = logwire::FileUploadPayload;
  static constexpr auto value = glz::object("name", &T::name, "data", &T::data);
};

template <>
struct glz::meta<logwire::ProgressPayload> {
  using T = logwire::ProgressPayload;
  static constexpr auto value = glz::object("type", &T::type, "uploadId", &T::uploadId, "progress", &T::progress,
                                            "stage", &T::stage, "message", &T::message);
};

template <>
struct glz::meta<logwire::ErrorPayload> {
  using T = logwire::ErrorPayload;
  static constexpr auto value = glz::object("type", &T::type, "message", &T::message, "code", &T::code);
};

template <>
struct glz::meta<logwire::FileInfo> {
  using T = logwire::FileInfo;
  static constexpr auto value = glz::object("id", &T::id, "name", &T::name, "size", &T::size, "uploadedAt",
                                            &T::uploadedAt, "status", &T::status);
};

template <>
struct glz::meta<logwire::RulesInfo> {
  using T = logwire::RulesInfo;
  static constexpr auto value = glz::object("id", &T::id, "name", &T::name, "uploadedAt", &T::uploadedAt,
                                            "rulesCount", &T::rulesCount, "deviceCount", &T::deviceCount);
};

template <>
struct glz::meta<logwire::CarrierUploadResult> {
  using T = logwire::CarrierUploadResult;
  static constexpr auto value =
      glz::object("sessionId", &T::sessionId, "fileId", &T::fileId, "fileName", &T::fileName);
};

template <class Result>
struct glz::meta<logwire::CompletePayload<Result>> {
  using T = logwire::CompletePayload<Result>;
  static constexpr auto value = glz::object("type", &T::type, "uploadId", &T::uploadId, "fileInfo", &T::fileInfo,
                                            "result", &T::result);
};
