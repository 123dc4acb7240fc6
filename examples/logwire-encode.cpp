#include <logwire/compression-ratio.hpp>
#include <logwire/log-entry.hpp>
#include <logwire/streaming-log-encoder.hpp>

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <fstream>
#include <iostream>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

using namespace logwire;

namespace {

void Usage(const char *prog) {
  std::cerr << "Usage: " << prog << " <input.tsv> <output.llog> [batchSize]\n"
            << "Each input line: timestamp<TAB>device<TAB>signal<TAB>bool|int|string<TAB>value\n";
}

template <class T>
T ParseNumber(std::string_view str, std::string_view what) {
  T value{};
  const auto [ptr, errc] = std::from_chars(str.data(), str.data() + str.size(), value);
  if (errc != std::errc{} || ptr != str.data() + str.size()) {
    throw std::invalid_argument("Invalid " + std::string(what) + ": '" + std::string(str) + "'");
  }
  return value;
}

LogValue ParseValue(std::string_view type, std::string_view value) {
  if (type == "bool") {
    if (value == "true" || value == "1") {
      return true;
    }
    if (value == "false" || value == "0") {
      return false;
    }
    throw std::invalid_argument("Invalid boolean: '" + std::string(value) + "'");
  }
  if (type == "int") {
    return ParseNumber<int32_t>(value, "integer");
  }
  if (type == "string") {
    return std::string(value);
  }
  throw std::invalid_argument("Unknown value type: '" + std::string(type) + "'");
}

// Empty lines and lines starting with '#' are skipped.
std::optional<LogEntry> ParseLine(std::string_view line) {
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }
  if (line.empty() || line.front() == '#') {
    return std::nullopt;
  }
  std::string_view fields[5];
  for (std::size_t fieldPos = 0; fieldPos < 4; ++fieldPos) {
    const auto tabPos = line.find('\t');
    if (tabPos == std::string_view::npos) {
      throw std::invalid_argument("Expected 5 tab separated fields");
    }
    fields[fieldPos] = line.substr(0, tabPos);
    line.remove_prefix(tabPos + 1);
  }
  fields[4] = line;
  return LogEntry{.timestamp = ParseNumber<int64_t>(fields[0], "timestamp"),
                  .deviceId = std::string(fields[1]),
                  .signalName = std::string(fields[2]),
                  .value = ParseValue(fields[3], fields[4])};
}

}  // namespace

int main(int argc, char **argv) {
  if (argc < 3) {
    Usage(argv[0]);
    return EXIT_FAILURE;
  }

  try {
    std::size_t batchSize = StreamingLogEncoder::kDefaultBatchSize;
    if (argc > 3) {
      batchSize = ParseNumber<std::size_t>(argv[3], "batch size");
    }

    std::ifstream input(argv[1]);
    if (!input) {
      std::cerr << "Cannot open " << argv[1] << '\n';
      return EXIT_FAILURE;
    }
    std::ofstream output(argv[2], std::ios::binary | std::ios::trunc);
    if (!output) {
      std::cerr << "Cannot create " << argv[2] << '\n';
      return EXIT_FAILURE;
    }

    StreamingLogEncoder encoder(batchSize);
    std::size_t inputSize = 0;
    std::size_t outputSize = 0;
    std::size_t nbEntries = 0;
    std::size_t nbBatches = 0;

    const auto writeBatch = [&](std::span<const std::byte> batch) {
      if (batch.empty()) {
        return;
      }
      output.write(reinterpret_cast<const char *>(batch.data()), static_cast<std::streamsize>(batch.size()));
      outputSize += batch.size();
      ++nbBatches;
    };

    std::string line;
    std::size_t lineNb = 0;
    while (std::getline(input, line)) {
      ++lineNb;
      inputSize += line.size() + 1U;
      std::optional<LogEntry> entry;
      try {
        entry = ParseLine(line);
      } catch (const std::invalid_argument &ex) {
        std::cerr << argv[1] << ':' << lineNb << ": " << ex.what() << '\n';
        return EXIT_FAILURE;
      }
      if (!entry) {
        continue;
      }
      ++nbEntries;
      if (auto batch = encoder.addEntry(std::move(*entry))) {
        writeBatch(*batch);
      }
    }
    writeBatch(encoder.flush());

    output.flush();
    if (!output) {
      std::cerr << "Failed to write " << argv[2] << '\n';
      return EXIT_FAILURE;
    }

    std::cout << "Encoded " << nbEntries << " entries in " << nbBatches << " batch(es)\n"
              << "Size reduction: " << CompressionRatio(inputSize, outputSize) << '\n';
  } catch (const std::exception &ex) {
    std::cerr << "Encoding failed: " << ex.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
