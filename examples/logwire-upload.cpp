#include <logwire/log.hpp>
#include <logwire/transport-config.hpp>
#include <logwire/transport-errors.hpp>
#include <logwire/transport-session.hpp>
#include <logwire/upload-client.hpp>
#include <logwire/upload-payloads.hpp>

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

using namespace logwire;

namespace {

void Usage(const char *prog) {
  std::cerr << "Usage: " << prog
            << " <ws[s]://host:port[/path]> <file> [log|map|rules|carrier] [-v] [--insecure] [--ca-file <path>]\n";
}

}  // namespace

int main(int argc, char **argv) {
  if (argc < 3) {
    Usage(argv[0]);
    return EXIT_FAILURE;
  }

  const std::string url = argv[1];
  const std::filesystem::path path = argv[2];
  std::string_view kind = "log";
  TransportConfig config = TransportConfig{}.withUrl(url);
  for (int argPos = 3; argPos < argc; ++argPos) {
    const std::string_view arg = argv[argPos];
    if (arg == "-v") {
      log::set_level(log::level::debug);
    } else if (arg == "--insecure") {
      config.withTlsVerifyPeer(false);
    } else if (arg == "--ca-file" && argPos + 1 < argc) {
      config.withTlsCaFile(argv[++argPos]);
    } else {
      kind = arg;
    }
  }

  try {
    TransportSession session(std::move(config));
    UploadClient client(session);

    if (kind == "log") {
      const auto fileInfo = client.uploadFile(path, [](int progress, std::string_view stage) {
        std::cout << '[' << progress << "%] " << stage << '\n';
      });
      std::cout << "Uploaded " << fileInfo.name << " as " << fileInfo.id << " (" << fileInfo.size << " bytes, "
                << fileInfo.status << ")\n";
    } else if (kind == "map") {
      const auto fileInfo = client.uploadMap(path);
      std::cout << "Uploaded map " << fileInfo.name << " as " << fileInfo.id << '\n';
    } else if (kind == "rules") {
      const auto rules = client.uploadRules(path);
      std::cout << "Uploaded rules " << rules.name << " as " << rules.id << ": " << rules.rulesCount
                << " rule(s) for " << rules.deviceCount << " device(s)\n";
    } else if (kind == "carrier") {
      const auto result = client.uploadCarrierLog(path);
      std::cout << "Uploaded carrier log " << result.fileName << " in session " << result.sessionId << '\n';
    } else {
      Usage(argv[0]);
      return EXIT_FAILURE;
    }
    session.disconnect();
  } catch (const ServerReportedError &ex) {
    std::cerr << "Server rejected the upload";
    if (ex.code()) {
      std::cerr << " (" << *ex.code() << ')';
    }
    std::cerr << ": " << ex.what() << '\n';
    return EXIT_FAILURE;
  } catch (const std::exception &ex) {
    std::cerr << "Upload failed: " << ex.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
