// src/main.cpp
#include <cstdlib>
#include <string>
#include <iostream>
#include <stdexcept>
#include <vector>

#include <spdlog/spdlog.h>

#include "core/assets/AssetFormUpload.hpp"
#include "core/media/MediaResolver.hpp"
#include "core/media/ResumableUpload.hpp"
#include "core/media/SimpleUpload.hpp"
#include "core/storage/LocalFileSource.hpp"
#include "core/transport/ApiErrors.hpp"
#include "core/transport/ClientConfig.hpp"
#include "core/transport/HttpRequestExecutor.hpp"

// ---------- helpers ----------

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --upload <phone-number-id> <file> <mime>\n"
            << "  " << argv0 << " --upload-resumable <app-id> <file> <mime>\n"
            << "  " << argv0 << " --resolve <media-id>\n"
            << "  " << argv0 << " --metadata <media-id>\n"
            << "  " << argv0 << " --delete <media-id>\n"
            << "  " << argv0 << " --push-asset <flow-id> <file>\n"
            << "  " << argv0 << " --fetch-asset <flow-id> [out-file]\n"
            << "Environment: MTC_ACCESS_TOKEN (required), MTC_HOST, MTC_SCHEME,\n"
            << "  MTC_API_VERSION, MTC_MESSAGING_PRODUCT, MTC_TIMEOUT_SEC, MTC_LOG_LEVEL\n";
}

static void require_args(const std::vector<std::string>& args, size_t n) {
  if (args.size() < n) throw std::invalid_argument(args[0] + " expects " + std::to_string(n - 1) + " argument(s)");
}

static int run(const std::vector<std::string>& args, const mtc::ClientConfig& config) {
  const std::string& cmd = args[0];
  mtc::HttpRequestExecutor executor(config);
  mtc::LocalFileSource files;

  if (cmd == "--upload") {
    require_args(args, 4);
    mtc::SimpleUpload simple(executor, config.messagingProduct);
    std::cout << simple.uploadFile(args[1], files, args[2], args[3]) << "\n";
    return 0;
  }

  if (cmd == "--upload-resumable") {
    require_args(args, 4);
    const mtc::FilePayload payload = files.read(args[2]);
    mtc::ResumableUpload resumable(executor, config);
    std::cout << resumable.upload(args[1], payload.bytes, args[3]) << "\n";
    return 0;
  }

  if (cmd == "--resolve") {
    require_args(args, 2);
    mtc::MediaResolver resolver(executor);
    std::cout << resolver.resolve(args[1]) << "\n";
    return 0;
  }

  if (cmd == "--metadata") {
    require_args(args, 2);
    mtc::MediaResolver resolver(executor);
    const mtc::MediaObject m = resolver.metadata(args[1]);
    std::cout << "id:        " << m.id << "\n"
              << "mime_type: " << m.mimeType << "\n"
              << "file_size: " << m.byteSize << "\n"
              << "sha256:    " << m.contentHash << "\n"
              << "url:       " << m.url << "\n";
    return 0;
  }

  if (cmd == "--delete") {
    require_args(args, 2);
    mtc::MediaResolver resolver(executor);
    resolver.remove(args[1]);
    std::cout << "media deleted successfully\n";
    return 0;
  }

  if (cmd == "--push-asset") {
    require_args(args, 3);
    const mtc::FilePayload doc = files.read(args[2]);
    mtc::AssetFormUpload assets(executor);
    const mtc::AssetUploadResult r = assets.pushAsset(args[1], doc.bytes);
    for (const auto& v : r.validationErrors) {
      std::cerr << v.error << " [" << v.errorType << "]: " << v.message;
      if (v.lineStart) std::cerr << " (line " << *v.lineStart << ", column " << v.columnStart.value_or(0) << ")";
      std::cerr << "\n";
    }
    std::cout << (r.success ? "success" : "rejected") << "\n";
    return r.success ? 0 : 3;
  }

  if (cmd == "--fetch-asset") {
    require_args(args, 2);
    mtc::AssetFormUpload assets(executor);
    const std::string doc = assets.fetchAsset(args[1]);
    if (args.size() > 2) {
      std::cout << files.write(args[2], doc) << "\n";
    } else {
      std::cout << doc << "\n";
    }
    return 0;
  }

  throw std::invalid_argument("unknown command: " + cmd);
}

// ---------- main ----------

int main(int argc, char** argv) {
  if (argc < 2) {
    print_usage(argv[0]);
    return 1;
  }

  try {
    const mtc::ClientConfig config = mtc::config_from_env();
    spdlog::set_level(spdlog::level::from_str(config.logLevel));

    if (config.accessToken.empty()) {
      spdlog::error("MTC_ACCESS_TOKEN is not set");
      return 1;
    }

    return run(std::vector<std::string>(argv + 1, argv + argc), config);
  } catch (const std::invalid_argument& e) {
    std::cerr << "Error: " << e.what() << "\n";
    print_usage(argv[0]);
    return 1;
  } catch (const mtc::MediaError& e) {
    spdlog::error("{}", e.what());
    if (e.status() != 0) spdlog::error("HTTP status {}", e.status());
    return 3;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
