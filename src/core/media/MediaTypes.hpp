#pragma once
#include <cstdint>
#include <string>

namespace mtc {

// Remote media object. url is transient and must be re-resolved per use.
struct MediaObject {
  std::string id;
  std::string url;
  std::string mimeType;
  std::string contentHash;      // sha256
  int64_t     byteSize = 0;
  std::string messagingProduct;
};

// Opaque token from a completed resumable upload ("4::..." style).
using MediaHandle = std::string;

enum class UploadState {
  Uninitialized,
  SessionCreated,
  Completed,
  Failed
};

const char* to_string(UploadState s);

// Server-side context for one resumable push. Single use.
struct UploadSession {
  std::string sessionId;
  int64_t     declaredLength = 0;
  std::string mimeType;
  UploadState state = UploadState::Uninitialized;
};

} // namespace mtc
