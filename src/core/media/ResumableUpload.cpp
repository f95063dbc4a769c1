#include "ResumableUpload.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <utility>

#include "core/transport/ApiErrors.hpp"
#include "core/transport/RequestPaths.hpp"
#include "core/transport/ResponseDecoding.hpp"

using nlohmann::json;

namespace mtc {

ResumableUpload::ResumableUpload(RequestExecutor& executor, ClientConfig config)
  : executor_(executor), config_(std::move(config)) {}

std::string ResumableUpload::token() const {
  return config_.accessToken.empty() ? executor_.accessToken() : config_.accessToken;
}

UploadSession ResumableUpload::createSession(const std::string& appId,
                                             int64_t length,
                                             const std::string& mimeType) {
  const std::string path = path_segment(appId, "app id") + "/uploads";
  if (length <= 0)      throw std::invalid_argument("file length must be positive");
  if (mimeType.empty()) throw std::invalid_argument("mime type required");

  const json req = {
    {"file_length", length},
    {"file_type", mimeType}
  };
  const std::string body = executor_.execute(path, "POST", req.dump());

  const auto j = parse_response(body, "upload session response");
  const std::string id = string_field(j, "id", body, "upload session response");
  if (id.empty()) throw ProtocolError("no upload session id in response: " + body, 0, body);

  spdlog::debug("created upload session {} for {} bytes of {}", id, length, mimeType);
  return UploadSession{id, length, mimeType, UploadState::SessionCreated};
}

MediaHandle ResumableUpload::pushData(const std::string& sessionId,
                                      std::string_view bytes,
                                      int64_t offset) {
  // Issued by the remote verbatim ("upload:<token>?sig=..."), so it is not
  // held to path_segment().
  if (sessionId.empty()) throw std::invalid_argument("upload session id required");
  if (offset < 0 || static_cast<uint64_t>(offset) > bytes.size())
    throw std::invalid_argument("file offset " + std::to_string(offset) +
                                " outside payload of " + std::to_string(bytes.size()) + " bytes");

  RawRequest req;
  req.method = "POST";
  req.url = config_.versionedUrl(sessionId);
  req.headers = {
    {"Authorization", "OAuth " + token()},
    {"file_offset", std::to_string(offset)}
  };
  req.body = std::string(bytes);
  req.contentType = "application/octet-stream";

  const RawResponse res = executor_.sendRaw(req);
  if (!res.ok()) {
    throw TransportError("upload failed with status " + std::to_string(res.status) + ": " + res.body,
                         res.status, res.body);
  }

  const auto j = parse_response(res.body, "upload response");
  const std::string handle = string_field(j, "h", res.body, "upload response");
  if (handle.empty())
    throw ProtocolError("no media handle in response: " + res.body, res.status, res.body);
  return handle;
}

MediaHandle ResumableUpload::pushData(UploadSession& session,
                                      std::string_view bytes,
                                      int64_t offset) {
  if (session.state != UploadState::SessionCreated) {
    throw std::logic_error(std::string("upload session ") + session.sessionId +
                           " cannot accept data in state " + to_string(session.state));
  }
  if (static_cast<int64_t>(bytes.size()) != session.declaredLength) {
    throw std::invalid_argument("payload is " + std::to_string(bytes.size()) +
                                " bytes, session declared " + std::to_string(session.declaredLength));
  }

  try {
    MediaHandle handle = pushData(session.sessionId, bytes, offset);
    session.state = UploadState::Completed;
    spdlog::info("resumable upload {} completed ({} bytes, {})",
                 session.sessionId, bytes.size(), session.mimeType);
    return handle;
  } catch (const MediaError& e) {
    session.state = UploadState::Failed;
    spdlog::warn("resumable upload {} failed: {}", session.sessionId, e.what());
    throw;
  }
}

MediaHandle ResumableUpload::upload(const std::string& appId,
                                    std::string_view bytes,
                                    const std::string& mimeType) {
  UploadSession session = createSession(appId, static_cast<int64_t>(bytes.size()), mimeType);
  return pushData(session, bytes, 0);
}

} // namespace mtc
