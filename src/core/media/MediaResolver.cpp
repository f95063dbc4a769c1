#include "MediaResolver.hpp"

#include <spdlog/spdlog.h>
#include <cstdint>
#include <limits>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <utility>

#include "core/transport/ApiErrors.hpp"
#include "core/transport/RequestPaths.hpp"
#include "core/transport/ResponseDecoding.hpp"

using nlohmann::json;

// -------- helpers --------

static const char* kMetadataFields = "url,mime_type,sha256,file_size,id,messaging_product";

// Non-negative int64 from a JSON integer or an all-digit string.
static int64_t size_field(const json& j, const std::string& body) {
  auto it = j.find("file_size");
  if (it == j.end() || it->is_null()) return 0;

  if (it->is_number_unsigned()) {
    if (it->get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
      return it->get<int64_t>();
  } else if (it->is_number_integer()) {
    if (it->get<int64_t>() >= 0) return it->get<int64_t>();
  } else if (it->is_string()) {
    const std::string s = it->get<std::string>();
    const bool digits = !s.empty() && s.find_first_not_of("0123456789") == std::string::npos;
    if (digits) {
      try {
        size_t pos = 0;
        const int64_t v = std::stoll(s, &pos);
        if (pos == s.size()) return v;
      } catch (const std::out_of_range&) {
        // reported below
      }
    }
  }
  throw mtc::DecodeError("failed to parse media metadata: bad file_size", 0, body);
}

static std::pair<mtc::MediaObject, std::string> fetch_metadata(mtc::RequestExecutor& executor,
                                                               const std::string& mediaId) {
  std::string body =
    executor.execute(mtc::path_segment(mediaId, "media id") + "?fields=" + kMetadataFields, "GET");
  const auto j = mtc::parse_response(body, "media metadata");

  mtc::MediaObject m;
  m.id               = mtc::string_field(j, "id", body, "media metadata");
  m.url              = mtc::string_field(j, "url", body, "media metadata");
  m.mimeType         = mtc::string_field(j, "mime_type", body, "media metadata");
  m.contentHash      = mtc::string_field(j, "sha256", body, "media metadata");
  m.messagingProduct = mtc::string_field(j, "messaging_product", body, "media metadata");
  m.byteSize         = size_field(j, body);
  if (m.id.empty()) m.id = mediaId;
  return {std::move(m), std::move(body)};
}

namespace mtc {

MediaObject MediaResolver::metadata(const std::string& mediaId) {
  return fetch_metadata(executor_, mediaId).first;
}

std::string MediaResolver::resolve(const std::string& mediaId) {
  auto [m, body] = fetch_metadata(executor_, mediaId);
  if (m.url.empty()) throw ProtocolError("no media url found in response: " + body, 0, body);
  return m.url;
}

void MediaResolver::remove(const std::string& mediaId) {
  const std::string path = "media/" + path_segment(mediaId, "media id");

  std::string body;
  try {
    body = executor_.execute(path, "DELETE");
  } catch (const TransportError& e) {
    if (e.status() != 404) throw;
    throw RejectedResult("media " + mediaId + " not found", e.status(), e.body());
  }

  const auto j = parse_response(body, "delete response");
  auto it = j.find("success");
  if (it == j.end()) throw ProtocolError("no success flag in delete response: " + body, 0, body);
  if (!it->is_boolean()) throw DecodeError("failed to parse delete response: success is not a boolean", 0, body);
  if (!it->get<bool>()) {
    spdlog::warn("deletion of media {} rejected: {}", mediaId, body);
    throw RejectedResult("media deletion failed or returned success=false: " + body, 0, body);
  }
  spdlog::info("deleted media {}", mediaId);
}

} // namespace mtc
