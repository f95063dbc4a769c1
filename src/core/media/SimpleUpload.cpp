#include "SimpleUpload.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

#include "core/multipart/FormData.hpp"
#include "core/storage/LocalFileSource.hpp"
#include "core/transport/ApiErrors.hpp"
#include "core/transport/RequestPaths.hpp"
#include "core/transport/ResponseDecoding.hpp"

namespace mtc {

SimpleUpload::SimpleUpload(RequestExecutor& executor, std::string messagingProduct)
  : executor_(executor), messagingProduct_(std::move(messagingProduct)) {}

std::string SimpleUpload::upload(const std::string& phoneNumberId,
                                 std::string_view bytes,
                                 const std::string& filename,
                                 const std::string& mimeType) {
  const std::string path = path_segment(phoneNumberId, "phone number id") + "/media";
  if (mimeType.empty()) throw std::invalid_argument("mime type required");
  if (bytes.empty())    throw std::invalid_argument("empty payload");

  const EncodedForm form = encode_form({
    form_field("messaging_product", messagingProduct_),
    form_field("type", mimeType),
    form_file("file", filename.empty() ? "upload.bin" : filename, mimeType, bytes)
  });

  const std::string body = executor_.requestMultipart("POST", path, form.body, form.contentType);

  const auto j = parse_response(body, "media upload response");
  const std::string id = string_field(j, "id", body, "media upload response");
  if (id.empty()) throw ProtocolError("no media id in upload response: " + body, 0, body);

  spdlog::info("uploaded {} ({} bytes, {}) as media {}", filename, bytes.size(), mimeType, id);
  return id;
}

std::string SimpleUpload::uploadFile(const std::string& phoneNumberId,
                                     const LocalFileSource& source,
                                     const std::string& path,
                                     const std::string& mimeType) {
  const FilePayload payload = source.read(path);
  return upload(phoneNumberId, payload.bytes, payload.filename, mimeType);
}

} // namespace mtc
