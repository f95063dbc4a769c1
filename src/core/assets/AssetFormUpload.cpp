#include "AssetFormUpload.hpp"

#include <spdlog/spdlog.h>
#include <cstdint>
#include <limits>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <utility>

#include "core/multipart/FormData.hpp"
#include "core/transport/ApiErrors.hpp"
#include "core/transport/RequestPaths.hpp"
#include "core/transport/ResponseDecoding.hpp"

using nlohmann::json;

static std::optional<int> int_field(const json& j, const char* key, const std::string& body) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return std::nullopt;
  if (!it->is_number_integer())
    throw mtc::DecodeError(std::string("failed to parse asset response: ") + key + " is not an integer", 0, body);
  const bool fits = it->is_number_unsigned()
    ? it->get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
    : it->get<int64_t>() >= std::numeric_limits<int>::min() &&
      it->get<int64_t>() <= std::numeric_limits<int>::max();
  if (!fits)
    throw mtc::DecodeError(std::string("failed to parse asset response: ") + key + " is out of range", 0, body);
  return static_cast<int>(it->get<int64_t>());
}

namespace mtc {

AssetUploadResult decode_asset_result(const std::string& body) {
  const auto j = parse_response(body, "asset response");

  AssetUploadResult out;
  if (auto it = j.find("success"); it != j.end() && !it->is_null()) {
    if (!it->is_boolean()) throw DecodeError("failed to parse asset response: success is not a boolean", 0, body);
    out.success = it->get<bool>();
  }

  auto errs = j.find("validation_errors");
  if (errs == j.end() || errs->is_null()) return out;
  if (!errs->is_array()) throw DecodeError("failed to parse asset response: validation_errors is not an array", 0, body);

  for (const auto& e : *errs) {
    if (!e.is_object()) throw DecodeError("failed to parse asset response: validation error is not an object", 0, body);
    ValidationError v;
    v.error       = string_field(e, "error", body, "asset response");
    v.errorType   = string_field(e, "error_type", body, "asset response");
    v.message     = string_field(e, "message", body, "asset response");
    v.lineStart   = int_field(e, "line_start", body);
    v.lineEnd     = int_field(e, "line_end", body);
    v.columnStart = int_field(e, "column_start", body);
    v.columnEnd   = int_field(e, "column_end", body);
    out.validationErrors.push_back(std::move(v));
  }
  return out;
}

AssetFormUpload::AssetFormUpload(RequestExecutor& executor, AssetKind kind)
  : executor_(executor), kind_(std::move(kind)) {}

AssetUploadResult AssetFormUpload::pushAsset(const std::string& resourceId, std::string_view document) {
  const std::string path = path_segment(resourceId, "resource id") + "/assets";
  const EncodedForm form = encode_form({
    form_field("name", kind_.name),
    form_field("asset_type", kind_.assetType),
    form_file("file", kind_.name, "application/octet-stream", document)
  });

  const std::string body = executor_.requestMultipart("POST", path, form.body, form.contentType);
  AssetUploadResult result = decode_asset_result(body);

  if (result.success) {
    spdlog::info("uploaded {} to {} ({} bytes)", kind_.name, resourceId, document.size());
  } else {
    spdlog::warn("{} for {} rejected with {} validation error(s)",
                 kind_.name, resourceId, result.validationErrors.size());
    for (const auto& v : result.validationErrors) {
      spdlog::warn("  {}: {} (line {})", v.error, v.message, v.lineStart.value_or(0));
    }
  }
  return result;
}

std::string AssetFormUpload::fetchAsset(const std::string& resourceId) {
  return executor_.execute(path_segment(resourceId, "resource id") + "/assets", "GET");
}

} // namespace mtc
