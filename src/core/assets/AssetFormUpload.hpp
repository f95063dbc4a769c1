#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/transport/RequestExecutor.hpp"

namespace mtc {

struct ValidationError {
  std::string error;
  std::string errorType;
  std::string message;
  std::optional<int> lineStart;
  std::optional<int> lineEnd;
  std::optional<int> columnStart;
  std::optional<int> columnEnd;
};

// The transport may succeed while the asset is rejected: check success.
struct AssetUploadResult {
  bool success = false;
  std::vector<ValidationError> validationErrors;
};

struct AssetKind {
  std::string name      = "flow.json";
  std::string assetType = "FLOW_JSON";
};

// Multipart upload/fetch of a structured asset at "<resource-id>/assets".
class AssetFormUpload {
public:
  explicit AssetFormUpload(RequestExecutor& executor, AssetKind kind = {});

  AssetUploadResult pushAsset(const std::string& resourceId, std::string_view document);

  // Raw document text, unparsed.
  std::string fetchAsset(const std::string& resourceId);

private:
  RequestExecutor& executor_;
  AssetKind kind_;
};

AssetUploadResult decode_asset_result(const std::string& body);

} // namespace mtc
