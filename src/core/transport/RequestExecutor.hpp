#pragma once
#include <map>
#include <optional>
#include <string>

namespace mtc {

// A request that skips the default builder: absolute URL, caller-chosen
// headers only, raw body.
struct RawRequest {
  std::string method = "POST";
  std::string url;                             // absolute, scheme://host/path
  std::map<std::string, std::string> headers;
  std::string body;
  std::string contentType = "application/octet-stream";
};

struct RawResponse {
  int status = 0;
  std::string body;

  bool ok() const { return status >= 200 && status < 300; }
};

// Executes calls against the remote API. Implementations own base URL,
// version prefix, default headers and the access credential.
class RequestExecutor {
public:
  virtual ~RequestExecutor() = default;

  // path is relative to the versioned API root ("<id>/media").
  // Throws TransportError on network failure or non-2xx status.
  virtual std::string execute(const std::string& path,
                              const std::string& method,
                              const std::optional<std::string>& body = std::nullopt) = 0;

  // Same contract as execute() with a pre-encoded multipart body.
  virtual std::string requestMultipart(const std::string& method,
                                       const std::string& path,
                                       const std::string& multipartBody,
                                       const std::string& contentType) = 0;

  // Escape hatch for calls needing non-default headers and a raw body.
  // Non-2xx is returned in RawResponse, not thrown; only network failure throws.
  virtual RawResponse sendRaw(const RawRequest& req) = 0;

  virtual std::string accessToken() const = 0;
};

} // namespace mtc
