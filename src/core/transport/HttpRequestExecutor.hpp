#pragma once
#include <string>
#include <utility>

#include "ClientConfig.hpp"
#include "RequestExecutor.hpp"

namespace mtc {

// RequestExecutor over cpp-httplib. A fresh client is opened per call, so a
// single executor may be shared by any number of threads.
class HttpRequestExecutor : public RequestExecutor {
public:
  explicit HttpRequestExecutor(ClientConfig config);

  std::string execute(const std::string& path,
                      const std::string& method,
                      const std::optional<std::string>& body = std::nullopt) override;

  std::string requestMultipart(const std::string& method,
                               const std::string& path,
                               const std::string& multipartBody,
                               const std::string& contentType) override;

  RawResponse sendRaw(const RawRequest& req) override;

  std::string accessToken() const override { return config_.accessToken; }

  const ClientConfig& config() const { return config_; }

private:
  std::string apiPath(const std::string& path) const;
  std::string checked(const std::string& method, const std::string& path, RawResponse res) const;

  ClientConfig config_;
};

// Splits "scheme://host[:port]/rest?q" into origin and path ("/rest?q").
// Throws std::invalid_argument when the URL has no scheme.
std::pair<std::string, std::string> split_url(const std::string& url);

} // namespace mtc
