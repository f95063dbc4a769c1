#include "HttpRequestExecutor.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

#include "ApiErrors.hpp"

// -------- helpers --------

static mtc::RawResponse send_request(const std::string& origin,
                                     int timeoutSec,
                                     const std::string& method,
                                     const std::string& path,
                                     const httplib::Headers& headers,
                                     const std::string& body,
                                     const std::string& contentType) {
  httplib::Client cli(origin);
  cli.set_connection_timeout(timeoutSec, 0);
  cli.set_read_timeout(timeoutSec, 0);
  cli.set_write_timeout(timeoutSec, 0);

  spdlog::debug("{} {}{} ({} bytes)", method, origin, path, body.size());

  auto call = [&]() -> httplib::Result {
    if (method == "GET")    return cli.Get(path, headers);
    if (method == "POST")   return cli.Post(path, headers, body, contentType);
    if (method == "PUT")    return cli.Put(path, headers, body, contentType);
    if (method == "DELETE") {
      if (body.empty()) return cli.Delete(path, headers);
      return cli.Delete(path, headers, body, contentType);
    }
    throw std::invalid_argument("unsupported HTTP method: " + method);
  };

  httplib::Result res = call();
  if (!res) {
    throw mtc::TransportError(method + " " + origin + path + " failed: " +
                              httplib::to_string(res.error()));
  }
  return mtc::RawResponse{res->status, res->body};
}

namespace mtc {

std::pair<std::string, std::string> split_url(const std::string& url) {
  const auto schemeEnd = url.find("://");
  if (schemeEnd == std::string::npos || schemeEnd == 0)
    throw std::invalid_argument("not an absolute URL: " + url);
  const auto pathStart = url.find('/', schemeEnd + 3);
  if (pathStart == std::string::npos) return {url, "/"};
  return {url.substr(0, pathStart), url.substr(pathStart)};
}

HttpRequestExecutor::HttpRequestExecutor(ClientConfig config)
  : config_(std::move(config)) {}

std::string HttpRequestExecutor::apiPath(const std::string& path) const {
  return split_url(config_.versionedUrl(path)).second;
}

std::string HttpRequestExecutor::checked(const std::string& method,
                                         const std::string& path,
                                         RawResponse res) const {
  if (!res.ok()) {
    throw TransportError(method + " " + path + " returned HTTP " + std::to_string(res.status) +
                         ": " + res.body,
                         res.status, res.body);
  }
  return std::move(res.body);
}

std::string HttpRequestExecutor::execute(const std::string& path,
                                         const std::string& method,
                                         const std::optional<std::string>& body) {
  httplib::Headers headers{
    {"Authorization", "Bearer " + config_.accessToken},
    {"Accept", "application/json"}
  };
  const std::string full = apiPath(path);
  auto res = send_request(config_.origin(), config_.timeoutSec, method, full, headers,
                          body.value_or(std::string()), "application/json");
  return checked(method, full, std::move(res));
}

std::string HttpRequestExecutor::requestMultipart(const std::string& method,
                                                  const std::string& path,
                                                  const std::string& multipartBody,
                                                  const std::string& contentType) {
  httplib::Headers headers{
    {"Authorization", "Bearer " + config_.accessToken},
    {"Accept", "application/json"}
  };
  const std::string full = apiPath(path);
  auto res = send_request(config_.origin(), config_.timeoutSec, method, full, headers,
                          multipartBody, contentType);
  return checked(method, full, std::move(res));
}

RawResponse HttpRequestExecutor::sendRaw(const RawRequest& req) {
  const auto [origin, path] = split_url(req.url);
  httplib::Headers headers;
  for (const auto& [k, v] : req.headers) headers.emplace(k, v);
  return send_request(origin, config_.timeoutSec, req.method, path, headers,
                      req.body, req.contentType);
}

} // namespace mtc
