#pragma once
#include <string>

namespace mtc {

// Read-only settings shared by every call. Populated once at startup and
// handed to components by value; nothing reads these from globals.
struct ClientConfig {
  std::string scheme           = "https";
  std::string host             = "graph.facebook.com";   // may carry ":port"
  std::string apiVersion       = "v21.0";
  std::string accessToken;
  std::string messagingProduct = "whatsapp";
  int         timeoutSec       = 30;
  std::string logLevel         = "info";

  // "<scheme>://<host>"
  std::string origin() const;
  // "<scheme>://<host>/<version>/<path>"
  std::string versionedUrl(const std::string& path) const;
};

// MTC_SCHEME, MTC_HOST, MTC_API_VERSION, MTC_ACCESS_TOKEN,
// MTC_MESSAGING_PRODUCT, MTC_TIMEOUT_SEC, MTC_LOG_LEVEL
ClientConfig config_from_env();

std::string get_env_or(const char* key, const std::string& defval);

} // namespace mtc
