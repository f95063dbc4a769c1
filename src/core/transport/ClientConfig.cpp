#include "ClientConfig.hpp"

#include <spdlog/spdlog.h>
#include <cstdlib>
#include <stdexcept>

namespace mtc {

std::string get_env_or(const char* key, const std::string& defval) {
#ifdef _WIN32
  size_t len = 0;
  char* buf = nullptr;
  if (_dupenv_s(&buf, &len, key) == 0 && buf) {
    std::string v(buf);
    free(buf);
    return v;
  }
  return defval;
#else
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
#endif
}

static std::string trim_slashes(std::string s) {
  while (!s.empty() && s.front() == '/') s.erase(s.begin());
  while (!s.empty() && s.back() == '/') s.pop_back();
  return s;
}

std::string ClientConfig::origin() const {
  return scheme + "://" + trim_slashes(host);
}

std::string ClientConfig::versionedUrl(const std::string& path) const {
  return origin() + "/" + trim_slashes(apiVersion) + "/" + trim_slashes(path);
}

ClientConfig config_from_env() {
  ClientConfig c;
  c.scheme           = get_env_or("MTC_SCHEME", c.scheme);
  c.host             = get_env_or("MTC_HOST", c.host);
  c.apiVersion       = get_env_or("MTC_API_VERSION", c.apiVersion);
  c.accessToken      = get_env_or("MTC_ACCESS_TOKEN", "");
  c.messagingProduct = get_env_or("MTC_MESSAGING_PRODUCT", c.messagingProduct);
  c.logLevel         = get_env_or("MTC_LOG_LEVEL", c.logLevel);

  const std::string timeout = get_env_or("MTC_TIMEOUT_SEC", "");
  if (!timeout.empty()) {
    try {
      c.timeoutSec = std::stoi(timeout);
    } catch (const std::exception&) {
      throw std::invalid_argument("MTC_TIMEOUT_SEC is not a number: " + timeout);
    }
    if (c.timeoutSec <= 0) throw std::invalid_argument("MTC_TIMEOUT_SEC must be positive");
  }

  if (c.scheme != "http" && c.scheme != "https")
    throw std::invalid_argument("MTC_SCHEME must be http or https, got: " + c.scheme);

  // from_str maps unknown names to off
  if (spdlog::level::from_str(c.logLevel) == spdlog::level::off && c.logLevel != "off")
    throw std::invalid_argument("MTC_LOG_LEVEL is not a log level: " + c.logLevel);
  return c;
}

} // namespace mtc
