#include "ResponseDecoding.hpp"
#include "ApiErrors.hpp"

using nlohmann::json;

namespace mtc {

json parse_response(const std::string& body, const std::string& context) {
  json j;
  try {
    j = json::parse(body);
  } catch (const json::parse_error& e) {
    throw DecodeError("failed to parse " + context + ": " + e.what(), 0, body);
  }
  if (!j.is_object())
    throw DecodeError("failed to parse " + context + ": expected a JSON object", 0, body);
  return j;
}

std::string string_field(const json& j, const char* key,
                         const std::string& body, const std::string& context) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return {};
  if (!it->is_string())
    throw DecodeError("failed to parse " + context + ": field '" + key + "' is not a string", 0, body);
  return it->get<std::string>();
}

} // namespace mtc
