#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace mtc {

// Parses a response body as a JSON object; throws DecodeError naming `context`.
nlohmann::json parse_response(const std::string& body, const std::string& context);

// Returns j[key] when it is a non-empty string, "" otherwise.
// Throws DecodeError when the key is present with a non-string type.
std::string string_field(const nlohmann::json& j, const char* key,
                         const std::string& body, const std::string& context);

} // namespace mtc
