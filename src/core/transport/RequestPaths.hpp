#pragma once
#include <string>

namespace mtc {

// Returns value unchanged when it is usable as one path segment. Throws
// std::invalid_argument naming `what` when it is empty or contains '/', '?',
// '#', '%', '\\', whitespace or control characters.
const std::string& path_segment(const std::string& value, const char* what);

} // namespace mtc
