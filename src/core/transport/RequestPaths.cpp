#include "RequestPaths.hpp"

#include <stdexcept>

namespace mtc {

const std::string& path_segment(const std::string& value, const char* what) {
  if (value.empty()) throw std::invalid_argument(std::string(what) + " required");
  for (unsigned char c : value) {
    if (c <= 0x20 || c == 0x7f || c == '/' || c == '?' || c == '#' || c == '%' || c == '\\')
      throw std::invalid_argument(std::string(what) + " is not a single path segment: " + value);
  }
  return value;
}

} // namespace mtc
