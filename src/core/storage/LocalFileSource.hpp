#pragma once
#include <string>
#include <string_view>
#include <utility>

namespace mtc {

struct FilePayload {
  std::string bytes;
  std::string filename;   // basename only
};

// Reads upload payloads from, and writes fetched documents to, local disk.
// Relative paths resolve against root (empty root = current directory).
class LocalFileSource {
public:
  explicit LocalFileSource(std::string root = {})
    : root_(std::move(root)) {}

  // Throws std::runtime_error when the file is missing or unreadable.
  FilePayload read(const std::string& path) const;

  // Writes bytes to path, creating parent directories; returns full path.
  std::string write(const std::string& path, std::string_view bytes) const;

private:
  std::string resolve(const std::string& path) const;

  std::string root_;
};

} // namespace mtc
