#include "LocalFileSource.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace mtc {

std::string LocalFileSource::resolve(const std::string& path) const {
  namespace fs = std::filesystem;
  fs::path p(path);
  if (p.is_relative() && !root_.empty()) p = fs::path(root_) / p;
  return p.string();
}

FilePayload LocalFileSource::read(const std::string& path) const {
  namespace fs = std::filesystem;
  const fs::path file = resolve(path);
  if (!fs::is_regular_file(file)) throw std::runtime_error("not a regular file: " + file.string());

  std::ifstream in(file, std::ios::binary);
  if (!in) throw std::runtime_error("cannot open file: " + file.string());
  FilePayload out;
  out.bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  if (in.bad()) throw std::runtime_error("read failed: " + file.string());
  out.filename = file.filename().string();
  return out;
}

std::string LocalFileSource::write(const std::string& path, std::string_view bytes) const {
  namespace fs = std::filesystem;
  const fs::path file = resolve(path);
  if (file.has_parent_path()) fs::create_directories(file.parent_path());
  std::ofstream os(file, std::ios::binary | std::ios::trunc);
  if (!os) throw std::runtime_error("cannot open for writing: " + file.string());
  os.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  os.flush();
  if (!os) throw std::runtime_error("write failed: " + file.string());
  return fs::weakly_canonical(file).string();
}

} // namespace mtc
