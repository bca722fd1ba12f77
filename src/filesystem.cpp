#include <format>
#include <fstream>

#include <txtarx/filesystem.hpp>

namespace txtarx {

std::optional<std::vector<uint8_t>> readFileBytes(const std::filesystem::path &path,
                                                  Error *outError) {
  std::ifstream in(path, std::ios::binary | std::ios::ate);
  if (!in) {
    setError(outError, ErrorCode::Io, std::format("Failed to open source file: {}", path.string()));
    return std::nullopt;
  }

  std::streamsize size = in.tellg();
  if (size < 0) {
    setError(outError, ErrorCode::Io, std::format("Failed to get file size: {}", path.string()));
    return std::nullopt;
  }
  in.seekg(0, std::ios::beg);

  std::vector<uint8_t> data(static_cast<size_t>(size));
  if (size > 0 && !in.read(reinterpret_cast<char *>(data.data()), size)) {
    setError(outError, ErrorCode::Io, std::format("Failed to read source file: {}", path.string()));
    return std::nullopt;
  }

  return data;
}

std::filesystem::path LocalFileSystem::resolve(const std::string &path) const {
  std::filesystem::path p(path);
  if (root_.empty() || p.is_absolute()) {
    return p;
  }
  return root_ / p;
}

bool LocalFileSystem::exists(const std::string &path) const {
  std::error_code ec;
  return std::filesystem::exists(resolve(path), ec);
}

std::optional<std::vector<uint8_t>> LocalFileSystem::readFile(const std::string &path,
                                                              Error *outError) const {
  return readFileBytes(resolve(path), outError);
}

} // namespace txtarx
