#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>

#include "types.hpp"

namespace txtarx {

// RAII read-only memory mapping of an archive file.
// An empty file opens successfully with an empty view and no mapping.
class MappedFile {
public:
  MappedFile() = default;
  ~MappedFile();

  // Delete copy, enable move
  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;
  MappedFile(MappedFile &&other) noexcept;
  MappedFile &operator=(MappedFile &&other) noexcept;

  bool openRead(const std::filesystem::path &path, Error *outError = nullptr);

  std::span<const uint8_t> data() const {
    return std::span<const uint8_t>(static_cast<const uint8_t *>(data_), size_);
  }

  std::string_view text() const {
    return std::string_view(static_cast<const char *>(data_), size_);
  }

  void close();

  bool isOpen() const { return open_; }
  size_t size() const { return size_; }

private:
  void release() noexcept;
  void steal(MappedFile &other) noexcept;

#ifdef _WIN32
  void *fileHandle_ = nullptr;    // HANDLE
  void *mappingHandle_ = nullptr; // HANDLE
#else
  int fd_ = -1;
#endif
  void *data_ = nullptr;
  size_t size_ = 0;
  bool open_ = false;
};

} // namespace txtarx
