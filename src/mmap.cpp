#include <format>

#include <txtarx/mmap.hpp>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace txtarx {

MappedFile::~MappedFile() {
  release();
}

MappedFile::MappedFile(MappedFile &&other) noexcept {
  steal(other);
}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    release();
    steal(other);
  }
  return *this;
}

void MappedFile::steal(MappedFile &other) noexcept {
#ifdef _WIN32
  fileHandle_ = other.fileHandle_;
  mappingHandle_ = other.mappingHandle_;
  other.fileHandle_ = nullptr;
  other.mappingHandle_ = nullptr;
#else
  fd_ = other.fd_;
  other.fd_ = -1;
#endif
  data_ = other.data_;
  size_ = other.size_;
  open_ = other.open_;
  other.data_ = nullptr;
  other.size_ = 0;
  other.open_ = false;
}

bool MappedFile::openRead(const std::filesystem::path &path, Error *outError) {
  close();

#ifdef _WIN32
  fileHandle_ = CreateFileW(path.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr, OPEN_EXISTING,
                            FILE_ATTRIBUTE_NORMAL, nullptr);
  if (fileHandle_ == INVALID_HANDLE_VALUE) {
    fileHandle_ = nullptr;
    setError(outError, ErrorCode::Io,
             std::format("Failed to open archive for reading: {}", path.string()));
    return false;
  }

  LARGE_INTEGER fileSize;
  if (!GetFileSizeEx(static_cast<HANDLE>(fileHandle_), &fileSize)) {
    setError(outError, ErrorCode::Io,
             std::format("Failed to get archive size: {} (error: {})", path.string(),
                         GetLastError()));
    close();
    return false;
  }

  size_ = static_cast<size_t>(fileSize.QuadPart);
  if (size_ > 0) {
    mappingHandle_ = CreateFileMappingW(static_cast<HANDLE>(fileHandle_), nullptr, PAGE_READONLY,
                                        0, 0, nullptr);
    if (!mappingHandle_) {
      setError(outError, ErrorCode::Io,
               std::format("Failed to create file mapping: {}", path.string()));
      close();
      return false;
    }

    data_ = MapViewOfFile(static_cast<HANDLE>(mappingHandle_), FILE_MAP_READ, 0, 0, 0);
    if (!data_) {
      setError(outError, ErrorCode::Io,
               std::format("Failed to map view of archive: {}", path.string()));
      close();
      return false;
    }
  }
#else
  fd_ = ::open(path.string().c_str(), O_RDONLY);
  if (fd_ < 0) {
    setError(outError, ErrorCode::Io,
             std::format("Failed to open archive for reading: {} ({})", path.string(),
                         std::strerror(errno)));
    return false;
  }

  struct stat st;
  if (fstat(fd_, &st) < 0) {
    setError(outError, ErrorCode::Io,
             std::format("Failed to get archive size: {} ({})", path.string(),
                         std::strerror(errno)));
    close();
    return false;
  }

  if (!S_ISREG(st.st_mode)) {
    setError(outError, ErrorCode::Io, std::format("Not a regular file: {}", path.string()));
    close();
    return false;
  }

  // mmap rejects zero-length mappings, an empty archive is simply an empty view
  size_ = static_cast<size_t>(st.st_size);
  if (size_ > 0) {
    data_ = mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
    if (data_ == MAP_FAILED) {
      data_ = nullptr;
      setError(outError, ErrorCode::Io,
               std::format("Failed to map archive: {} ({})", path.string(),
                           std::strerror(errno)));
      close();
      return false;
    }
  }
#endif

  open_ = true;
  return true;
}

void MappedFile::close() {
  release();
}

void MappedFile::release() noexcept {
  if (data_) {
#ifdef _WIN32
    UnmapViewOfFile(data_);
#else
    munmap(data_, size_);
#endif
    data_ = nullptr;
  }

#ifdef _WIN32
  if (mappingHandle_) {
    CloseHandle(static_cast<HANDLE>(mappingHandle_));
    mappingHandle_ = nullptr;
  }
  if (fileHandle_) {
    CloseHandle(static_cast<HANDLE>(fileHandle_));
    fileHandle_ = nullptr;
  }
#else
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
#endif

  size_ = 0;
  open_ = false;
}

} // namespace txtarx
