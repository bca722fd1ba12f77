#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace txtarx {

// Files outside the archive. Edit files may target a path that only exists here.
class FileSystem {
public:
  virtual ~FileSystem() = default;

  virtual bool exists(const std::string &path) const = 0;

  // Returns std::nullopt on failure, with details in outError if provided
  virtual std::optional<std::vector<uint8_t>> readFile(const std::string &path,
                                                       Error *outError) const = 0;
};

// FileSystem backed by std::filesystem. Relative paths resolve against root, or
// against the current working directory when root is empty.
class LocalFileSystem : public FileSystem {
public:
  LocalFileSystem() = default;
  explicit LocalFileSystem(std::filesystem::path root) : root_(std::move(root)) {}

  bool exists(const std::string &path) const override;
  std::optional<std::vector<uint8_t>> readFile(const std::string &path,
                                               Error *outError) const override;

  const std::filesystem::path &root() const { return root_; }

private:
  std::filesystem::path resolve(const std::string &path) const;

  std::filesystem::path root_;
};

// Read a whole file from disk (Io on failure)
std::optional<std::vector<uint8_t>> readFileBytes(const std::filesystem::path &path,
                                                  Error *outError = nullptr);

} // namespace txtarx
