#pragma once

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "filesystem.hpp"
#include "types.hpp"

namespace txtarx {

// In-memory text archive: a comment, the command links found in it, and an
// ordered list of files.
//
// Commands are only reachable through accessors. Every write to them goes
// through parseCommands() or setCommands(), which rebuild the href index.
class Archive {
public:
  Archive() = default;
  explicit Archive(std::string comment) : comment_(std::move(comment)) {}

  // Comment text before the first file marker
  const std::string &comment() const { return comment_; }

  // Replace the comment. Commands are not rescanned until parseCommands().
  void setComment(std::string comment) { comment_ = std::move(comment); }

  // Add a file. Fails with DuplicateFile when a normal file (no snippet or edit
  // reference) of the same name exists; snippet and edit files may repeat names.
  bool addFile(File file, Error *outError = nullptr);

  // Read a file from disk, classify it and add it
  bool addFileFromPath(const std::filesystem::path &path, const std::string &archiveName = {},
                       Error *outError = nullptr);

  const std::vector<File> &files() const { return files_; }
  size_t fileCount() const { return files_.size(); }

  // Normal file lookup by exact name, nullptr if absent
  const File *findFile(std::string_view name) const;

  // Rescan the comment for [command: NAME](#HREF) links
  void parseCommands();

  // Replace the command list
  void setCommands(std::vector<Command> commands);

  const std::vector<Command> &commands() const { return commands_; }

  // Command by href, nullptr if absent
  const Command *findCommand(std::string_view href) const;

  // Snippet references whose command href is not among the commands.
  // An empty result means every reference resolves.
  std::vector<SnippetRefError> validateSnippetRefs() const;

  // Remove all files, the comment and the commands
  void clear();

  bool operator==(const Archive &other) const {
    return comment_ == other.comment_ && commands_ == other.commands_ && files_ == other.files_;
  }

private:
  void rebuildCommandIndex();

  std::string comment_;
  std::vector<Command> commands_;
  std::vector<File> files_;
  std::unordered_map<std::string, size_t> commandIndex_; // href -> index into commands_
};

// The file an edit named `name` applies to: the normal file of that name,
// otherwise the first snippet of that name. Edit files are never targets.
// Returns nullptr when the archive holds no such file.
const File *findEditTarget(std::span<const File> files, std::string_view name);

// Copy of the archive with every edit file applied to its target, in archive
// order. Edit files are dropped from the result. A target missing from the
// archive is read from fileSystem (nullptr selects LocalFileSystem) and added
// to the result as a normal file. A patched snippet keeps its SnippetRef.
// Fails with EditTargetNotFound if a target is in neither place, or with the
// application error of the first edit that does not apply.
std::optional<Archive> applyEditFiles(const Archive &archive, Error *outError = nullptr,
                                      const FileSystem *fileSystem = nullptr);

// outputDir / name, or std::nullopt when name is absolute or normalizes to a
// path outside outputDir
std::optional<std::filesystem::path> resolveExtractPath(const std::filesystem::path &outputDir,
                                                        std::string_view name);

} // namespace txtarx
