#include <algorithm>
#include <format>

#include <txtarx/archive.hpp>
#include <txtarx/detector.hpp>
#include <txtarx/edit.hpp>
#include <txtarx/tags.hpp>
#include <txtarx/text.hpp>

namespace txtarx {

const char *errorCodeName(ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "none";
  case ErrorCode::Io:
    return "io";
  case ErrorCode::EmptyName:
    return "empty name";
  case ErrorCode::DuplicateFile:
    return "duplicate file";
  case ErrorCode::InvalidTag:
    return "invalid tag";
  case ErrorCode::MissingClosingBracket:
    return "missing closing bracket";
  case ErrorCode::InvalidLineNumber:
    return "invalid line number";
  case ErrorCode::InvalidBase64:
    return "invalid base64";
  case ErrorCode::InvalidUtf8:
    return "invalid utf-8";
  case ErrorCode::EditTargetNotFound:
    return "edit target not found";
  case ErrorCode::UnterminatedBlock:
    return "unterminated block";
  case ErrorCode::EmptyBlock:
    return "empty block";
  case ErrorCode::ExpectedSearchStart:
    return "expected search start";
  case ErrorCode::MalformedLine:
    return "malformed line";
  case ErrorCode::SearchNotFound:
    return "search not found";
  case ErrorCode::MultipleMatches:
    return "multiple matches";
  case ErrorCode::EmptyContent:
    return "empty content";
  }
  return "unknown";
}

const char *binaryReasonName(BinaryReason reason) {
  switch (reason) {
  case BinaryReason::ContentConflict:
    return "content conflict";
  case BinaryReason::InvalidUtf8:
    return "invalid utf-8";
  case BinaryReason::Explicit:
    return "explicit";
  }
  return "unknown";
}

const char *editOperationName(EditOperation op) {
  switch (op) {
  case EditOperation::Replace:
    return "replace";
  case EditOperation::Delete:
    return "delete";
  case EditOperation::Insert:
    return "insert";
  }
  return "unknown";
}

// File

File File::create(std::string name, std::span<const uint8_t> data, const EncodingConfig &config) {
  EncodingDetection detection = detectEncoding(name, data, config);

  File file;
  file.name = std::move(name);
  file.data.assign(data.begin(), data.end());
  file.isBinary = detection.isBinary;
  file.binaryReason = detection.reason;
  return file;
}

File File::create(std::string name, std::string_view content, const EncodingConfig &config) {
  return create(std::move(name), text::asBytes(content), config);
}

File File::withEncoding(std::string name, std::vector<uint8_t> data, bool isBinary) {
  File file;
  file.name = std::move(name);
  file.data = std::move(data);
  file.isBinary = isBinary;
  if (isBinary) {
    file.binaryReason = BinaryReason::Explicit;
  }
  return file;
}

std::optional<File> File::fromPath(const std::filesystem::path &path,
                                   const std::string &archiveName, Error *outError,
                                   const EncodingConfig &config) {
  auto data = readFileBytes(path, outError);
  if (!data) {
    return std::nullopt;
  }

  std::string name = archiveName.empty() ? path.filename().string() : archiveName;
  if (name.empty()) {
    setError(outError, ErrorCode::EmptyName,
             std::format("Cannot derive an archive name from: {}", path.string()));
    return std::nullopt;
  }

  return create(std::move(name), *data, config);
}

std::string File::archiveName() const {
  if (isBinary) {
    return name + std::string(kBase64Tag);
  }
  return name;
}

std::pair<std::string, bool> File::parseArchiveName(std::string_view archiveName) {
  if (archiveName.ends_with(kBase64Tag)) {
    archiveName.remove_suffix(kBase64Tag.size());
    return {std::string(archiveName), true};
  }
  return {std::string(archiveName), false};
}

// Archive

bool Archive::addFile(File file, Error *outError) {
  if (file.name.empty()) {
    setError(outError, ErrorCode::EmptyName, "File name must not be empty");
    return false;
  }

  if (file.isNormal() && findFile(file.name)) {
    setError(outError, ErrorCode::DuplicateFile,
             std::format("Duplicate file: {}", file.name));
    return false;
  }

  files_.push_back(std::move(file));
  return true;
}

bool Archive::addFileFromPath(const std::filesystem::path &path, const std::string &archiveName,
                              Error *outError) {
  auto file = File::fromPath(path, archiveName, outError);
  if (!file) {
    return false;
  }
  return addFile(std::move(*file), outError);
}

const File *Archive::findFile(std::string_view name) const {
  for (const auto &file : files_) {
    if (file.isNormal() && file.name == name) {
      return &file;
    }
  }
  return nullptr;
}

void Archive::parseCommands() {
  commands_ = extractCommands(comment_);
  rebuildCommandIndex();
}

void Archive::setCommands(std::vector<Command> commands) {
  commands_ = std::move(commands);
  rebuildCommandIndex();
}

const Command *Archive::findCommand(std::string_view href) const {
  auto it = commandIndex_.find(std::string(href));
  if (it == commandIndex_.end()) {
    return nullptr;
  }
  return &commands_[it->second];
}

std::vector<SnippetRefError> Archive::validateSnippetRefs() const {
  std::vector<SnippetRefError> errors;

  for (const auto &file : files_) {
    if (!file.snippetRef || !file.snippetRef->commandHref) {
      continue;
    }
    const std::string &href = *file.snippetRef->commandHref;
    if (!commandIndex_.contains(href)) {
      errors.push_back({file.name, href});
    }
  }

  return errors;
}

void Archive::clear() {
  comment_.clear();
  files_.clear();
  setCommands({});
}

void Archive::rebuildCommandIndex() {
  commandIndex_.clear();
  commandIndex_.reserve(commands_.size());
  for (size_t i = 0; i < commands_.size(); ++i) {
    // Later duplicates win, matching a rescan of the comment
    commandIndex_[commands_[i].href] = i;
  }
}

const File *findEditTarget(std::span<const File> files, std::string_view name) {
  const File *snippet = nullptr;
  for (const auto &f : files) {
    if (f.editRef || f.name != name) {
      continue;
    }
    if (f.isNormal()) {
      return &f;
    }
    if (!snippet) {
      snippet = &f;
    }
  }
  return snippet;
}

std::optional<Archive> applyEditFiles(const Archive &archive, Error *outError,
                                      const FileSystem *fileSystem) {
  static const LocalFileSystem local;
  const FileSystem &fs = fileSystem ? *fileSystem : local;

  Archive result(archive.comment());
  result.setCommands(archive.commands());

  std::vector<File> files;
  files.reserve(archive.fileCount());
  for (const auto &file : archive.files()) {
    if (!file.editRef) {
      files.push_back(file);
    }
  }

  for (const auto &edit : archive.files()) {
    if (!edit.editRef) {
      continue;
    }

    const File *found = findEditTarget(files, edit.name);
    if (!found) {
      if (!fs.exists(edit.name)) {
        setError(outError, ErrorCode::EditTargetNotFound,
                 std::format("Edit target file '{}' not found in archive or filesystem",
                             edit.name));
        return std::nullopt;
      }

      Error readError;
      auto data = fs.readFile(edit.name, &readError);
      if (!data) {
        setError(outError, readError.code,
                 std::format("Failed to read edit target '{}': {}", edit.name,
                             readError.message));
        return std::nullopt;
      }
      files.push_back(File::create(edit.name, *data));
      found = &files.back();
    }
    File &target = files[static_cast<size_t>(found - files.data())];

    if (!text::isValidUtf8(target.data)) {
      setError(outError, ErrorCode::InvalidUtf8,
               std::format("Edit target file '{}' is not valid UTF-8", target.name));
      return std::nullopt;
    }

    Error applyError;
    auto applied = edit.editRef->apply(target.text(), &applyError);
    if (!applied) {
      setError(outError, applyError.code,
               std::format("Failed to apply edits to '{}': {}", edit.name, applyError.message));
      return std::nullopt;
    }

    File patched = File::create(target.name, *applied);
    patched.snippetRef = std::move(target.snippetRef);
    target = std::move(patched);
  }

  for (auto &file : files) {
    if (!result.addFile(std::move(file), outError)) {
      return std::nullopt;
    }
  }

  return result;
}

std::optional<std::filesystem::path> resolveExtractPath(const std::filesystem::path &outputDir,
                                                        std::string_view name) {
  std::filesystem::path relative(name);
  if (relative.empty() || relative.has_root_path()) {
    return std::nullopt;
  }

  std::filesystem::path base = outputDir.lexically_normal();
  std::filesystem::path target = (base / relative).lexically_normal();
  std::filesystem::path inside = target.lexically_relative(base);
  if (inside.empty() || inside == "." || *inside.begin() == "..") {
    return std::nullopt;
  }
  return target;
}

} // namespace txtarx
