#include <algorithm>
#include <format>
#include <iostream>

#include <txtarx/base64.hpp>
#include <txtarx/decoder.hpp>
#include <txtarx/edit.hpp>
#include <txtarx/mmap.hpp>
#include <txtarx/text.hpp>

namespace txtarx {

namespace {

bool hasNormalFile(const std::vector<File> &files, const std::string &name) {
  return std::any_of(files.begin(), files.end(),
                     [&](const File &f) { return f.isNormal() && f.name == name; });
}

bool looksLikeMarker(std::string_view name) {
  return name.find(kMarkerPrefix) != std::string_view::npos &&
         name.find(kMarkerSuffix) != std::string_view::npos;
}

} // namespace

const FileSystem &Decoder::fileSystem() const {
  static const LocalFileSystem local;
  return fileSystem_ ? *fileSystem_ : local;
}

void Decoder::warn(std::string message) {
  if (options_.verbose > 0) {
    std::cerr << "Warning: " << message << "\n";
  }
  warnings_.push_back(std::move(message));
}

std::optional<Archive> Decoder::decode(std::string_view input, Error *outError) {
  warnings_.clear();

  Session session;
  // Text file bodies keep their '\r' bytes, marker and comment lines drop them
  auto lines = text::splitRawLines(input);

  for (size_t i = 0; i < lines.size(); ++i) {
    const size_t lineNumber = i + 1;
    bool ok = session.state == State::OutsideFile
                  ? onOutsideFile(session, lines[i], lineNumber, outError)
                  : onInsideFile(session, lines[i], lineNumber, outError);
    if (!ok) {
      return std::nullopt;
    }
  }

  if (session.state == State::InsideFile && !finishFile(session, outError)) {
    return std::nullopt;
  }

  // Comment: leading blank lines were never collected, trailing ones are dropped
  auto &comment = session.commentLines;
  while (!comment.empty() && text::isBlank(comment.back())) {
    comment.pop_back();
  }

  std::string commentText;
  for (size_t i = 0; i < comment.size(); ++i) {
    if (i > 0) {
      commentText += '\n';
    }
    commentText += comment[i];
  }

  if (!resolveEdits(session.files, outError)) {
    return std::nullopt;
  }

  Archive archive(std::move(commentText));
  archive.parseCommands();

  for (auto &file : session.files) {
    if (!archive.addFile(std::move(file), outError)) {
      return std::nullopt;
    }
  }

  return archive;
}

std::optional<Archive> Decoder::decodeFile(const std::filesystem::path &path, Error *outError) {
  MappedFile mapped;
  if (!mapped.openRead(path, outError)) {
    return std::nullopt;
  }
  return decode(mapped.text(), outError);
}

bool Decoder::onOutsideFile(Session &session, std::string_view line, size_t lineNumber,
                            Error *outError) {
  if (auto nameAndTags = markerContent(line)) {
    return beginFile(session, *nameAndTags, lineNumber, outError);
  }

  if (!text::isValidUtf8(text::asBytes(line))) {
    setError(outError, ErrorCode::InvalidUtf8,
             std::format("Invalid UTF-8 in archive comment at line {}", lineNumber));
    return false;
  }

  if (session.commentLines.empty() && text::isBlank(line)) {
    return true;
  }
  if (line.ends_with('\r')) {
    line.remove_suffix(1);
  }
  session.commentLines.push_back(line);
  return true;
}

bool Decoder::onInsideFile(Session &session, std::string_view line, size_t lineNumber,
                           Error *outError) {
  if (auto nameAndTags = markerContent(line)) {
    if (!finishFile(session, outError)) {
      return false;
    }
    return beginFile(session, *nameAndTags, lineNumber, outError);
  }

  PendingFile &current = session.current;
  if (current.marker.isBinary) {
    // Only base64 lines, blank lines carry nothing
    current.body += text::trim(line);
    return true;
  }

  if (!text::isValidUtf8(text::asBytes(line))) {
    setError(outError, ErrorCode::InvalidUtf8,
             std::format("Invalid UTF-8 in file '{}' at line {}", current.marker.name,
                         lineNumber));
    return false;
  }

  current.body += line;
  current.body += '\n';
  return true;
}

bool Decoder::beginFile(Session &session, std::string_view nameAndTags, size_t lineNumber,
                        Error *outError) {
  MarkerInfo marker;
  try {
    marker = parseNameAndTags(nameAndTags, options_.strictTags);
  } catch (const ParseError &e) {
    setError(outError, e.code(), std::format("Line {}: {}", lineNumber, e.what()));
    return false;
  }

  if (marker.name.empty()) {
    setError(outError, ErrorCode::EmptyName,
             std::format("Line {}: file marker has an empty name", lineNumber));
    return false;
  }

  for (const auto &tag : marker.unknownTags) {
    warn(std::format("Ignoring unrecognized tag '{}' on file '{}' (line {})", tag, marker.name,
                     lineNumber));
  }

  if (!marker.isBinary && looksLikeMarker(marker.name)) {
    warn(std::format("Filename '{}' contains txtar marker pattern, but is not marked as binary",
                     marker.name));
  }

  session.current = PendingFile{std::move(marker), lineNumber, {}};
  session.state = State::InsideFile;
  return true;
}

bool Decoder::finishFile(Session &session, Error *outError) {
  PendingFile &current = session.current;
  MarkerInfo &marker = current.marker;

  File file;
  file.name = std::move(marker.name);
  file.snippetRef = std::move(marker.snippetRef);
  file.editRef = std::move(marker.editRef);

  if (marker.isBinary) {
    auto decoded = base64::decode(current.body);
    if (!decoded) {
      setError(outError, ErrorCode::InvalidBase64,
               std::format("Failed to decode base64 for file '{}' (line {})", file.name,
                           current.line));
      return false;
    }
    file.data = std::move(*decoded);
    file.isBinary = true;
    file.binaryReason = BinaryReason::Explicit;
  } else {
    std::string &body = current.body;
    if (!body.empty() && body.back() == '\n') {
      body.pop_back();
    }
    file.data.assign(body.begin(), body.end());
  }

  if (file.isNormal() && hasNormalFile(session.files, file.name)) {
    setError(outError, ErrorCode::DuplicateFile,
             std::format("Duplicate file: {} (line {})", file.name, current.line));
    return false;
  }

  session.files.push_back(std::move(file));
  session.current = PendingFile{};
  session.state = State::OutsideFile;
  return true;
}

bool Decoder::resolveEdits(std::vector<File> &files, Error *outError) const {
  // All targets are checked before any body is parsed
  for (const auto &file : files) {
    if (!file.editRef) {
      continue;
    }

    bool inArchive = findEditTarget(files, file.name) != nullptr;
    if (!inArchive && !fileSystem().exists(file.name)) {
      setError(outError, ErrorCode::EditTargetNotFound,
               std::format("Edit target file '{}' not found in archive or filesystem (at least "
                           "one must exist)",
                           file.name));
      return false;
    }
  }

  for (auto &file : files) {
    if (!file.editRef) {
      continue;
    }

    if (!text::isValidUtf8(file.data)) {
      setError(outError, ErrorCode::InvalidUtf8,
               std::format("Edit file '{}' is not valid UTF-8", file.name));
      return false;
    }

    Error parseError;
    auto edits = parseEditBlocks(file.text(), &parseError);
    if (!edits) {
      setError(outError, parseError.code,
               std::format("Failed to parse edit blocks in '{}': {}", file.name,
                           parseError.message));
      return false;
    }
    file.editRef->edits = std::move(*edits);
  }

  return true;
}

} // namespace txtarx
