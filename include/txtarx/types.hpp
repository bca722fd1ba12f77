#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace txtarx {

// Wire format constants
inline constexpr std::string_view kMarkerPrefix = "-- ";
inline constexpr std::string_view kMarkerSuffix = " --";
inline constexpr std::string_view kBase64Tag = "[.base64]";
inline constexpr std::string_view kEditTag = "[.edit]";

// Error categories reported through Error::code
enum class ErrorCode {
  None,
  Io,
  EmptyName,
  DuplicateFile,
  InvalidTag,
  MissingClosingBracket,
  InvalidLineNumber,
  InvalidBase64,
  InvalidUtf8,
  EditTargetNotFound,
  UnterminatedBlock,
  EmptyBlock,
  ExpectedSearchStart,
  MalformedLine,
  SearchNotFound,
  MultipleMatches,
  EmptyContent,
};

// Failure details filled into the optional outError parameter of fallible calls
struct Error {
  ErrorCode code = ErrorCode::None;
  std::string message;

  explicit operator bool() const { return code != ErrorCode::None; }
};

// Fills outError if provided
inline void setError(Error *outError, ErrorCode code, std::string message) {
  if (outError) {
    outError->code = code;
    outError->message = std::move(message);
  }
}

const char *errorCodeName(ErrorCode code);

// Exception for tag grammar errors, converted to Error at the decoder boundary
class ParseError : public std::runtime_error {
public:
  ParseError(ErrorCode code, const std::string &msg) : std::runtime_error(msg), code_(code) {}

  ErrorCode code() const { return code_; }

private:
  ErrorCode code_;
};

// Configuration for encoding detection
struct EncodingConfig {
  bool checkContentMarkers = true; // Force content with marker-shaped lines to binary
  bool validateUtf8 = true;        // Force non-UTF-8 content to binary
};

enum class TextEncoding { Utf8 };

enum class BinaryReason {
  ContentConflict, // Content holds a line shaped like a file marker
  InvalidUtf8,     // Content is not valid UTF-8
  Explicit,        // Caller or [.base64] tag marked it binary
};

const char *binaryReasonName(BinaryReason reason);

// Result of detectEncoding(): text, or binary with a reason
struct EncodingDetection {
  bool isBinary = false;
  TextEncoding encoding = TextEncoding::Utf8;
  std::optional<BinaryReason> reason;

  static EncodingDetection text() { return {}; }
  static EncodingDetection binary(BinaryReason why) { return {true, TextEncoding::Utf8, why}; }

  bool operator==(const EncodingDetection &) const = default;
};

// Markdown link in the comment: [command: NAME](#HREF)
struct Command {
  std::string name;
  std::string href; // Without the leading '#'

  bool operator==(const Command &) const = default;
};

// [.snippet:N], [.snippet#href:line] or [.#href:line]
struct SnippetRef {
  std::optional<std::string> commandHref;
  size_t line = 0;

  bool operator==(const SnippetRef &) const = default;
};

enum class EditOperation { Replace, Delete, Insert };

const char *editOperationName(EditOperation op);

// One SEARCH/REPLACE block, lines stored with trailing whitespace trimmed
struct EditBlock {
  std::vector<std::string> search;
  std::vector<std::string> replacement;
  EditOperation operation = EditOperation::Replace;

  bool operator==(const EditBlock &) const = default;
};

// [.edit] or [.edit#href:line] plus the parsed edit program
struct EditRef {
  std::optional<std::string> commandHref;
  std::optional<size_t> startLine; // Informational only
  std::vector<EditBlock> edits;

  // Apply edits to content, see applyEdits()
  std::optional<std::string> apply(std::string_view content, Error *outError = nullptr) const;

  bool operator==(const EditRef &) const = default;
};

// A single file entry in an archive
struct File {
  std::string name;          // May contain '/'-separated directories
  std::vector<uint8_t> data; // Raw bytes (decoded if binary)
  bool isBinary = false;
  std::optional<BinaryReason> binaryReason; // Set iff isBinary
  std::optional<SnippetRef> snippetRef;
  std::optional<EditRef> editRef;

  // Create a file, classifying the content with detectEncoding()
  static File create(std::string name, std::span<const uint8_t> data,
                     const EncodingConfig &config = {});
  static File create(std::string name, std::string_view content,
                     const EncodingConfig &config = {});

  // Create a file with an explicit binary flag (reason Explicit when binary)
  static File withEncoding(std::string name, std::vector<uint8_t> data, bool isBinary);

  // Read a file from disk and classify it. archiveName defaults to the file name.
  static std::optional<File> fromPath(const std::filesystem::path &path,
                                      const std::string &archiveName = {},
                                      Error *outError = nullptr,
                                      const EncodingConfig &config = {});

  // Name as written in the marker line: name + "[.base64]" when binary
  std::string archiveName() const;

  // Split "name[.base64]" into ("name", true)
  static std::pair<std::string, bool> parseArchiveName(std::string_view archiveName);

  // View of the data as characters (no UTF-8 check)
  std::string_view text() const {
    return std::string_view(reinterpret_cast<const char *>(data.data()), data.size());
  }

  // Neither a snippet nor an edit file
  bool isNormal() const { return !snippetRef && !editRef; }

  bool operator==(const File &) const = default;
};

// Snippet reference whose command href is not in the archive comment
struct SnippetRefError {
  std::string file;
  std::string missingCommand;

  bool operator==(const SnippetRefError &) const = default;
};

} // namespace txtarx
