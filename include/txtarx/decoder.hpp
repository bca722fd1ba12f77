#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "archive.hpp"
#include "filesystem.hpp"
#include "tags.hpp"
#include "types.hpp"

namespace txtarx {

struct DecoderOptions {
  int verbose = 0;         // > 0 echoes warnings to std::cerr
  bool strictTags = false; // Reject unknown or malformed marker tags
};

// Decodes the text form of an archive:
//
//   comment lines
//   -- name[.base64][.snippet:N][.edit] --
//   content lines (base64 when [.base64] is present)
//   -- next-name --
//   ...
//
// Edit files ([.edit]) have their body parsed into EditRef::edits. Their target
// must be found by findEditTarget or exist in the FileSystem.
class Decoder {
public:
  Decoder() = default;
  explicit Decoder(DecoderOptions options, const FileSystem *fileSystem = nullptr)
      : options_(options), fileSystem_(fileSystem) {}

  // Decode an archive held in memory.
  // Returns std::nullopt on failure, with details in outError if provided.
  std::optional<Archive> decode(std::string_view input, Error *outError = nullptr);

  // Decode an archive file (memory-mapped)
  std::optional<Archive> decodeFile(const std::filesystem::path &path,
                                    Error *outError = nullptr);

  // Advisory diagnostics from the last decode
  const std::vector<std::string> &warnings() const { return warnings_; }

  const DecoderOptions &options() const { return options_; }

  // nullptr selects LocalFileSystem. The pointee must outlive the decoder.
  void setFileSystem(const FileSystem *fileSystem) { fileSystem_ = fileSystem; }

private:
  enum class State { OutsideFile, InsideFile };

  struct PendingFile {
    MarkerInfo marker;
    size_t line = 0; // Marker line number
    std::string body;
  };

  struct Session {
    State state = State::OutsideFile;
    std::vector<std::string_view> commentLines;
    PendingFile current;
    std::vector<File> files;
  };

  bool onOutsideFile(Session &session, std::string_view line, size_t lineNumber,
                     Error *outError);
  bool onInsideFile(Session &session, std::string_view line, size_t lineNumber, Error *outError);
  bool beginFile(Session &session, std::string_view nameAndTags, size_t lineNumber,
                 Error *outError);
  bool finishFile(Session &session, Error *outError);

  bool resolveEdits(std::vector<File> &files, Error *outError) const;

  void warn(std::string message);

  const FileSystem &fileSystem() const;

  DecoderOptions options_;
  const FileSystem *fileSystem_ = nullptr;
  std::vector<std::string> warnings_;
};

} // namespace txtarx
