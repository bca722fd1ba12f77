#include <format>
#include <fstream>

#include <txtarx/base64.hpp>
#include <txtarx/encoder.hpp>
#include <txtarx/tags.hpp>
#include <txtarx/text.hpp>

namespace txtarx {

std::optional<std::string> Encoder::encode(const Archive &archive, Error *outError) const {
  std::string output;

  const std::string &comment = archive.comment();
  if (!comment.empty()) {
    output += comment;
    if (comment.back() != '\n') {
      output += '\n';
    }
  }

  for (const auto &file : archive.files()) {
    if (!encodeFile(output, file, outError)) {
      return std::nullopt;
    }
  }

  return output;
}

bool Encoder::encodeFile(std::string &output, const File &file, Error *outError) const {
  std::string content;
  if (file.isBinary) {
    content = base64::encode(file.data);
  } else {
    // Only reachable for hand-built files, File::create() classifies these as binary
    if (!text::isValidUtf8(file.data)) {
      setError(outError, ErrorCode::InvalidUtf8,
               std::format("File {} is not valid UTF-8 but not marked as binary", file.name));
      return false;
    }
    content.assign(file.text());
  }

  output += kMarkerPrefix;
  output += file.archiveName();
  if (options_.emitReferenceTags) {
    if (file.snippetRef) {
      output += formatSnippetTag(*file.snippetRef);
    }
    if (file.editRef) {
      output += formatEditTag(*file.editRef);
    }
  }
  output += kMarkerSuffix;
  output += '\n';

  output += content;
  if (content.empty() || content.back() != '\n') {
    output += '\n';
  }

  return true;
}

bool Encoder::encodeToFile(const Archive &archive, const std::filesystem::path &destPath,
                           Error *outError) const {
  auto encoded = encode(archive, outError);
  if (!encoded) {
    return false;
  }

  std::ofstream out(destPath, std::ios::binary | std::ios::trunc);
  if (!out) {
    setError(outError, ErrorCode::Io,
             std::format("Failed to create output file: {}", destPath.string()));
    return false;
  }

  out.write(encoded->data(), static_cast<std::streamsize>(encoded->size()));
  if (!out) {
    setError(outError, ErrorCode::Io,
             std::format("Failed to write to output file: {}", destPath.string()));
    return false;
  }

  return true;
}

} // namespace txtarx
