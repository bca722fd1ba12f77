#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "archive.hpp"
#include "types.hpp"

namespace txtarx {

struct EncoderOptions {
  // Also write snippet and edit tags into the marker line. Off by default, in
  // which case only [.base64] is written.
  bool emitReferenceTags = false;
};

// Serializes an archive to its text form (inverse of Decoder::decode)
class Encoder {
public:
  Encoder() = default;
  explicit Encoder(EncoderOptions options) : options_(options) {}

  // Returns std::nullopt on failure, with details in outError if provided.
  // Fails with InvalidUtf8 for a non-binary file whose data is not UTF-8.
  std::optional<std::string> encode(const Archive &archive, Error *outError = nullptr) const;

  // Encode and write to disk
  bool encodeToFile(const Archive &archive, const std::filesystem::path &destPath,
                    Error *outError = nullptr) const;

  const EncoderOptions &options() const { return options_; }

private:
  bool encodeFile(std::string &output, const File &file, Error *outError) const;

  EncoderOptions options_;
};

} // namespace txtarx
