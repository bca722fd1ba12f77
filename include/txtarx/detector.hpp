#pragma once

#include <cstdint>
#include <span>
#include <string_view>

#include "types.hpp"

namespace txtarx {

// Classify file content as text or binary.
//
// Checks, first match wins (each only when enabled in config):
//   1. Valid UTF-8 content with a line shaped like "-- name --" -> Binary(ContentConflict)
//   2. Content that is not valid UTF-8                          -> Binary(InvalidUtf8)
//   3. Otherwise                                                -> Text(Utf8)
//
// Rule 1 keeps such content base64-opaque, since the decoder would otherwise
// read the line as a file boundary. The name is currently unused.
EncodingDetection detectEncoding(std::string_view name, std::span<const uint8_t> data,
                                 const EncodingConfig &config = {});

// True if the trimmed line is "-- X --" with non-blank X
bool isMarkerLine(std::string_view line);

// True if any line of text is a marker line
bool containsMarkerPattern(std::string_view text);

} // namespace txtarx
