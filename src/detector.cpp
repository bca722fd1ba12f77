#include <txtarx/detector.hpp>
#include <txtarx/text.hpp>

namespace txtarx {

bool isMarkerLine(std::string_view line) {
  std::string_view trimmed = text::trim(line);
  if (trimmed.size() < kMarkerPrefix.size() + kMarkerSuffix.size()) {
    return false;
  }
  if (!trimmed.starts_with(kMarkerPrefix) || !trimmed.ends_with(kMarkerSuffix)) {
    return false;
  }

  std::string_view inner = trimmed.substr(
      kMarkerPrefix.size(), trimmed.size() - kMarkerPrefix.size() - kMarkerSuffix.size());
  return !text::isBlank(inner);
}

bool containsMarkerPattern(std::string_view content) {
  for (auto line : text::splitLines(content)) {
    if (isMarkerLine(line)) {
      return true;
    }
  }
  return false;
}

EncodingDetection detectEncoding(std::string_view /*name*/, std::span<const uint8_t> data,
                                 const EncodingConfig &config) {
  const bool utf8 = text::isValidUtf8(data);

  if (config.checkContentMarkers && utf8 && containsMarkerPattern(text::asChars(data))) {
    return EncodingDetection::binary(BinaryReason::ContentConflict);
  }

  if (config.validateUtf8 && !utf8) {
    return EncodingDetection::binary(BinaryReason::InvalidUtf8);
  }

  return EncodingDetection::text();
}

} // namespace txtarx
