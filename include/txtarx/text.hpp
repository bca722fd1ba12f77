#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace txtarx::text {

// Split into lines on '\n', dropping a trailing '\r' from each line.
// A final line break does not produce an empty trailing entry.
std::vector<std::string_view> splitLines(std::string_view input);

// Split on '\n' only. A '\r' before the break stays part of the line.
std::vector<std::string_view> splitRawLines(std::string_view input);

// Join with '\n' separators, no trailing line break
std::string joinLines(std::span<const std::string> lines);

inline bool isSpace(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

inline std::string_view trimLeft(std::string_view s) noexcept {
  size_t i = 0;
  while (i < s.size() && isSpace(s[i])) {
    ++i;
  }
  return s.substr(i);
}

inline std::string_view trimRight(std::string_view s) noexcept {
  size_t n = s.size();
  while (n > 0 && isSpace(s[n - 1])) {
    --n;
  }
  return s.substr(0, n);
}

inline std::string_view trim(std::string_view s) noexcept {
  return trimRight(trimLeft(s));
}

inline bool isBlank(std::string_view s) noexcept {
  return trimLeft(s).empty();
}

// Strict UTF-8 validation (rejects overlong forms, surrogates and values above U+10FFFF)
bool isValidUtf8(std::span<const uint8_t> data) noexcept;

inline std::string_view asChars(std::span<const uint8_t> data) noexcept {
  return std::string_view(reinterpret_cast<const char *>(data.data()), data.size());
}

inline std::span<const uint8_t> asBytes(std::string_view s) noexcept {
  return std::span<const uint8_t>(reinterpret_cast<const uint8_t *>(s.data()), s.size());
}

// Parse an unsigned decimal number; the whole input must be digits
bool parseUnsigned(std::string_view s, size_t &out) noexcept;

} // namespace txtarx::text
