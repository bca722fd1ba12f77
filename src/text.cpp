#include <charconv>

#include <txtarx/text.hpp>

namespace txtarx::text {

namespace {

std::vector<std::string_view> split(std::string_view input, bool stripCarriageReturn) {
  std::vector<std::string_view> lines;
  size_t pos = 0;

  while (pos < input.size()) {
    size_t end = input.find('\n', pos);
    if (end == std::string_view::npos) {
      end = input.size();
    }

    std::string_view line = input.substr(pos, end - pos);
    if (stripCarriageReturn && !line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    lines.push_back(line);
    pos = end + 1;
  }

  return lines;
}

} // namespace

std::vector<std::string_view> splitLines(std::string_view input) {
  return split(input, true);
}

std::vector<std::string_view> splitRawLines(std::string_view input) {
  return split(input, false);
}

std::string joinLines(std::span<const std::string> lines) {
  size_t total = 0;
  for (const auto &line : lines) {
    total += line.size() + 1;
  }

  std::string result;
  result.reserve(total);
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) {
      result += '\n';
    }
    result += lines[i];
  }
  return result;
}

bool isValidUtf8(std::span<const uint8_t> data) noexcept {
  size_t i = 0;
  const size_t n = data.size();

  while (i < n) {
    uint8_t c = data[i];

    if (c < 0x80) {
      ++i;
      continue;
    }

    size_t len = 0;
    uint8_t lo = 0x80;
    uint8_t hi = 0xBF;

    if (c >= 0xC2 && c <= 0xDF) {
      len = 2;
    } else if (c >= 0xE0 && c <= 0xEF) {
      len = 3;
      if (c == 0xE0) {
        lo = 0xA0; // Overlong
      } else if (c == 0xED) {
        hi = 0x9F; // Surrogates
      }
    } else if (c >= 0xF0 && c <= 0xF4) {
      len = 4;
      if (c == 0xF0) {
        lo = 0x90; // Overlong
      } else if (c == 0xF4) {
        hi = 0x8F; // Above U+10FFFF
      }
    } else {
      return false;
    }

    if (i + len > n) {
      return false;
    }

    // Second byte carries the tightened range, the rest are plain continuation bytes
    if (data[i + 1] < lo || data[i + 1] > hi) {
      return false;
    }
    for (size_t k = 2; k < len; ++k) {
      if ((data[i + k] & 0xC0) != 0x80) {
        return false;
      }
    }

    i += len;
  }

  return true;
}

bool parseUnsigned(std::string_view s, size_t &out) noexcept {
  if (s.empty()) {
    return false;
  }
  for (char c : s) {
    if (c < '0' || c > '9') {
      return false;
    }
  }

  size_t value = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc() || ptr != s.data() + s.size()) {
    return false;
  }

  out = value;
  return true;
}

} // namespace txtarx::text
