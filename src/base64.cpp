#include <array>

#include <txtarx/base64.hpp>

namespace txtarx::base64 {

namespace {

constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr std::array<int8_t, 256> makeDecodeTable() {
  std::array<int8_t, 256> table{};
  for (auto &entry : table) {
    entry = -1;
  }
  for (int i = 0; i < 64; ++i) {
    table[static_cast<uint8_t>(kAlphabet[i])] = static_cast<int8_t>(i);
  }
  return table;
}

constexpr auto kDecodeTable = makeDecodeTable();

} // namespace

std::string encode(std::span<const uint8_t> data) {
  std::string out;
  out.reserve(((data.size() + 2) / 3) * 4);

  size_t i = 0;
  for (; i + 3 <= data.size(); i += 3) {
    uint32_t triple = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | data[i + 2];
    out += kAlphabet[(triple >> 18) & 0x3F];
    out += kAlphabet[(triple >> 12) & 0x3F];
    out += kAlphabet[(triple >> 6) & 0x3F];
    out += kAlphabet[triple & 0x3F];
  }

  size_t remaining = data.size() - i;
  if (remaining == 1) {
    uint32_t triple = uint32_t(data[i]) << 16;
    out += kAlphabet[(triple >> 18) & 0x3F];
    out += kAlphabet[(triple >> 12) & 0x3F];
    out += "==";
  } else if (remaining == 2) {
    uint32_t triple = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8);
    out += kAlphabet[(triple >> 18) & 0x3F];
    out += kAlphabet[(triple >> 12) & 0x3F];
    out += kAlphabet[(triple >> 6) & 0x3F];
    out += '=';
  }

  return out;
}

std::optional<std::vector<uint8_t>> decode(std::string_view input) {
  if (input.size() % 4 != 0) {
    return std::nullopt;
  }

  std::vector<uint8_t> out;
  out.reserve((input.size() / 4) * 3);

  for (size_t i = 0; i < input.size(); i += 4) {
    const bool lastQuad = i + 4 == input.size();
    int values[4];
    int padding = 0;

    for (size_t k = 0; k < 4; ++k) {
      char c = input[i + k];
      if (c == '=') {
        // Padding is only legal in the last two positions of the final quad
        if (!lastQuad || k < 2) {
          return std::nullopt;
        }
        ++padding;
        values[k] = 0;
        continue;
      }
      if (padding > 0) {
        return std::nullopt;
      }
      int8_t v = kDecodeTable[static_cast<uint8_t>(c)];
      if (v < 0) {
        return std::nullopt;
      }
      values[k] = v;
    }

    uint32_t triple = (uint32_t(values[0]) << 18) | (uint32_t(values[1]) << 12) |
                      (uint32_t(values[2]) << 6) | uint32_t(values[3]);

    out.push_back(static_cast<uint8_t>((triple >> 16) & 0xFF));
    if (padding < 2) {
      out.push_back(static_cast<uint8_t>((triple >> 8) & 0xFF));
    }
    if (padding < 1) {
      out.push_back(static_cast<uint8_t>(triple & 0xFF));
    }
  }

  return out;
}

} // namespace txtarx::base64
