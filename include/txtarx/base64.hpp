#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace txtarx::base64 {

// Standard alphabet with '=' padding, no line wrapping
std::string encode(std::span<const uint8_t> data);

// Decode padded standard base64. Returns std::nullopt on a bad character,
// misplaced padding or a length that is not a multiple of four.
std::optional<std::vector<uint8_t>> decode(std::string_view input);

} // namespace txtarx::base64
