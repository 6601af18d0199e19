#include "tagpack/codec/image_text.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <absl/strings/ascii.h>
#include <fmt/core.h>

namespace tagpack::codec {

namespace {

auto HexDigit(char ch) -> std::optional<uint8_t> {
  if (ch >= '0' && ch <= '9') {
    return static_cast<uint8_t>(ch - '0');
  }
  if (ch >= 'a' && ch <= 'f') {
    return static_cast<uint8_t>(10 + (ch - 'a'));
  }
  if (ch >= 'A' && ch <= 'F') {
    return static_cast<uint8_t>(10 + (ch - 'A'));
  }
  return std::nullopt;
}

}  // namespace

auto ParseHexImage(std::string_view text) -> Result<BinaryImage> {
  std::string_view digits = absl::StripAsciiWhitespace(text);
  if (digits.starts_with("0x") || digits.starts_with("0X")) {
    digits.remove_prefix(2);
  }

  BinaryImage image;
  std::optional<uint8_t> high;
  for (size_t i = 0; i < digits.size(); ++i) {
    char ch = digits[i];
    if (absl::ascii_isspace(static_cast<unsigned char>(ch)) || ch == '_') {
      continue;
    }
    auto nibble = HexDigit(ch);
    if (!nibble) {
      return std::unexpected(
          CodecError::MalformedValue(
              std::string(text),
              fmt::format("invalid hex digit '{}' at position {}", ch, i)));
    }
    if (high) {
      image.push_back(static_cast<uint8_t>((*high << 4) | *nibble));
      high.reset();
    } else {
      high = nibble;
    }
  }
  if (high) {
    return std::unexpected(
        CodecError::MalformedValue(
            std::string(text), "odd number of hex digits"));
  }
  return image;
}

auto FormatHexImage(std::span<const uint8_t> image) -> std::string {
  constexpr std::array<char, 16> kHexDigits = {'0', '1', '2', '3', '4', '5',
                                               '6', '7', '8', '9', 'a', 'b',
                                               'c', 'd', 'e', 'f'};
  std::string out;
  out.reserve(image.size() * 3);
  for (size_t i = 0; i < image.size(); ++i) {
    if (i > 0) {
      out += ' ';
    }
    out += kHexDigits.at(image[i] >> 4);
    out += kHexDigits.at(image[i] & 0x0F);
  }
  return out;
}

}  // namespace tagpack::codec
