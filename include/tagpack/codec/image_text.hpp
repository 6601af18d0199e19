#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "tagpack/codec/binary_codec.hpp"
#include "tagpack/common/error.hpp"

namespace tagpack::codec {

// Parse a hex dump such as "01 00 00 00 e8 03" or "0x01000000e803".
// Whitespace, '_' and a leading 0x are ignored; digits must pair up.
auto ParseHexImage(std::string_view text) -> Result<BinaryImage>;

// Lowercase byte pairs separated by single spaces.
auto FormatHexImage(std::span<const uint8_t> image) -> std::string;

}  // namespace tagpack::codec
