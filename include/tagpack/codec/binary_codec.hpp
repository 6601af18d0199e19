#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <absl/container/flat_hash_map.h>

#include "tagpack/codec/field_value.hpp"
#include "tagpack/common/error.hpp"
#include "tagpack/layout/layout.hpp"

namespace tagpack::codec {

using BinaryImage = std::vector<uint8_t>;

// Leaf path -> value.
using FieldValues = absl::flat_hash_map<std::string, FieldValue>;

// Reads every field of the layout. Bytes beyond total_byte_size are ignored.
auto Decode(const layout::Layout& layout, std::span<const uint8_t> image)
    -> Result<FieldValues>;

auto DecodeField(
    const layout::Layout& layout, std::span<const uint8_t> image,
    std::string_view path) -> Result<FieldValue>;

// Returns a copy of `image` with `updates` applied. The input is never
// modified. An empty image is treated as zero-filled of the layout size.
//
// All updates are validated before any byte is written; on error nothing
// is produced. Bytes outside the updated fields (padding, sibling bits of
// a Bool host word) are preserved.
auto Encode(
    const layout::Layout& layout, std::span<const uint8_t> image,
    const FieldValues& updates) -> Result<BinaryImage>;

// In-place single-field update.
auto EncodeField(
    const layout::Layout& layout, std::span<uint8_t> image,
    std::string_view path, const FieldValue& value) -> Result<void>;

}  // namespace tagpack::codec
