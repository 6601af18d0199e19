#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "tagpack/catalog/atomic_kind.hpp"
#include "tagpack/catalog/type_catalog.hpp"
#include "tagpack/common/error.hpp"

namespace tagpack::layout {

// Default composite nesting limit shared by layout and literal synthesis.
inline constexpr int kDefaultMaxNestingDepth = 8;

struct LayoutOptions {
  // Round the total size up to a whole 32-bit word.
  bool pad_to_word = false;
  // A composite reached at this depth (root scope = 0) is rejected.
  int max_nesting_depth = kDefaultMaxNestingDepth;
};

// One atomic leaf of a layout.
//
// Composite and array members are flattened: `path` is the dotted/indexed
// address of the leaf ("Loop.Kp", "Gains[1].Ki", "Flags[3]") and the
// descriptor is that of the leaf's scalar element.
struct PlacedField {
  std::string path;
  catalog::FieldDescriptor descriptor;
  catalog::AtomicKind kind;
  uint32_t byte_offset;
  // Present only for Bool: bit index (LSB = 0) in the 4-byte host word.
  std::optional<uint32_t> bit_offset;
  // Bytes read or written for the field; the whole host word for Bool.
  uint32_t byte_size;

  auto operator==(const PlacedField&) const -> bool = default;
};

// Immutable placement of a field list inside a binary image.
struct Layout {
  std::vector<PlacedField> fields;
  uint32_t total_byte_size = 0;

  // Case-insensitive, like type and member names. Returns nullptr when no
  // field has the path.
  [[nodiscard]] auto Find(std::string_view path) const -> const PlacedField*;

  auto operator==(const Layout&) const -> bool = default;
};

// Places an ordered field list in a single left-to-right sweep.
//
// Placement rules (cursor starts at 0):
// - Bool: consecutive booleans share 32-bit host words; the 1st, 33rd, ...
//   boolean of the list allocates a new word at the cursor. Bool arrays
//   count as that many scalar booleans.
// - SINT: unaligned. INT: 2-byte aligned. DINT/REAL: 4. LINT: 8.
// - Composite: the member type's own layout is computed from offset 0 and
//   spliced in, aligned to its first leaf; array elements follow each other
//   under the same alignment.
//
// A name repeated within one field list (ignoring case) is DuplicateName.
// Deterministic: equal inputs yield equal layouts.
auto AssignLayout(
    const catalog::TypeCatalog& catalog,
    std::span<const catalog::FieldDescriptor> fields,
    const LayoutOptions& options = {}) -> Result<Layout>;

// Layout of the storage members of a composite type.
auto AssignTypeLayout(
    const catalog::TypeCatalog& catalog, std::string_view type_name,
    const LayoutOptions& options = {}) -> Result<Layout>;

// Paths of leaves whose parameter usage is Input, in layout order.
auto InputFieldNames(const Layout& layout) -> std::vector<std::string>;

// Human-readable table: path, type, byte offset, bit, size.
auto FormatLayout(const Layout& layout) -> std::string;

}  // namespace tagpack::layout
