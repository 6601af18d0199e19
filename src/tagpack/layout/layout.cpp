#include "tagpack/layout/layout.hpp"

#include <algorithm>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/container/flat_hash_set.h>
#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "tagpack/catalog/atomic_kind.hpp"
#include "tagpack/catalog/type_catalog.hpp"

namespace tagpack::layout {

namespace {

using catalog::AtomicKind;
using catalog::FieldDescriptor;
using catalog::TypeDefinition;

constexpr uint32_t kBoolsPerWord = 32;
constexpr uint32_t kBoolWordBytes = 4;

auto AlignUp(uint32_t value, uint32_t alignment) -> uint32_t {
  return (value + alignment - 1) / alignment * alignment;
}

auto ElementPath(const FieldDescriptor& field, uint32_t index)
    -> std::string {
  if (!field.IsArray()) {
    return field.name;
  }
  return fmt::format("{}[{}]", field.name, index);
}

// Cursor state of one scope (a field list). Booleans are counted across the
// whole scope, not per field.
struct ScopeCursor {
  uint32_t offset = 0;
  uint32_t bool_count = 0;
  uint32_t bool_word_offset = 0;
};

class LayoutAssigner {
 public:
  LayoutAssigner(
      const catalog::TypeCatalog& catalog, const LayoutOptions& options)
      : catalog_(catalog), options_(options) {
  }

  auto AssignScope(
      std::span<const FieldDescriptor> fields, std::string_view scope_name,
      int depth) -> Result<Layout> {
    Layout scope;
    ScopeCursor cursor;
    absl::flat_hash_set<std::string> seen;
    for (const auto& field : fields) {
      // Names are case-insensitive, so "A" and "a" would share a path.
      if (!seen.insert(absl::AsciiStrToUpper(field.name)).second) {
        return std::unexpected(
            CodecError::DuplicateName(field.name, std::string(scope_name)));
      }
      if (!catalog::OccupiesStorage(field)) {
        continue;
      }
      auto resolved = catalog_.Resolve(field.type_name);
      if (!resolved) {
        return std::unexpected(resolved.error());
      }
      const TypeDefinition& type = **resolved;
      auto placed =
          type.IsAtomic()
              ? PlaceAtomicField(scope, cursor, field, type)
              : PlaceCompositeField(scope, cursor, field, type, depth);
      if (!placed) {
        return std::unexpected(placed.error());
      }
    }
    scope.total_byte_size = cursor.offset;
    return scope;
  }

 private:
  auto PlaceAtomicField(
      Layout& scope, ScopeCursor& cursor, const FieldDescriptor& field,
      const TypeDefinition& type) -> Result<void> {
    AtomicKind kind = type.AsAtomic();
    if (kind == AtomicKind::kStr) {
      return std::unexpected(
          CodecError::UnsupportedType(
              field.type_name,
              fmt::format(
                  "field '{}': STRING has no packed binary representation",
                  field.name)));
    }

    FieldDescriptor leaf = field;
    leaf.array_length = 0;
    uint32_t count = std::max(field.array_length, 1U);
    for (uint32_t i = 0; i < count; ++i) {
      scope.fields.push_back(
          PlaceLeaf(cursor, ElementPath(field, i), leaf, kind));
    }
    return {};
  }

  static auto PlaceLeaf(
      ScopeCursor& cursor, std::string path, const FieldDescriptor& leaf,
      AtomicKind kind) -> PlacedField {
    if (kind == AtomicKind::kBool) {
      // First boolean of a 32-bit group opens a new host word.
      if (cursor.bool_count % kBoolsPerWord == 0) {
        cursor.bool_word_offset = cursor.offset;
        cursor.offset += kBoolWordBytes;
      }
      uint32_t bit = cursor.bool_count % kBoolsPerWord;
      ++cursor.bool_count;
      spdlog::trace(
          "place {} BOOL at {} bit {}", path, cursor.bool_word_offset, bit);
      return PlacedField{
          .path = std::move(path),
          .descriptor = leaf,
          .kind = kind,
          .byte_offset = cursor.bool_word_offset,
          .bit_offset = bit,
          .byte_size = kBoolWordBytes};
    }

    cursor.offset = AlignUp(cursor.offset, catalog::Alignment(kind));
    uint32_t offset = cursor.offset;
    cursor.offset += catalog::ByteWidth(kind);
    spdlog::trace("place {} {} at {}", path, catalog::ToString(kind), offset);
    return PlacedField{
        .path = std::move(path),
        .descriptor = leaf,
        .kind = kind,
        .byte_offset = offset,
        .bit_offset = std::nullopt,
        .byte_size = catalog::ByteWidth(kind)};
  }

  auto PlaceCompositeField(
      Layout& scope, ScopeCursor& cursor, const FieldDescriptor& field,
      const TypeDefinition& type, int depth) -> Result<void> {
    int member_depth = depth + 1;
    if (member_depth >= options_.max_nesting_depth) {
      return std::unexpected(
          CodecError::MaxNestingDepthExceeded(type.name, member_depth));
    }
    auto members = catalog_.MembersOf(type.name);
    if (!members) {
      return std::unexpected(members.error());
    }
    auto sub = AssignScope(
        *members, fmt::format("type '{}'", type.name), member_depth);
    if (!sub) {
      return std::unexpected(sub.error());
    }
    if (sub->fields.empty()) {
      return std::unexpected(
          CodecError::UnsupportedType(
              type.name, "composite has no storage members"));
    }

    // The structure aligns like its first leaf.
    uint32_t alignment = catalog::Alignment(sub->fields.front().kind);
    uint32_t count = std::max(field.array_length, 1U);
    for (uint32_t i = 0; i < count; ++i) {
      cursor.offset = AlignUp(cursor.offset, alignment);
      std::string prefix = ElementPath(field, i);
      for (const auto& inner : sub->fields) {
        PlacedField spliced = inner;
        spliced.path = fmt::format("{}.{}", prefix, inner.path);
        spliced.byte_offset += cursor.offset;
        if (field.usage != catalog::ParameterUsage::kNone) {
          spliced.descriptor.usage = field.usage;
        }
        scope.fields.push_back(std::move(spliced));
      }
      spdlog::trace(
          "splice {} {} at {} ({} bytes)", prefix, type.name, cursor.offset,
          sub->total_byte_size);
      cursor.offset += sub->total_byte_size;
    }
    return {};
  }

  const catalog::TypeCatalog& catalog_;
  const LayoutOptions& options_;
};

}  // namespace

auto Layout::Find(std::string_view path) const -> const PlacedField* {
  auto it = std::ranges::find_if(fields, [&](const PlacedField& field) {
    return absl::EqualsIgnoreCase(field.path, path);
  });
  return it == fields.end() ? nullptr : &*it;
}

auto AssignLayout(
    const catalog::TypeCatalog& catalog,
    std::span<const catalog::FieldDescriptor> fields,
    const LayoutOptions& options) -> Result<Layout> {
  auto layout = LayoutAssigner(catalog, options)
                    .AssignScope(fields, "the field list", 0);
  if (!layout) {
    return std::unexpected(layout.error());
  }
  if (options.pad_to_word) {
    layout->total_byte_size = AlignUp(layout->total_byte_size, 4);
  }
  spdlog::debug(
      "layout: {} fields, {} bytes", layout->fields.size(),
      layout->total_byte_size);
  return layout;
}

auto AssignTypeLayout(
    const catalog::TypeCatalog& catalog, std::string_view type_name,
    const LayoutOptions& options) -> Result<Layout> {
  auto members = catalog.MembersOf(type_name);
  if (!members) {
    return std::unexpected(members.error());
  }
  return AssignLayout(catalog, *members, options);
}

auto InputFieldNames(const Layout& layout) -> std::vector<std::string> {
  std::vector<std::string> names;
  for (const auto& field : layout.fields) {
    if (field.descriptor.usage == catalog::ParameterUsage::kInput) {
      names.push_back(field.path);
    }
  }
  return names;
}

auto FormatLayout(const Layout& layout) -> std::string {
  size_t path_width = 4;
  for (const auto& field : layout.fields) {
    path_width = std::max(path_width, field.path.size());
  }

  std::string out = fmt::format(
      "{:<{}}  {:<6}  {:>6}  {:>3}  {:>4}\n", "PATH", path_width, "TYPE",
      "OFFSET", "BIT", "SIZE");
  for (const auto& field : layout.fields) {
    std::string bit =
        field.bit_offset ? fmt::format("{}", *field.bit_offset) : "-";
    out += fmt::format(
        "{:<{}}  {:<6}  {:>6}  {:>3}  {:>4}\n", field.path, path_width,
        catalog::ToString(field.kind), field.byte_offset, bit,
        field.byte_size);
  }
  out += fmt::format("total: {} bytes\n", layout.total_byte_size);
  return out;
}

}  // namespace tagpack::layout
