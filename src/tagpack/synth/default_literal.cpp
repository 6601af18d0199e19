#include "tagpack/synth/default_literal.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/strings/str_join.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "tagpack/catalog/atomic_kind.hpp"
#include "tagpack/catalog/type_catalog.hpp"

namespace tagpack::synth {

namespace {

using catalog::AtomicKind;
using catalog::FieldDescriptor;
using catalog::TypeDefinition;

constexpr uint32_t kBoolsPerWord = 32;
constexpr int kStringCapacity = 82;

// Packed-bit zero of one BOOL array element.
constexpr std::string_view kBoolArrayElementZero = "2#0";

auto StringZero() -> std::string {
  std::string nulls;
  nulls.reserve(kStringCapacity * 3);
  for (int i = 0; i < kStringCapacity; ++i) {
    nulls += "$00";
  }
  return fmt::format("[0,'{}']", nulls);
}

auto AtomicZero(AtomicKind kind, const SynthesisOptions& options)
    -> std::string {
  switch (kind) {
    case AtomicKind::kReal32:
      return options.real_format == RealLiteralFormat::kExponent
                 ? "0.00000000e+000"
                 : "0.0";
    case AtomicKind::kStr:
      return StringZero();
    case AtomicKind::kBool:
    case AtomicKind::kSint8:
    case AtomicKind::kInt16:
    case AtomicKind::kDint32:
    case AtomicKind::kLint64:
      break;
  }
  return "0";
}

auto Bracket(const std::vector<std::string>& items) -> std::string {
  return fmt::format("[{}]", absl::StrJoin(items, ","));
}

auto IsBoolScalar(
    const catalog::TypeCatalog& catalog, const FieldDescriptor& field)
    -> bool {
  if (field.IsArray()) {
    return false;
  }
  auto type = catalog.Resolve(field.type_name);
  return type && (*type)->IsAtomic() &&
         (*type)->AsAtomic() == AtomicKind::kBool;
}

}  // namespace

auto SynthesizeDefault(
    const catalog::TypeCatalog& catalog, std::string_view type_name,
    const SynthesisOptions& options, int depth) -> Result<std::string> {
  auto resolved = catalog.Resolve(type_name);
  if (!resolved) {
    return std::unexpected(resolved.error());
  }
  const TypeDefinition& type = **resolved;
  if (type.IsAtomic()) {
    return AtomicZero(type.AsAtomic(), options);
  }

  if (depth >= options.max_nesting_depth) {
    return std::unexpected(
        CodecError::MaxNestingDepthExceeded(type.name, depth));
  }
  auto members = catalog.MembersOf(type.name);
  if (!members) {
    return std::unexpected(members.error());
  }
  if (members->empty()) {
    return std::unexpected(
        CodecError::UnsupportedType(
            type.name, "composite has no storage members"));
  }

  std::vector<std::string> items;
  uint32_t bool_count = 0;
  for (const auto& member : *members) {
    if (IsBoolScalar(catalog, member)) {
      // One entry per 32-bit group of scalar booleans.
      if (bool_count++ % kBoolsPerWord != 0) {
        continue;
      }
    }
    auto literal =
        SynthesizeMemberDefault(catalog, member, options, depth + 1);
    if (!literal) {
      return std::unexpected(literal.error());
    }
    items.push_back(std::move(*literal));
  }
  spdlog::trace(
      "default {} at depth {}: {} entries", type.name, depth, items.size());
  return Bracket(items);
}

auto SynthesizeMemberDefault(
    const catalog::TypeCatalog& catalog, const FieldDescriptor& field,
    const SynthesisOptions& options, int depth) -> Result<std::string> {
  if (!field.IsArray()) {
    return SynthesizeDefault(catalog, field.type_name, options, depth);
  }

  std::string element;
  auto resolved = catalog.Resolve(field.type_name);
  if (!resolved) {
    return std::unexpected(resolved.error());
  }
  if ((*resolved)->IsAtomic() &&
      (*resolved)->AsAtomic() == AtomicKind::kBool) {
    element = kBoolArrayElementZero;
  } else {
    auto literal = SynthesizeDefault(catalog, field.type_name, options, depth);
    if (!literal) {
      return std::unexpected(literal.error());
    }
    element = std::move(*literal);
  }
  return Bracket(std::vector<std::string>(field.array_length, element));
}

auto ToString(RealLiteralFormat format) -> const char* {
  switch (format) {
    case RealLiteralFormat::kDecimal:
      return "decimal";
    case RealLiteralFormat::kExponent:
      return "exponent";
  }
  return "decimal";
}

}  // namespace tagpack::synth
