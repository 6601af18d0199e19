#include "tagpack/catalog/type_catalog.hpp"

#include <charconv>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <absl/container/flat_hash_set.h>
#include <absl/strings/ascii.h>
#include <spdlog/spdlog.h>

namespace tagpack::catalog {

namespace {

auto Member(std::string name, std::string type_name) -> FieldDescriptor {
  return FieldDescriptor{
      .name = std::move(name),
      .type_name = std::move(type_name),
      .array_length = 0,
      .hidden = false,
      .required = false,
      .visible = true,
      .usage = ParameterUsage::kNone};
}

// Control word (EN/TT/DN or CU/CD/DN/OV/UN status bits), preset, accumulator.
auto ControlStructure(std::string name) -> TypeDefinition {
  return TypeDefinition::Composite(
      std::move(name), {Member("Control", "DINT"), Member("PRE", "DINT"),
                        Member("ACC", "DINT")});
}

auto BuiltinTypes() -> std::vector<TypeDefinition> {
  return {
      TypeDefinition::Atomic("BOOL", AtomicKind::kBool),
      TypeDefinition::Atomic("BIT", AtomicKind::kBool),
      TypeDefinition::Atomic("SINT", AtomicKind::kSint8),
      TypeDefinition::Atomic("INT", AtomicKind::kInt16),
      TypeDefinition::Atomic("DINT", AtomicKind::kDint32),
      TypeDefinition::Atomic("LINT", AtomicKind::kLint64),
      TypeDefinition::Atomic("REAL", AtomicKind::kReal32),
      TypeDefinition::Atomic("STRING", AtomicKind::kStr),
      ControlStructure("TIMER"),
      ControlStructure("COUNTER"),
  };
}

}  // namespace

auto ToString(ParameterUsage usage) -> const char* {
  switch (usage) {
    case ParameterUsage::kNone:
      return "None";
    case ParameterUsage::kInput:
      return "Input";
    case ParameterUsage::kOutput:
      return "Output";
    case ParameterUsage::kInOut:
      return "InOut";
  }
  return "None";
}

auto ParseDimension(std::string_view field_name, std::string_view text)
    -> Result<uint32_t> {
  std::string_view trimmed = absl::StripAsciiWhitespace(text);
  if (trimmed.empty()) {
    return 0U;
  }
  uint32_t value = 0;
  const char* end = trimmed.data() + trimmed.size();
  auto [ptr, ec] = std::from_chars(trimmed.data(), end, value);
  if (ec != std::errc{} || ptr != end) {
    return std::unexpected(
        CodecError::MalformedDimension(
            std::string(field_name), std::string(text)));
  }
  return value;
}

auto OccupiesStorage(const FieldDescriptor& field) -> bool {
  return !field.hidden && field.usage != ParameterUsage::kInOut;
}

auto TypeCatalog::Build(std::vector<TypeDefinition> user_types)
    -> Result<TypeCatalog> {
  TypeCatalog catalog;
  for (auto& builtin : BuiltinTypes()) {
    if (auto inserted = catalog.Insert(std::move(builtin)); !inserted) {
      return std::unexpected(inserted.error());
    }
  }
  for (auto& definition : user_types) {
    if (auto inserted = catalog.Insert(std::move(definition)); !inserted) {
      return std::unexpected(inserted.error());
    }
  }
  spdlog::debug(
      "type catalog built: {} definitions ({} user)", catalog.Size(),
      user_types.size());
  return catalog;
}

auto TypeCatalog::Insert(TypeDefinition definition) -> Result<void> {
  if (!definition.IsAtomic()) {
    absl::flat_hash_set<std::string> seen;
    for (const auto& member : definition.AllMembers()) {
      if (!seen.insert(absl::AsciiStrToUpper(member.name)).second) {
        return std::unexpected(
            CodecError::DuplicateName(
                member.name, "type '" + definition.name + "'"));
      }
    }
  }
  std::string key = absl::AsciiStrToUpper(definition.name);
  if (types_.contains(key)) {
    return std::unexpected(
        CodecError::DuplicateName(definition.name, "the type catalog"));
  }
  types_.emplace(std::move(key), std::move(definition));
  return {};
}

auto TypeCatalog::Resolve(std::string_view type_name) const
    -> Result<const TypeDefinition*> {
  auto it = types_.find(absl::AsciiStrToUpper(type_name));
  if (it == types_.end()) {
    return std::unexpected(CodecError::TypeNotFound(std::string(type_name)));
  }
  return &it->second;
}

auto TypeCatalog::MembersOf(std::string_view type_name) const
    -> Result<std::vector<FieldDescriptor>> {
  auto resolved = Resolve(type_name);
  if (!resolved) {
    return std::unexpected(resolved.error());
  }
  const TypeDefinition& definition = **resolved;
  if (definition.IsAtomic()) {
    return std::unexpected(
        CodecError::UnsupportedType(
            definition.name, "atomic type has no members"));
  }
  std::vector<FieldDescriptor> members;
  for (const auto& member : definition.AllMembers()) {
    if (OccupiesStorage(member)) {
      members.push_back(member);
    }
  }
  return members;
}

auto TypeCatalog::Contains(std::string_view type_name) const -> bool {
  return types_.contains(absl::AsciiStrToUpper(type_name));
}

}  // namespace tagpack::catalog
