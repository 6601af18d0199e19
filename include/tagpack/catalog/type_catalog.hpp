#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <absl/container/flat_hash_map.h>

#include "tagpack/catalog/atomic_kind.hpp"
#include "tagpack/common/error.hpp"

namespace tagpack::catalog {

// Add-On Instruction parameter usage. Structure members use kNone.
enum class ParameterUsage : uint8_t {
  kNone,
  kInput,
  kOutput,
  kInOut,  // Reference parameter; never stored in the backing tag
};

auto ToString(ParameterUsage usage) -> const char*;

struct FieldDescriptor {
  std::string name;
  std::string type_name;
  uint32_t array_length = 0;  // 0 = scalar
  bool hidden = false;
  bool required = false;
  bool visible = true;
  ParameterUsage usage = ParameterUsage::kNone;

  [[nodiscard]] auto IsArray() const -> bool {
    return array_length > 0;
  }

  auto operator==(const FieldDescriptor&) const -> bool = default;
};

// Parse a declared dimension. Empty text means scalar (0).
auto ParseDimension(std::string_view field_name, std::string_view text)
    -> Result<uint32_t>;

struct TypeDefinition {
  std::string name;
  std::variant<AtomicKind, std::vector<FieldDescriptor>> kind;
  bool is_instruction = false;

  static auto Atomic(std::string name, AtomicKind kind) -> TypeDefinition {
    return TypeDefinition{
        .name = std::move(name), .kind = kind, .is_instruction = false};
  }

  static auto Composite(
      std::string name, std::vector<FieldDescriptor> members,
      bool is_instruction = false) -> TypeDefinition {
    return TypeDefinition{
        .name = std::move(name),
        .kind = std::move(members),
        .is_instruction = is_instruction};
  }

  [[nodiscard]] auto IsAtomic() const -> bool {
    return std::holds_alternative<AtomicKind>(kind);
  }

  [[nodiscard]] auto AsAtomic() const -> AtomicKind {
    return std::get<AtomicKind>(kind);
  }

  // Declared members in order, hidden ones included.
  [[nodiscard]] auto AllMembers() const -> const std::vector<FieldDescriptor>& {
    return std::get<std::vector<FieldDescriptor>>(kind);
  }
};

// Read-only mapping from type name to definition.
//
// Built once from project metadata and never mutated afterwards, so any
// number of threads may resolve concurrently. Lookups are case-insensitive;
// definitions keep their declared spelling. Member types are not resolved
// at build time: a member naming an unknown type only fails when a layout
// or literal walk reaches it.
class TypeCatalog final {
 public:
  TypeCatalog(const TypeCatalog&) = delete;
  auto operator=(const TypeCatalog&) -> TypeCatalog& = delete;

  TypeCatalog(TypeCatalog&&) = default;
  auto operator=(TypeCatalog&&) -> TypeCatalog& = default;
  ~TypeCatalog() = default;

  // Registers the built-in atomic and predefined types, then the given
  // user types. Fails on duplicate type names (including a user type
  // shadowing a built-in) and on duplicate member names within one type.
  static auto Build(std::vector<TypeDefinition> user_types)
      -> Result<TypeCatalog>;

  [[nodiscard]] auto Resolve(std::string_view type_name) const
      -> Result<const TypeDefinition*>;

  // Members that occupy tag storage, in declaration order: hidden members
  // and InOut parameters are excluded. Fails for unknown or atomic types.
  [[nodiscard]] auto MembersOf(std::string_view type_name) const
      -> Result<std::vector<FieldDescriptor>>;

  [[nodiscard]] auto Contains(std::string_view type_name) const -> bool;

  [[nodiscard]] auto Size() const -> size_t {
    return types_.size();
  }

 private:
  TypeCatalog() = default;

  auto Insert(TypeDefinition definition) -> Result<void>;

  // Keyed by upper-cased name.
  absl::flat_hash_map<std::string, TypeDefinition> types_;
};

// True when the field is stored in its owner's tag: not hidden and not an
// InOut parameter.
[[nodiscard]] auto OccupiesStorage(const FieldDescriptor& field) -> bool;

}  // namespace tagpack::catalog
