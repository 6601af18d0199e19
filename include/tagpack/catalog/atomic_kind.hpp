#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace tagpack::catalog {

// Controller primitive types. Str is only meaningful for default literals;
// it has no fixed-width representation inside packed structures.
enum class AtomicKind : uint8_t {
  kBool,
  kSint8,
  kInt16,
  kDint32,
  kLint64,
  kReal32,
  kStr,
};

// Bytes occupied in a binary image. Bool reports its 4-byte host word;
// Str reports 0.
auto ByteWidth(AtomicKind kind) -> uint32_t;

// Alignment requirement in bytes (equal to the width; 1 for Str).
auto Alignment(AtomicKind kind) -> uint32_t;

[[nodiscard]] inline auto IsInteger(AtomicKind kind) -> bool {
  return kind == AtomicKind::kSint8 || kind == AtomicKind::kInt16 ||
         kind == AtomicKind::kDint32 || kind == AtomicKind::kLint64;
}

// Representable range of an integer kind.
auto MinValue(AtomicKind kind) -> int64_t;
auto MaxValue(AtomicKind kind) -> int64_t;

// Controller spelling: BOOL, SINT, INT, DINT, LINT, REAL, STRING.
auto ToString(AtomicKind kind) -> const char*;

// Case-insensitive; accepts BIT as an alias for BOOL.
auto ParseAtomicKind(std::string_view name) -> std::optional<AtomicKind>;

}  // namespace tagpack::catalog
