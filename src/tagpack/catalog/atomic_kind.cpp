#include "tagpack/catalog/atomic_kind.hpp"

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

#include <absl/strings/ascii.h>

#include "tagpack/common/internal_error.hpp"

namespace tagpack::catalog {

auto ByteWidth(AtomicKind kind) -> uint32_t {
  switch (kind) {
    case AtomicKind::kSint8:
      return 1;
    case AtomicKind::kInt16:
      return 2;
    case AtomicKind::kBool:
    case AtomicKind::kDint32:
    case AtomicKind::kReal32:
      return 4;
    case AtomicKind::kLint64:
      return 8;
    case AtomicKind::kStr:
      return 0;
  }
  return 0;
}

auto Alignment(AtomicKind kind) -> uint32_t {
  if (kind == AtomicKind::kStr) {
    return 1;
  }
  return ByteWidth(kind);
}

auto MinValue(AtomicKind kind) -> int64_t {
  switch (kind) {
    case AtomicKind::kSint8:
      return std::numeric_limits<int8_t>::min();
    case AtomicKind::kInt16:
      return std::numeric_limits<int16_t>::min();
    case AtomicKind::kDint32:
      return std::numeric_limits<int32_t>::min();
    case AtomicKind::kLint64:
      return std::numeric_limits<int64_t>::min();
    default:
      common::ThrowInternalError(
          "MinValue", std::string("not an integer kind: ") + ToString(kind));
  }
}

auto MaxValue(AtomicKind kind) -> int64_t {
  switch (kind) {
    case AtomicKind::kSint8:
      return std::numeric_limits<int8_t>::max();
    case AtomicKind::kInt16:
      return std::numeric_limits<int16_t>::max();
    case AtomicKind::kDint32:
      return std::numeric_limits<int32_t>::max();
    case AtomicKind::kLint64:
      return std::numeric_limits<int64_t>::max();
    default:
      common::ThrowInternalError(
          "MaxValue", std::string("not an integer kind: ") + ToString(kind));
  }
}

auto ToString(AtomicKind kind) -> const char* {
  switch (kind) {
    case AtomicKind::kBool:
      return "BOOL";
    case AtomicKind::kSint8:
      return "SINT";
    case AtomicKind::kInt16:
      return "INT";
    case AtomicKind::kDint32:
      return "DINT";
    case AtomicKind::kLint64:
      return "LINT";
    case AtomicKind::kReal32:
      return "REAL";
    case AtomicKind::kStr:
      return "STRING";
  }
  return "UNKNOWN";
}

auto ParseAtomicKind(std::string_view name) -> std::optional<AtomicKind> {
  std::string upper = absl::AsciiStrToUpper(name);
  if (upper == "BOOL" || upper == "BIT") {
    return AtomicKind::kBool;
  }
  if (upper == "SINT") {
    return AtomicKind::kSint8;
  }
  if (upper == "INT") {
    return AtomicKind::kInt16;
  }
  if (upper == "DINT") {
    return AtomicKind::kDint32;
  }
  if (upper == "LINT") {
    return AtomicKind::kLint64;
  }
  if (upper == "REAL") {
    return AtomicKind::kReal32;
  }
  if (upper == "STRING") {
    return AtomicKind::kStr;
  }
  return std::nullopt;
}

}  // namespace tagpack::catalog
