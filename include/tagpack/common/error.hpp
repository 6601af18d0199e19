#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>

namespace tagpack {

// Failure taxonomy for catalog resolution, layout, codec and synthesis.
// Every kind is local to one type or one field.
enum class ErrorKind {
  kTypeNotFound,             // Type name absent from the catalog
  kUnsupportedType,          // Type has no binary/literal representation
  kMalformedDimension,       // Array dimension text is not a uint
  kFieldNotFound,            // Field path absent from the layout
  kValueRange,               // Value not representable in the field's kind
  kMaxNestingDepthExceeded,  // Composite nesting beyond the configured limit
  kImageSize,                // Binary image shorter than the layout
  kMalformedValue,           // Value text not parseable for its kind
  kDuplicateName,            // Type or member declared twice in one scope
};

struct CodecError {
  ErrorKind kind;
  // Type name or field path the failure is attributed to.
  std::string subject;
  std::optional<uint32_t> byte_offset;
  std::optional<int> depth;
  std::string detail;

  static auto TypeNotFound(std::string type_name) -> CodecError;
  static auto UnsupportedType(std::string type_name, std::string detail)
      -> CodecError;
  static auto MalformedDimension(std::string field_name, std::string text)
      -> CodecError;
  static auto FieldNotFound(std::string path) -> CodecError;
  static auto ValueRange(
      std::string subject, std::optional<uint32_t> byte_offset,
      std::string detail) -> CodecError;
  static auto MaxNestingDepthExceeded(std::string type_name, int depth)
      -> CodecError;
  static auto ImageSize(size_t required, size_t actual) -> CodecError;
  static auto MalformedValue(std::string text, std::string detail)
      -> CodecError;
  static auto DuplicateName(std::string name, std::string scope)
      -> CodecError;

  // One-line message: "<Kind>: <subject> (<context>): <detail>"
  [[nodiscard]] auto Message() const -> std::string;

  auto operator==(const CodecError&) const -> bool = default;
};

template <typename T>
using Result = std::expected<T, CodecError>;

// Stable taxonomy name, e.g. "TypeNotFoundError".
auto ToString(ErrorKind kind) -> const char*;

}  // namespace tagpack
