#include "tagpack/common/error.hpp"

#include <string>
#include <utility>

#include <fmt/core.h>

namespace tagpack {

auto CodecError::TypeNotFound(std::string type_name) -> CodecError {
  return CodecError{
      .kind = ErrorKind::kTypeNotFound,
      .subject = std::move(type_name),
      .byte_offset = std::nullopt,
      .depth = std::nullopt,
      .detail = "no such type in the catalog"};
}

auto CodecError::UnsupportedType(std::string type_name, std::string detail)
    -> CodecError {
  return CodecError{
      .kind = ErrorKind::kUnsupportedType,
      .subject = std::move(type_name),
      .byte_offset = std::nullopt,
      .depth = std::nullopt,
      .detail = std::move(detail)};
}

auto CodecError::MalformedDimension(std::string field_name, std::string text)
    -> CodecError {
  return CodecError{
      .kind = ErrorKind::kMalformedDimension,
      .subject = std::move(field_name),
      .byte_offset = std::nullopt,
      .depth = std::nullopt,
      .detail = fmt::format(
          "dimension '{}' is not a non-negative integer", text)};
}

auto CodecError::FieldNotFound(std::string path) -> CodecError {
  return CodecError{
      .kind = ErrorKind::kFieldNotFound,
      .subject = std::move(path),
      .byte_offset = std::nullopt,
      .depth = std::nullopt,
      .detail = "no such field in the layout"};
}

auto CodecError::ValueRange(
    std::string subject, std::optional<uint32_t> byte_offset,
    std::string detail) -> CodecError {
  return CodecError{
      .kind = ErrorKind::kValueRange,
      .subject = std::move(subject),
      .byte_offset = byte_offset,
      .depth = std::nullopt,
      .detail = std::move(detail)};
}

auto CodecError::MaxNestingDepthExceeded(std::string type_name, int depth)
    -> CodecError {
  return CodecError{
      .kind = ErrorKind::kMaxNestingDepthExceeded,
      .subject = std::move(type_name),
      .byte_offset = std::nullopt,
      .depth = depth,
      .detail = fmt::format("composite nesting reached depth {}", depth)};
}

auto CodecError::ImageSize(size_t required, size_t actual) -> CodecError {
  return CodecError{
      .kind = ErrorKind::kImageSize,
      .subject = "image",
      .byte_offset = std::nullopt,
      .depth = std::nullopt,
      .detail = fmt::format(
          "image holds {} bytes, layout needs {}", actual, required)};
}

auto CodecError::MalformedValue(std::string text, std::string detail)
    -> CodecError {
  return CodecError{
      .kind = ErrorKind::kMalformedValue,
      .subject = std::move(text),
      .byte_offset = std::nullopt,
      .depth = std::nullopt,
      .detail = std::move(detail)};
}

auto CodecError::DuplicateName(std::string name, std::string scope)
    -> CodecError {
  return CodecError{
      .kind = ErrorKind::kDuplicateName,
      .subject = std::move(name),
      .byte_offset = std::nullopt,
      .depth = std::nullopt,
      .detail = fmt::format("declared more than once in {}", scope)};
}

auto CodecError::Message() const -> std::string {
  std::string context;
  if (byte_offset) {
    context = fmt::format(" (byte offset {})", *byte_offset);
  } else if (depth) {
    context = fmt::format(" (depth {})", *depth);
  }
  return fmt::format(
      "{}: '{}'{}: {}", ToString(kind), subject, context, detail);
}

auto ToString(ErrorKind kind) -> const char* {
  switch (kind) {
    case ErrorKind::kTypeNotFound:
      return "TypeNotFoundError";
    case ErrorKind::kUnsupportedType:
      return "UnsupportedTypeError";
    case ErrorKind::kMalformedDimension:
      return "MalformedDimensionError";
    case ErrorKind::kFieldNotFound:
      return "FieldNotFoundError";
    case ErrorKind::kValueRange:
      return "ValueRangeError";
    case ErrorKind::kMaxNestingDepthExceeded:
      return "MaxNestingDepthExceededError";
    case ErrorKind::kImageSize:
      return "ImageSizeError";
    case ErrorKind::kMalformedValue:
      return "MalformedValueError";
    case ErrorKind::kDuplicateName:
      return "DuplicateNameError";
  }
  return "UnknownError";
}

}  // namespace tagpack
