#include "tagpack/codec/binary_codec.hpp"

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "tagpack/catalog/atomic_kind.hpp"
#include "tagpack/common/internal_error.hpp"
#include "tagpack/layout/layout.hpp"

namespace tagpack::codec {

namespace {

using catalog::AtomicKind;
using layout::Layout;
using layout::PlacedField;

// Images are little-endian regardless of host byte order.
auto LoadLittleEndian(
    std::span<const uint8_t> image, uint32_t offset, uint32_t size)
    -> uint64_t {
  uint64_t value = 0;
  for (uint32_t i = 0; i < size; ++i) {
    value |= static_cast<uint64_t>(image[offset + i]) << (8 * i);
  }
  return value;
}

void StoreLittleEndian(
    std::span<uint8_t> image, uint32_t offset, uint32_t size, uint64_t value) {
  for (uint32_t i = 0; i < size; ++i) {
    image[offset + i] = static_cast<uint8_t>(value >> (8 * i));
  }
}

auto SignExtend(uint64_t bits, uint32_t width) -> int64_t {
  if (width < 64 && ((bits >> (width - 1)) & 1U) != 0) {
    bits |= ~((uint64_t{1} << width) - 1);
  }
  return static_cast<int64_t>(bits);
}

auto CheckImageSize(const Layout& layout, size_t actual) -> Result<void> {
  if (actual < layout.total_byte_size) {
    return std::unexpected(
        CodecError::ImageSize(layout.total_byte_size, actual));
  }
  return {};
}

auto ReadField(const PlacedField& field, std::span<const uint8_t> image)
    -> FieldValue {
  uint64_t raw = LoadLittleEndian(image, field.byte_offset, field.byte_size);
  switch (field.kind) {
    case AtomicKind::kBool:
      return ((raw >> *field.bit_offset) & 1U) != 0;
    case AtomicKind::kSint8:
    case AtomicKind::kInt16:
    case AtomicKind::kDint32:
    case AtomicKind::kLint64:
      return SignExtend(raw, field.byte_size * 8);
    case AtomicKind::kReal32:
      return static_cast<double>(
          std::bit_cast<float>(static_cast<uint32_t>(raw)));
    case AtomicKind::kStr:
      break;
  }
  common::ThrowInternalError(
      "ReadField", fmt::format("field '{}' has no binary form", field.path));
}

// A value checked against its field, ready to be written.
struct PendingWrite {
  const PlacedField* field;
  uint64_t bits;
};

auto RangeError(const PlacedField& field, std::string detail) -> CodecError {
  return CodecError::ValueRange(
      field.path, field.byte_offset, std::move(detail));
}

auto PrepareBool(const PlacedField& field, const FieldValue& value)
    -> Result<PendingWrite> {
  if (const auto* flag = std::get_if<bool>(&value)) {
    return PendingWrite{&field, *flag ? 1U : 0U};
  }
  if (const auto* integer = std::get_if<int64_t>(&value)) {
    if (*integer == 0 || *integer == 1) {
      return PendingWrite{&field, static_cast<uint64_t>(*integer)};
    }
  }
  return std::unexpected(
      RangeError(
          field, fmt::format("BOOL expects 0 or 1, got {}",
                             FormatValue(value))));
}

auto PrepareInteger(const PlacedField& field, const FieldValue& value)
    -> Result<PendingWrite> {
  int64_t min = catalog::MinValue(field.kind);
  int64_t max = catalog::MaxValue(field.kind);
  auto out_of_range = [&] {
    return std::unexpected(
        RangeError(
            field, fmt::format(
                       "{} range is [{}, {}], got {}",
                       catalog::ToString(field.kind), min, max,
                       FormatValue(value))));
  };

  int64_t integer = 0;
  if (const auto* flag = std::get_if<bool>(&value)) {
    integer = *flag ? 1 : 0;
  } else if (const auto* whole = std::get_if<int64_t>(&value)) {
    integer = *whole;
  } else {
    double real = std::get<double>(value);
    // 2^63 is the first double outside int64.
    if (!std::isfinite(real) || std::trunc(real) != real ||
        real < -9223372036854775808.0 || real >= 9223372036854775808.0) {
      return out_of_range();
    }
    integer = static_cast<int64_t>(real);
  }
  if (integer < min || integer > max) {
    return out_of_range();
  }
  return PendingWrite{&field, static_cast<uint64_t>(integer)};
}

auto PrepareReal(const PlacedField& field, const FieldValue& value)
    -> Result<PendingWrite> {
  double real = 0.0;
  if (const auto* integer = std::get_if<int64_t>(&value)) {
    real = static_cast<double>(*integer);
  } else if (const auto* number = std::get_if<double>(&value)) {
    real = *number;
  } else {
    return std::unexpected(RangeError(field, "REAL expects a number"));
  }
  if (std::isfinite(real) &&
      std::fabs(real) > std::numeric_limits<float>::max()) {
    return std::unexpected(
        RangeError(
            field, fmt::format(
                       "{} exceeds single precision", FormatValue(value))));
  }
  auto narrowed = static_cast<float>(real);
  if (std::isfinite(real) && static_cast<double>(narrowed) != real) {
    return std::unexpected(
        RangeError(
            field,
            fmt::format(
                "{:.17g} is not representable in single precision, "
                "nearest is {}",
                real, narrowed)));
  }
  return PendingWrite{&field, std::bit_cast<uint32_t>(narrowed)};
}

auto PrepareWrite(const PlacedField& field, const FieldValue& value)
    -> Result<PendingWrite> {
  switch (field.kind) {
    case AtomicKind::kBool:
      return PrepareBool(field, value);
    case AtomicKind::kSint8:
    case AtomicKind::kInt16:
    case AtomicKind::kDint32:
    case AtomicKind::kLint64:
      return PrepareInteger(field, value);
    case AtomicKind::kReal32:
      return PrepareReal(field, value);
    case AtomicKind::kStr:
      break;
  }
  return std::unexpected(
      CodecError::UnsupportedType(
          field.descriptor.type_name, "no binary value representation"));
}

void ApplyWrite(const PendingWrite& write, std::span<uint8_t> image) {
  const PlacedField& field = *write.field;
  if (field.kind == AtomicKind::kBool) {
    // Only the field's bit changes; sibling flags in the word are kept.
    uint64_t word = LoadLittleEndian(image, field.byte_offset, 4);
    uint64_t mask = uint64_t{1} << *field.bit_offset;
    word = write.bits != 0 ? (word | mask) : (word & ~mask);
    StoreLittleEndian(image, field.byte_offset, 4, word);
    return;
  }
  StoreLittleEndian(image, field.byte_offset, field.byte_size, write.bits);
}

}  // namespace

auto Decode(const Layout& layout, std::span<const uint8_t> image)
    -> Result<FieldValues> {
  if (auto size_ok = CheckImageSize(layout, image.size()); !size_ok) {
    return std::unexpected(size_ok.error());
  }
  FieldValues values;
  values.reserve(layout.fields.size());
  for (const auto& field : layout.fields) {
    values.emplace(field.path, ReadField(field, image));
  }
  spdlog::debug(
      "decoded {} fields from {} bytes", values.size(), image.size());
  return values;
}

auto DecodeField(
    const Layout& layout, std::span<const uint8_t> image,
    std::string_view path) -> Result<FieldValue> {
  const PlacedField* field = layout.Find(path);
  if (field == nullptr) {
    return std::unexpected(CodecError::FieldNotFound(std::string(path)));
  }
  if (auto size_ok = CheckImageSize(layout, image.size()); !size_ok) {
    return std::unexpected(size_ok.error());
  }
  return ReadField(*field, image);
}

auto Encode(
    const Layout& layout, std::span<const uint8_t> image,
    const FieldValues& updates) -> Result<BinaryImage> {
  BinaryImage result;
  if (image.empty()) {
    result.assign(layout.total_byte_size, 0);
  } else {
    if (auto size_ok = CheckImageSize(layout, image.size()); !size_ok) {
      return std::unexpected(size_ok.error());
    }
    result.assign(image.begin(), image.end());
  }

  // Sorted so the reported error does not depend on hash order.
  std::vector<std::string_view> paths;
  paths.reserve(updates.size());
  for (const auto& [path, value] : updates) {
    paths.emplace_back(path);
  }
  std::ranges::sort(paths);

  std::vector<PendingWrite> writes;
  writes.reserve(paths.size());
  for (std::string_view path : paths) {
    const PlacedField* field = layout.Find(path);
    if (field == nullptr) {
      return std::unexpected(CodecError::FieldNotFound(std::string(path)));
    }
    auto write = PrepareWrite(*field, updates.at(path));
    if (!write) {
      return std::unexpected(write.error());
    }
    writes.push_back(*write);
  }

  for (const auto& write : writes) {
    ApplyWrite(write, result);
  }
  spdlog::debug(
      "encoded {} fields into {} bytes", writes.size(), result.size());
  return result;
}

auto EncodeField(
    const Layout& layout, std::span<uint8_t> image, std::string_view path,
    const FieldValue& value) -> Result<void> {
  const PlacedField* field = layout.Find(path);
  if (field == nullptr) {
    return std::unexpected(CodecError::FieldNotFound(std::string(path)));
  }
  if (auto size_ok = CheckImageSize(layout, image.size()); !size_ok) {
    return size_ok;
  }
  auto write = PrepareWrite(*field, value);
  if (!write) {
    return std::unexpected(write.error());
  }
  ApplyWrite(*write, image);
  spdlog::trace(
      "wrote {} at byte {} ({})", field->path, field->byte_offset,
      FormatValue(value));
  return {};
}

}  // namespace tagpack::codec
