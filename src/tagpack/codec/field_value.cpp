#include "tagpack/codec/field_value.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <expected>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>

#include <absl/strings/ascii.h>
#include <absl/strings/str_replace.h>
#include <fmt/core.h>

#include "tagpack/catalog/atomic_kind.hpp"

namespace tagpack::codec {

namespace {

using catalog::AtomicKind;

auto ParseBool(std::string_view text) -> Result<FieldValue> {
  std::string lower = absl::AsciiStrToLower(text);
  if (lower == "1" || lower == "true") {
    return FieldValue{true};
  }
  if (lower == "0" || lower == "false") {
    return FieldValue{false};
  }
  return std::unexpected(
      CodecError::MalformedValue(
          std::string(text), "BOOL expects 0, 1, true or false"));
}

// Radix literal such as 16#FF_FF. The digits are the field's bit pattern.
auto ParseRadixInteger(AtomicKind kind, std::string_view text, size_t hash)
    -> Result<FieldValue> {
  int base = 0;
  auto prefix = text.substr(0, hash);
  if (prefix == "2") {
    base = 2;
  } else if (prefix == "8") {
    base = 8;
  } else if (prefix == "16") {
    base = 16;
  } else {
    return std::unexpected(
        CodecError::MalformedValue(
            std::string(text), "radix must be 2#, 8# or 16#"));
  }

  std::string digits = absl::StrReplaceAll(text.substr(hash + 1), {{"_", ""}});
  uint64_t bits = 0;
  const char* end = digits.data() + digits.size();
  auto [ptr, ec] = std::from_chars(digits.data(), end, bits, base);
  if (digits.empty() || ptr != end ||
      (ec != std::errc{} && ec != std::errc::result_out_of_range)) {
    return std::unexpected(
        CodecError::MalformedValue(
            std::string(text), fmt::format("invalid base-{} digits", base)));
  }

  uint32_t width = catalog::ByteWidth(kind) * 8;
  if (ec == std::errc::result_out_of_range ||
      (width < 64 && (bits >> width) != 0)) {
    return std::unexpected(
        CodecError::ValueRange(
            std::string(text), std::nullopt,
            fmt::format("does not fit in {} bits", width)));
  }
  // Sign-extend the field-width pattern.
  if (width < 64 && ((bits >> (width - 1)) & 1U) != 0) {
    bits |= ~((uint64_t{1} << width) - 1);
  }
  return FieldValue{static_cast<int64_t>(bits)};
}

auto ParseInteger(AtomicKind kind, std::string_view text)
    -> Result<FieldValue> {
  if (auto hash = text.find('#'); hash != std::string_view::npos) {
    return ParseRadixInteger(kind, text, hash);
  }
  if (text.starts_with('+')) {
    text.remove_prefix(1);
    if (text.starts_with('+') || text.starts_with('-')) {
      return std::unexpected(
          CodecError::MalformedValue(
              std::string(text), "sign follows a leading '+'"));
    }
  }
  int64_t value = 0;
  const char* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (text.empty() || ptr != end ||
      (ec != std::errc{} && ec != std::errc::result_out_of_range)) {
    return std::unexpected(
        CodecError::MalformedValue(
            std::string(text),
            fmt::format("{} expects an integer", catalog::ToString(kind))));
  }
  if (ec == std::errc::result_out_of_range ||
      value < catalog::MinValue(kind) || value > catalog::MaxValue(kind)) {
    return std::unexpected(
        CodecError::ValueRange(
            std::string(text), std::nullopt,
            fmt::format(
                "{} range is [{}, {}]", catalog::ToString(kind),
                catalog::MinValue(kind), catalog::MaxValue(kind))));
  }
  return FieldValue{value};
}

auto ParseReal(std::string_view text) -> Result<FieldValue> {
  if (text.starts_with('+')) {
    text.remove_prefix(1);
    if (text.starts_with('+') || text.starts_with('-')) {
      return std::unexpected(
          CodecError::MalformedValue(
              std::string(text), "sign follows a leading '+'"));
    }
  }
  double value = 0.0;
  const char* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (text.empty() || ptr != end ||
      (ec != std::errc{} && ec != std::errc::result_out_of_range)) {
    return std::unexpected(
        CodecError::MalformedValue(
            std::string(text), "REAL expects a floating-point number"));
  }
  if (ec == std::errc::result_out_of_range ||
      (std::isfinite(value) &&
       std::fabs(value) > std::numeric_limits<float>::max())) {
    return std::unexpected(
        CodecError::ValueRange(
            std::string(text), std::nullopt,
            "magnitude exceeds single precision"));
  }
  return FieldValue{static_cast<double>(static_cast<float>(value))};
}

}  // namespace

auto ParseValue(catalog::AtomicKind kind, std::string_view text)
    -> Result<FieldValue> {
  text = absl::StripAsciiWhitespace(text);
  switch (kind) {
    case AtomicKind::kBool:
      return ParseBool(text);
    case AtomicKind::kSint8:
    case AtomicKind::kInt16:
    case AtomicKind::kDint32:
    case AtomicKind::kLint64:
      return ParseInteger(kind, text);
    case AtomicKind::kReal32:
      return ParseReal(text);
    case AtomicKind::kStr:
      break;
  }
  return std::unexpected(
      CodecError::UnsupportedType(
          catalog::ToString(kind), "no binary value representation"));
}

auto FormatValue(const FieldValue& value) -> std::string {
  if (const auto* flag = std::get_if<bool>(&value)) {
    return *flag ? "1" : "0";
  }
  if (const auto* integer = std::get_if<int64_t>(&value)) {
    return fmt::format("{}", *integer);
  }
  return fmt::format("{}", static_cast<float>(std::get<double>(value)));
}

}  // namespace tagpack::codec
