#include "commands.hpp"

#include <argparse/argparse.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <ios>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/strings/str_join.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "print.hpp"
#include "session.hpp"
#include "tagpack/catalog/type_catalog.hpp"
#include "tagpack/codec/binary_codec.hpp"
#include "tagpack/codec/field_value.hpp"
#include "tagpack/codec/image_text.hpp"
#include "tagpack/layout/layout.hpp"
#include "tagpack/synth/default_literal.hpp"

namespace tagpack::driver {

namespace fs = std::filesystem;

namespace {

void AddPadFlag(argparse::ArgumentParser& cmd) {
  cmd.add_argument("--pad-to-word")
      .default_value(false)
      .implicit_value(true)
      .help("Round the total size up to a whole 32-bit word");
}

void AddImageFlags(argparse::ArgumentParser& cmd) {
  cmd.add_argument("--image").help("Binary image as hex text");
  cmd.add_argument("--image-file").help("Binary image file");
}

auto ReadImageFile(const fs::path& path) -> std::optional<codec::BinaryImage> {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    PrintError(fmt::format("cannot open image file '{}'", path.string()));
    return std::nullopt;
  }
  return codec::BinaryImage(
      std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// nullopt after printing the error; an empty image when neither flag is
// given and `required` is false.
auto ReadImage(const argparse::ArgumentParser& cmd, bool required)
    -> std::optional<codec::BinaryImage> {
  auto hex = cmd.present<std::string>("--image");
  auto file = cmd.present<std::string>("--image-file");
  if (hex && file) {
    PrintError("--image and --image-file are mutually exclusive");
    return std::nullopt;
  }
  if (hex) {
    auto image = codec::ParseHexImage(*hex);
    if (!image) {
      PrintCodecError(image.error());
      return std::nullopt;
    }
    return std::move(*image);
  }
  if (file) {
    return ReadImageFile(*file);
  }
  if (required) {
    PrintError("one of --image or --image-file is required");
    return std::nullopt;
  }
  return codec::BinaryImage{};
}

auto BuildLayout(const argparse::ArgumentParser& cmd, Session& session)
    -> std::optional<layout::Layout> {
  if (cmd.get<bool>("--pad-to-word")) {
    session.config.layout.pad_to_word = true;
  }
  auto layout = layout::AssignTypeLayout(
      session.catalog, cmd.get<std::string>("--type"), session.config.layout);
  if (!layout) {
    PrintCodecError(layout.error());
    return std::nullopt;
  }
  return std::move(*layout);
}

// "Path=value" -> parsed value for the field at Path.
auto ParseAssignment(const layout::Layout& layout, std::string_view text)
    -> Result<std::pair<std::string, codec::FieldValue>> {
  auto eq = text.find('=');
  if (eq == std::string_view::npos) {
    return std::unexpected(
        CodecError::MalformedValue(
            std::string(text), "expected path=value"));
  }
  std::string path(text.substr(0, eq));
  const layout::PlacedField* field = layout.Find(path);
  if (field == nullptr) {
    return std::unexpected(CodecError::FieldNotFound(path));
  }
  auto value = codec::ParseValue(field->kind, text.substr(eq + 1));
  if (!value) {
    return std::unexpected(value.error());
  }
  return std::pair{std::move(path), std::move(*value)};
}

}  // namespace

void AddLayoutFlags(argparse::ArgumentParser& cmd) {
  AddSessionFlags(cmd);
  AddPadFlag(cmd);
}

void AddDecodeFlags(argparse::ArgumentParser& cmd) {
  AddSessionFlags(cmd);
  AddPadFlag(cmd);
  AddImageFlags(cmd);
}

void AddEncodeFlags(argparse::ArgumentParser& cmd) {
  AddSessionFlags(cmd);
  AddPadFlag(cmd);
  AddImageFlags(cmd);
  cmd.add_argument("--set")
      .append()
      .required()
      .help("Field update path=value (repeatable)");
  cmd.add_argument("-o", "--output").help("Write the new image to a file");
}

void AddDefaultFlags(argparse::ArgumentParser& cmd) {
  AddSessionFlags(cmd);
  cmd.add_argument("--dimension")
      .default_value(0)
      .scan<'i', int>()
      .help("Array length of the tag (0 = scalar)");
  cmd.add_argument("--real-format").help("REAL zero literal: decimal|exponent");
}

auto LayoutCommand(const argparse::ArgumentParser& cmd, int verbosity)
    -> int {
  auto session = OpenSession(cmd, verbosity);
  if (!session) {
    return 1;
  }
  auto layout = BuildLayout(cmd, *session);
  if (!layout) {
    return 1;
  }
  fmt::print("{}", layout::FormatLayout(*layout));
  auto inputs = layout::InputFieldNames(*layout);
  if (!inputs.empty()) {
    fmt::print("inputs: {}\n", absl::StrJoin(inputs, ", "));
  }
  return 0;
}

auto DecodeCommand(const argparse::ArgumentParser& cmd, int verbosity)
    -> int {
  auto session = OpenSession(cmd, verbosity);
  if (!session) {
    return 1;
  }
  auto layout = BuildLayout(cmd, *session);
  if (!layout) {
    return 1;
  }
  auto image = ReadImage(cmd, true);
  if (!image) {
    return 1;
  }
  auto values = codec::Decode(*layout, *image);
  if (!values) {
    PrintCodecError(values.error());
    return 1;
  }
  for (const auto& field : layout->fields) {
    fmt::print(
        "{} = {}\n", field.path, codec::FormatValue(values->at(field.path)));
  }
  return 0;
}

auto EncodeCommand(const argparse::ArgumentParser& cmd, int verbosity)
    -> int {
  auto session = OpenSession(cmd, verbosity);
  if (!session) {
    return 1;
  }
  auto layout = BuildLayout(cmd, *session);
  if (!layout) {
    return 1;
  }
  auto image = ReadImage(cmd, false);
  if (!image) {
    return 1;
  }

  codec::FieldValues updates;
  for (const auto& text : cmd.get<std::vector<std::string>>("--set")) {
    auto assignment = ParseAssignment(*layout, text);
    if (!assignment) {
      PrintCodecError(assignment.error());
      return 1;
    }
    updates.insert_or_assign(
        std::move(assignment->first), std::move(assignment->second));
  }

  auto encoded = codec::Encode(*layout, *image, updates);
  if (!encoded) {
    PrintCodecError(encoded.error());
    return 1;
  }

  // Read every updated field back before reporting success.
  int mismatches = 0;
  for (const auto& [path, expected] : updates) {
    auto actual = codec::DecodeField(*layout, *encoded, path);
    if (!actual) {
      PrintCodecError(actual.error());
      return 1;
    }
    if (codec::FormatValue(*actual) != codec::FormatValue(expected)) {
      PrintError(
          fmt::format(
              "verification failed for {}: wrote {}, read {}", path,
              codec::FormatValue(expected), codec::FormatValue(*actual)));
      ++mismatches;
    }
  }
  if (mismatches > 0) {
    return 1;
  }
  spdlog::info("verified {} updated fields", updates.size());

  if (auto output = cmd.present<std::string>("--output")) {
    std::ofstream out(*output, std::ios::binary);
    out.write(
        reinterpret_cast<const char*>(encoded->data()),
        static_cast<std::streamsize>(encoded->size()));
    if (!out) {
      PrintError(fmt::format("cannot write image file '{}'", *output));
      return 1;
    }
  }
  fmt::print("{}\n", codec::FormatHexImage(*encoded));
  return 0;
}

auto DefaultCommand(const argparse::ArgumentParser& cmd, int verbosity)
    -> int {
  auto session = OpenSession(cmd, verbosity);
  if (!session) {
    return 1;
  }
  synth::SynthesisOptions options = session->config.Synthesis();
  if (auto format = cmd.present<std::string>("--real-format")) {
    if (*format == "decimal") {
      options.real_format = synth::RealLiteralFormat::kDecimal;
    } else if (*format == "exponent") {
      options.real_format = synth::RealLiteralFormat::kExponent;
    } else {
      PrintError(
          fmt::format(
              "unknown real format '{}', use 'decimal' or 'exponent'",
              *format));
      return 1;
    }
  }

  int dimension = cmd.get<int>("--dimension");
  if (dimension < 0) {
    PrintError("--dimension must not be negative");
    return 1;
  }
  auto type_name = cmd.get<std::string>("--type");
  catalog::FieldDescriptor tag{
      .name = type_name,
      .type_name = type_name,
      .array_length = static_cast<uint32_t>(dimension)};
  auto literal = synth::SynthesizeMemberDefault(
      session->catalog, tag, options, 0);
  if (!literal) {
    PrintCodecError(literal.error());
    return 1;
  }
  fmt::print("{}\n", *literal);
  return 0;
}

}  // namespace tagpack::driver
