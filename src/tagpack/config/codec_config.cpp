#include "tagpack/config/codec_config.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include <absl/strings/ascii.h>
#include <fmt/core.h>
#include <spdlog/common.h>
#include <toml++/toml.hpp>

namespace tagpack::config {

namespace fs = std::filesystem;

namespace {

auto ParseRealFormat(std::string_view text)
    -> std::optional<synth::RealLiteralFormat> {
  std::string lower = absl::AsciiStrToLower(text);
  if (lower == "decimal") {
    return synth::RealLiteralFormat::kDecimal;
  }
  if (lower == "exponent") {
    return synth::RealLiteralFormat::kExponent;
  }
  return std::nullopt;
}

auto ParseLogLevel(std::string_view text)
    -> std::optional<spdlog::level::level_enum> {
  std::string lower = absl::AsciiStrToLower(text);
  if (lower == "trace") {
    return spdlog::level::trace;
  }
  if (lower == "debug") {
    return spdlog::level::debug;
  }
  if (lower == "info") {
    return spdlog::level::info;
  }
  if (lower == "warn" || lower == "warning") {
    return spdlog::level::warn;
  }
  if (lower == "error") {
    return spdlog::level::err;
  }
  if (lower == "off") {
    return spdlog::level::off;
  }
  return std::nullopt;
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path)
    -> std::expected<CodecConfig, std::string> {
  std::ifstream in(config_path);
  if (!in) {
    return std::unexpected(
        fmt::format("cannot open {}", config_path.string()));
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return ParseConfig(
      buffer.str(), config_path.parent_path(), config_path.string());
}

auto ParseConfig(
    std::string_view text, const fs::path& root_dir,
    std::string_view source_name) -> std::expected<CodecConfig, std::string> {
  CodecConfig config;
  config.root_dir = root_dir;

  toml::table tbl;
  try {
    tbl = toml::parse(text, source_name);
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        fmt::format(
            "failed to parse {}: {}", source_name, e.description()));
  }

  // [catalog] section
  if (auto catalog = tbl["catalog"]) {
    auto* files_arr = catalog["files"].as_array();
    if (catalog["files"] && files_arr == nullptr) {
      return std::unexpected(
          fmt::format("{}: 'catalog.files' must be an array", source_name));
    }
    if (files_arr != nullptr) {
      for (const auto& elem : *files_arr) {
        auto str = elem.value<std::string>();
        if (!str) {
          return std::unexpected(
              fmt::format(
                  "{}: 'catalog.files' entries must be strings",
                  source_name));
        }
        // Resolve relative paths against config directory
        fs::path file_path = *str;
        if (file_path.is_relative()) {
          file_path = config.root_dir / file_path;
        }
        config.catalog_files.push_back(file_path);
      }
    }
  }

  // [layout] section
  if (auto layout = tbl["layout"]) {
    if (layout["pad_to_word"]) {
      auto pad = layout["pad_to_word"].value_exact<bool>();
      if (!pad) {
        return std::unexpected(
            fmt::format(
                "{}: 'layout.pad_to_word' must be a boolean", source_name));
      }
      config.layout.pad_to_word = *pad;
    }
    if (layout["max_nesting_depth"]) {
      auto depth = layout["max_nesting_depth"].value_exact<int64_t>();
      if (!depth || *depth < 1 || *depth > kMaxConfigurableDepth) {
        return std::unexpected(
            fmt::format(
                "{}: 'layout.max_nesting_depth' must be an integer in "
                "1..{}",
                source_name, kMaxConfigurableDepth));
      }
      config.layout.max_nesting_depth = static_cast<int>(*depth);
    }
  }

  // [literal] section
  if (auto literal = tbl["literal"]) {
    if (literal["real_format"]) {
      auto text_value = literal["real_format"].value<std::string>();
      auto format =
          text_value ? ParseRealFormat(*text_value) : std::nullopt;
      if (!format) {
        return std::unexpected(
            fmt::format(
                "{}: 'literal.real_format' must be \"decimal\" or "
                "\"exponent\"",
                source_name));
      }
      config.real_format = *format;
    }
  }

  // [log] section
  if (auto log = tbl["log"]) {
    if (log["level"]) {
      auto text_value = log["level"].value<std::string>();
      auto level = text_value ? ParseLogLevel(*text_value) : std::nullopt;
      if (!level) {
        return std::unexpected(
            fmt::format(
                "{}: 'log.level' must be one of trace, debug, info, warn, "
                "error, off",
                source_name));
      }
      config.log_level = *level;
    }
  }

  return config;
}

}  // namespace tagpack::config
