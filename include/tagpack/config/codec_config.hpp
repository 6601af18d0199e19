#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/common.h>

#include "tagpack/layout/layout.hpp"
#include "tagpack/synth/default_literal.hpp"

namespace tagpack::config {

inline constexpr std::string_view kConfigFileName = "tagpack.toml";
inline constexpr int kMaxConfigurableDepth = 32;

struct CodecConfig {
  // Metadata files, resolved against root_dir.
  std::vector<std::filesystem::path> catalog_files;
  layout::LayoutOptions layout;
  synth::RealLiteralFormat real_format = synth::RealLiteralFormat::kDecimal;
  spdlog::level::level_enum log_level = spdlog::level::warn;

  // Directory where tagpack.toml was found
  std::filesystem::path root_dir;

  [[nodiscard]] auto Synthesis() const -> synth::SynthesisOptions {
    return synth::SynthesisOptions{
        .real_format = real_format,
        .max_nesting_depth = layout.max_nesting_depth};
  }
};

// Search for tagpack.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse a tagpack.toml file. Every key is optional.
auto LoadConfig(const std::filesystem::path& config_path)
    -> std::expected<CodecConfig, std::string>;

// Parse configuration text; relative catalog paths resolve against
// root_dir. `source_name` prefixes error messages.
auto ParseConfig(
    std::string_view text, const std::filesystem::path& root_dir,
    std::string_view source_name = kConfigFileName)
    -> std::expected<CodecConfig, std::string>;

}  // namespace tagpack::config
