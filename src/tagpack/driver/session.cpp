#include "session.hpp"

#include <argparse/argparse.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "print.hpp"
#include "tagpack/catalog/metadata_reader.hpp"
#include "tagpack/config/codec_config.hpp"

namespace tagpack::driver {

namespace fs = std::filesystem;

namespace {

auto LoadOptionalConfig() -> std::optional<config::CodecConfig> {
  auto config_path = config::FindConfig();
  if (!config_path) {
    return config::CodecConfig{};
  }
  spdlog::debug("using {}", config_path->string());
  auto loaded = config::LoadConfig(*config_path);
  if (!loaded) {
    PrintError(loaded.error());
    return std::nullopt;
  }
  return std::move(*loaded);
}

}  // namespace

void AddSessionFlags(argparse::ArgumentParser& cmd) {
  cmd.add_argument("--catalog")
      .append()
      .help("YAML type metadata file (repeatable, merged with tagpack.toml)");
  cmd.add_argument("--type").required().help("Root type name");
  cmd.add_argument("--max-depth")
      .scan<'i', int>()
      .help("Maximum composite nesting depth");
}

auto OpenSession(const argparse::ArgumentParser& cmd, int verbosity)
    -> std::optional<Session> {
  auto config = LoadOptionalConfig();
  if (!config) {
    return std::nullopt;
  }
  if (verbosity == 0) {
    spdlog::set_level(config->log_level);
  }

  // Catalog files: config + CLI merged
  if (auto files = cmd.present<std::vector<std::string>>("--catalog")) {
    for (const auto& file : *files) {
      config->catalog_files.push_back(fs::absolute(file));
    }
  }
  // Depth: CLI overrides config (scalar)
  if (auto depth = cmd.present<int>("--max-depth")) {
    if (*depth < 1 || *depth > config::kMaxConfigurableDepth) {
      PrintError(
          fmt::format(
              "--max-depth must be in 1..{}", config::kMaxConfigurableDepth));
      return std::nullopt;
    }
    config->layout.max_nesting_depth = *depth;
  }

  if (config->catalog_files.empty()) {
    PrintWarning("no catalog files; only built-in types are available");
  }
  auto catalog = catalog::LoadCatalog(config->catalog_files);
  if (!catalog) {
    PrintCodecError(catalog.error());
    return std::nullopt;
  }
  spdlog::debug(
      "catalog: {} types from {} files", catalog->Size(),
      config->catalog_files.size());
  return Session{
      .config = std::move(*config), .catalog = std::move(*catalog)};
}

}  // namespace tagpack::driver
