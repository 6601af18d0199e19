#pragma once

#include <argparse/argparse.hpp>
#include <optional>

#include "tagpack/catalog/type_catalog.hpp"
#include "tagpack/config/codec_config.hpp"

namespace tagpack::driver {

// Everything a subcommand needs: the effective configuration (tagpack.toml
// merged with command-line overrides) and the catalog built from it.
struct Session {
  config::CodecConfig config;
  catalog::TypeCatalog catalog;
};

// Flags shared by every subcommand: --catalog, --type, --max-depth.
void AddSessionFlags(argparse::ArgumentParser& cmd);

// Loads tagpack.toml (if any), applies overrides and builds the catalog.
// Prints the failure and returns nullopt on error. `verbosity` > 0 keeps
// the command-line log level over the configured one.
auto OpenSession(const argparse::ArgumentParser& cmd, int verbosity)
    -> std::optional<Session>;

}  // namespace tagpack::driver
