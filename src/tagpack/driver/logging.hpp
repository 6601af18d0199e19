#pragma once

#include <spdlog/common.h>

namespace tagpack::driver {

// Installs the default stderr logger: "[tagpack][HH:MM:SS][level] message".
// stdout stays reserved for command results.
void ConfigureLogging(spdlog::level::level_enum level);

// -v -> debug, -vv and beyond -> trace.
auto LevelForVerbosity(int verbosity) -> spdlog::level::level_enum;

}  // namespace tagpack::driver
