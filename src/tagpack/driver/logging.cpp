#include "logging.hpp"

#include <memory>
#include <utility>

#include <spdlog/common.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace tagpack::driver {

void ConfigureLogging(spdlog::level::level_enum level) {
  auto logger = spdlog::stderr_color_mt("tagpack");
  logger->set_pattern("[tagpack][%H:%M:%S][%l] %v");
  spdlog::set_default_logger(std::move(logger));
  spdlog::set_level(level);
}

auto LevelForVerbosity(int verbosity) -> spdlog::level::level_enum {
  if (verbosity <= 0) {
    return spdlog::level::warn;
  }
  if (verbosity == 1) {
    return spdlog::level::debug;
  }
  return spdlog::level::trace;
}

}  // namespace tagpack::driver
