#pragma once

#include <stdexcept>
#include <string>

#include <fmt/core.h>

namespace tagpack::common {

// Exception type for internal tagpack errors (invariant violations, not
// malformed input). Input problems are reported through tagpack::Result.
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            fmt::format(
                "Internal error in {}: {}\n"
                "This is a bug in tagpack.",
                context, detail)) {
  }
};

[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace tagpack::common
