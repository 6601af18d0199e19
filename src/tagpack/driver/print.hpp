#pragma once

#include <string>

#include "tagpack/common/error.hpp"

namespace tagpack::driver {

void PrintError(const std::string& message);
void PrintWarning(const std::string& message);
void PrintCodecError(const CodecError& error);

}  // namespace tagpack::driver
