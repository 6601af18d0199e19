#pragma once

#include <argparse/argparse.hpp>

namespace tagpack::driver {

void AddLayoutFlags(argparse::ArgumentParser& cmd);
void AddDecodeFlags(argparse::ArgumentParser& cmd);
void AddEncodeFlags(argparse::ArgumentParser& cmd);
void AddDefaultFlags(argparse::ArgumentParser& cmd);

auto LayoutCommand(const argparse::ArgumentParser& cmd, int verbosity) -> int;
auto DecodeCommand(const argparse::ArgumentParser& cmd, int verbosity) -> int;
auto EncodeCommand(const argparse::ArgumentParser& cmd, int verbosity) -> int;
auto DefaultCommand(const argparse::ArgumentParser& cmd, int verbosity)
    -> int;

}  // namespace tagpack::driver
