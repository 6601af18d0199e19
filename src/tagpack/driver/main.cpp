#include <argparse/argparse.hpp>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

#include <fmt/core.h>

#include "commands.hpp"
#include "logging.hpp"
#include "print.hpp"
#include "tagpack/common/internal_error.hpp"

namespace fs = std::filesystem;

auto main(int argc, char* argv[]) -> int {
  int verbosity = 0;

  argparse::ArgumentParser program("tagpack", "0.1.0");
  program.add_description(
      "Binary layout, codec and default literals for structured PLC tags");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");
  program.add_argument("-v", "--verbose")
      .action([&](const auto&) { ++verbosity; })
      .append()
      .default_value(false)
      .implicit_value(true)
      .nargs(0)
      .help("Increase log verbosity (repeatable)");

  // Subcommand: layout
  argparse::ArgumentParser layout_cmd("layout");
  layout_cmd.add_description("Print the byte layout of a type");
  tagpack::driver::AddLayoutFlags(layout_cmd);

  // Subcommand: decode
  argparse::ArgumentParser decode_cmd("decode");
  decode_cmd.add_description("Decode every field of a binary image");
  tagpack::driver::AddDecodeFlags(decode_cmd);

  // Subcommand: encode
  argparse::ArgumentParser encode_cmd("encode");
  encode_cmd.add_description(
      "Apply field updates to a binary image and verify them");
  tagpack::driver::AddEncodeFlags(encode_cmd);

  // Subcommand: default
  argparse::ArgumentParser default_cmd("default");
  default_cmd.add_description("Print the default literal of a type");
  tagpack::driver::AddDefaultFlags(default_cmd);

  program.add_subparser(layout_cmd);
  program.add_subparser(decode_cmd);
  program.add_subparser(encode_cmd);
  program.add_subparser(default_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    tagpack::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  tagpack::driver::ConfigureLogging(
      tagpack::driver::LevelForVerbosity(verbosity));

  // Handle -C before dispatching subcommands
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      tagpack::driver::PrintError(
          fmt::format("cannot change to '{}': {}", *dir, ec.message()));
      return 1;
    }
  }

  try {
    if (program.is_subcommand_used("layout")) {
      return tagpack::driver::LayoutCommand(layout_cmd, verbosity);
    }
    if (program.is_subcommand_used("decode")) {
      return tagpack::driver::DecodeCommand(decode_cmd, verbosity);
    }
    if (program.is_subcommand_used("encode")) {
      return tagpack::driver::EncodeCommand(encode_cmd, verbosity);
    }
    if (program.is_subcommand_used("default")) {
      return tagpack::driver::DefaultCommand(default_cmd, verbosity);
    }
  } catch (const tagpack::common::InternalError& e) {
    tagpack::driver::PrintError(e.what());
    return 1;
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
