#pragma once

#include "core/logging/logger.hpp"

#include <filesystem>

namespace nglog::cli {

// Options shared by `convert`, `decode` and `validate`. Each command rejects
// the flags it has no use for.
struct CommandOptions {
  std::filesystem::path input_path;
  std::filesystem::path output_path;
  bool has_output_path = false;
  bool world = false;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Routes `nglog` subcommands and returns process exit codes with a stable
// contract for scripts:
//   0  => success
//   1  => file I/O failure
//   2  => usage error (unknown command / invalid args)
//   10 => malformed log content
//   11 => log bytes are not valid UTF-8
int Dispatch(int argc, char** argv);

} // namespace nglog::cli
