#pragma once

namespace nglog::core::errors {

// Process-exit contract for the `nglog` command-line front end.
//
// The first three values keep conventional meanings used by scripts:
// - 0 success
// - 1 generic command failure (file I/O)
// - 2 usage/argument failure
//
// Parse failures get their own values so wrappers can tell a corrupt log from
// a missing file without scraping stderr text.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kMalformedInput = 10,
  kEncodingError = 11,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace nglog::core::errors
