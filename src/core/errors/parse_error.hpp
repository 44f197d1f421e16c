#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace nglog::core::errors {

// Failure kinds surfaced by the decoder and the log parser.
//
// - kEncodingError: bytes presented as text are not valid UTF-8
// - kMalformedInput: odd-length world data or an event line without a TAB
// - kIoError: reading a stream or file failed before parsing could start
enum class ParseErrorCode {
  kEncodingError,
  kMalformedInput,
  kIoError,
};

std::string_view ToStableErrorCode(ParseErrorCode code);

struct ParseError {
  ParseErrorCode code = ParseErrorCode::kMalformedInput;
  std::string message;
  // 1-based line of the offending event when the failure came from the
  // event grammar inside a whole-log parse.
  std::optional<std::size_t> line;
};

// Single-line rendering:
//   "<STABLE_CODE>: <message>"
//   "<STABLE_CODE>: <message> (line <n>)"
std::string FormatParseError(const ParseError& error);

} // namespace nglog::core::errors
