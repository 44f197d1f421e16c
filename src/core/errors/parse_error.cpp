#include "core/errors/parse_error.hpp"

#include <string>

namespace nglog::core::errors {

std::string_view ToStableErrorCode(const ParseErrorCode code) {
  switch (code) {
  case ParseErrorCode::kEncodingError:
    return "NGLOG_ENCODING_ERROR";
  case ParseErrorCode::kMalformedInput:
    return "NGLOG_MALFORMED_INPUT";
  case ParseErrorCode::kIoError:
    return "NGLOG_IO_ERROR";
  }

  return "NGLOG_UNKNOWN_ERROR";
}

std::string FormatParseError(const ParseError& error) {
  std::string formatted = std::string(ToStableErrorCode(error.code)) + ": " + error.message;
  if (error.line.has_value()) {
    formatted += " (line " + std::to_string(*error.line) + ")";
  }
  return formatted;
}

} // namespace nglog::core::errors
