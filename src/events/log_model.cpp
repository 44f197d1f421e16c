#include "events/log_model.hpp"

#include "codec/utf8.hpp"
#include "codec/world_decoder.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <optional>
#include <utility>

namespace nglog::events {

namespace {

using core::errors::ParseError;
using core::errors::ParseErrorCode;

constexpr char kLineTerminator = '\n';

bool BytesToText(std::span<const std::uint8_t> bytes, std::string& text, ParseError& error) {
  std::string detail;
  if (!codec::Utf8BytesToString(bytes, text, detail)) {
    error = {.code = ParseErrorCode::kEncodingError, .message = detail, .line = std::nullopt};
    return false;
  }
  return true;
}

constexpr std::size_t kReadChunkSize = 4096;

// Reads through istream::read so buffer failures (including exceptions thrown
// by the streambuf) land in the stream state instead of looking like EOF.
bool ReadAllBytes(std::istream& input, std::vector<std::uint8_t>& bytes, ParseError& error) {
  if (!input || input.rdbuf() == nullptr) {
    error = {.code = ParseErrorCode::kIoError,
             .message = "log stream is not readable",
             .line = std::nullopt};
    return false;
  }

  std::vector<std::uint8_t> buffer;
  std::array<char, kReadChunkSize> chunk{};
  while (true) {
    input.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    const auto got = static_cast<std::size_t>(input.gcount());
    buffer.insert(buffer.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(got));
    if (!input) {
      break;
    }
  }

  if (input.bad() || !input.eof()) {
    error = {.code = ParseErrorCode::kIoError,
             .message = "failed while reading log stream",
             .line = std::nullopt};
    return false;
  }

  bytes = std::move(buffer);
  return true;
}

} // namespace

Log MakeLog(std::size_t capacity) {
  Log log;
  log.events.reserve(capacity);
  return log;
}

bool ParseLogText(std::string_view text, Log& log, ParseError& error) {
  Log parsed = MakeLog(static_cast<std::size_t>(std::count(text.begin(), text.end(),
                                                           kLineTerminator)) + 1U);

  std::size_t line_number = 0;
  std::size_t begin = 0;
  while (begin < text.size()) {
    ++line_number;
    std::size_t end = text.find(kLineTerminator, begin);
    std::string_view line;
    if (end == std::string_view::npos) {
      // Unterminated last line: taken as-is, a lone trailing '\r' included.
      line = text.substr(begin);
      end = text.size();
    } else {
      line = text.substr(begin, end - begin);
      if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
      }
    }

    Event event;
    if (!ParseEventLine(line, event, error)) {
      error.line = line_number;
      return false;
    }
    parsed.events.push_back(std::move(event));
    begin = end + 1U;
  }

  log = std::move(parsed);
  return true;
}

bool ParseLocalLog(std::span<const std::uint8_t> bytes, Log& log, ParseError& error) {
  std::string text;
  if (!BytesToText(bytes, text, error)) {
    return false;
  }
  return ParseLogText(text, log, error);
}

bool ParseWorldLog(std::span<const std::uint8_t> bytes, Log& log, ParseError& error) {
  std::vector<std::uint8_t> decoded;
  if (!codec::DecodeWorldBytes(bytes, decoded, error)) {
    return false;
  }

  std::string text;
  if (!BytesToText(decoded, text, error)) {
    return false;
  }
  return ParseLogText(text, log, error);
}

bool ReadLocalLog(std::istream& input, Log& log, ParseError& error) {
  std::vector<std::uint8_t> bytes;
  if (!ReadAllBytes(input, bytes, error)) {
    return false;
  }
  return ParseLocalLog(bytes, log, error);
}

bool ReadWorldLog(std::istream& input, Log& log, ParseError& error) {
  std::vector<std::uint8_t> bytes;
  if (!ReadAllBytes(input, bytes, error)) {
    return false;
  }
  return ParseWorldLog(bytes, log, error);
}

std::string ToText(const Log& log) {
  std::string text;
  for (const Event& event : log.events) {
    AppendLine(event, text);
    text.push_back(kLineTerminator);
  }
  return text;
}

} // namespace nglog::events
