#pragma once

#include "core/errors/parse_error.hpp"
#include "events/event_model.hpp"

#include <cstddef>
#include <cstdint>
#include <istream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace nglog::events {

// One parsed ngLog file: events in source line order.
struct Log {
  std::vector<Event> events;

  bool operator==(const Log&) const = default;
};

// Empty log with room for `capacity` events.
Log MakeLog(std::size_t capacity);

// Parse entry points.
//
// Shared contract:
// - fail-fast: the first bad line aborts and nothing is written to `log`
// - on success `log` is replaced, not appended to
// - grammar failures carry the 1-based line number in `error.line`

// Parses local-form text. Lines end at "\n" or "\r\n"; a terminator on the
// final line does not add an empty trailing record.
bool ParseLogText(std::string_view text, Log& log, core::errors::ParseError& error);

// Parses a local ngLog copy from raw bytes. Invalid UTF-8 is kEncodingError.
bool ParseLocalLog(std::span<const std::uint8_t> bytes, Log& log, core::errors::ParseError& error);

// Parses a world ngLog copy: even-length check, byte-pair decode, UTF-8 check,
// then the same text grammar as the local form.
bool ParseWorldLog(std::span<const std::uint8_t> bytes, Log& log, core::errors::ParseError& error);

// Stream conveniences: read `input` to EOF, then behave as the byte entry
// points above. A stream that is already failed on entry (e.g. an ifstream
// that did not open) or fails before EOF is kIoError.
bool ReadLocalLog(std::istream& input, Log& log, core::errors::ParseError& error);
bool ReadWorldLog(std::istream& input, Log& log, core::errors::ParseError& error);

// Canonical local-form text: every event line terminated by "\n", the last one
// included. An empty log renders as "".
std::string ToText(const Log& log);

} // namespace nglog::events
