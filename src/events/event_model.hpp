#pragma once

#include "core/errors/parse_error.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nglog::events {

inline constexpr char kFieldSeparator = '\t';

// One ngLog gameplay event.
//
// - `timestamp`: seconds since gameplay began, kept as the exact source text
// - `event_class`: category; absent for two-field records
// - `event_id`: event type
// - `event_params`: free-form data points in source order
struct Event {
  std::string timestamp;
  std::optional<std::string> event_class;
  std::string event_id;
  std::vector<std::string> event_params;

  bool operator==(const Event&) const = default;
};

// Splits one record on TAB and maps the fields by count:
// - 1 field  -> kMalformedInput ("bad event string")
// - 2 fields -> timestamp, id
// - 3+       -> timestamp, class, id, params...
// Empty fields are kept, so "1.0\t\tX" has an empty (present) class.
bool ParseEventLine(std::string_view line, Event& event, core::errors::ParseError& error);

// Canonical single-line form without a line terminator.
std::string ToLine(const Event& event);

// Appends the canonical line for `event` to `out` (no terminator).
void AppendLine(const Event& event, std::string& out);

} // namespace nglog::events
