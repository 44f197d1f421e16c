#include "events/event_model.hpp"

#include <cstddef>
#include <iterator>
#include <utility>

namespace nglog::events {

namespace {

std::vector<std::string> SplitFields(std::string_view line) {
  std::vector<std::string> fields;
  std::size_t begin = 0;
  while (true) {
    const std::size_t end = line.find(kFieldSeparator, begin);
    if (end == std::string_view::npos) {
      fields.emplace_back(line.substr(begin));
      break;
    }
    fields.emplace_back(line.substr(begin, end - begin));
    begin = end + 1U;
  }
  return fields;
}

} // namespace

bool ParseEventLine(std::string_view line, Event& event, core::errors::ParseError& error) {
  std::vector<std::string> fields = SplitFields(line);
  if (fields.size() < 2U) {
    error = {.code = core::errors::ParseErrorCode::kMalformedInput,
             .message = "bad event string",
             .line = std::nullopt};
    return false;
  }

  Event parsed;
  parsed.timestamp = std::move(fields[0]);
  if (fields.size() == 2U) {
    parsed.event_id = std::move(fields[1]);
  } else {
    parsed.event_class = std::move(fields[1]);
    parsed.event_id = std::move(fields[2]);
    parsed.event_params.assign(std::make_move_iterator(fields.begin() + 3),
                               std::make_move_iterator(fields.end()));
  }

  event = std::move(parsed);
  return true;
}

void AppendLine(const Event& event, std::string& out) {
  out += event.timestamp;
  if (event.event_class.has_value()) {
    out.push_back(kFieldSeparator);
    out += *event.event_class;
  }
  out.push_back(kFieldSeparator);
  out += event.event_id;
  for (const std::string& param : event.event_params) {
    out.push_back(kFieldSeparator);
    out += param;
  }
}

std::string ToLine(const Event& event) {
  std::string line;
  AppendLine(event, line);
  return line;
}

} // namespace nglog::events
