#pragma once

#include <algorithm>
#include <chrono>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <initializer_list>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace nglog::core::logging {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

struct LogFieldView {
  std::string_view key;
  std::string_view value;
};

inline const char* ToString(LogLevel level) {
  switch (level) {
  case LogLevel::kDebug:
    return "DEBUG";
  case LogLevel::kInfo:
    return "INFO";
  case LogLevel::kWarn:
    return "WARN";
  case LogLevel::kError:
    return "ERROR";
  }

  return "INFO";
}

inline std::string ExpectedLogLevelList() {
  return "debug|info|warn|error";
}

inline bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  error.clear();

  if (raw.empty()) {
    error = "missing value for --log-level (expected " + ExpectedLogLevelList() + ")";
    return false;
  }

  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (normalized == "debug") {
    level = LogLevel::kDebug;
  } else if (normalized == "info") {
    level = LogLevel::kInfo;
  } else if (normalized == "warn" || normalized == "warning") {
    level = LogLevel::kWarn;
  } else if (normalized == "error") {
    level = LogLevel::kError;
  } else {
    error = "invalid --log-level '" + std::string(raw) + "' (expected " +
            ExpectedLogLevelList() + ")";
    return false;
  }
  return true;
}

// Line-oriented key=value logger used by the command-line front end.
//
// Record shape:
//   ts_utc=<iso8601> level=<LEVEL> source="<input>" msg="<text>" key="value"...
//
// `source` names the log file the current command works on so interleaved
// output from batch scripts stays attributable. The parsing library itself
// never logs; failures travel back to callers as values.
class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cerr)
      : min_level_(min_level), out_(&out) {}

  void SetMinLevel(LogLevel level) {
    min_level_ = level;
  }

  LogLevel MinLevel() const {
    return min_level_;
  }

  void SetSource(std::string source) {
    source_ = std::move(source);
  }

  const std::string& Source() const {
    return source_;
  }

  bool ShouldLog(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(min_level_);
  }

  void Log(LogLevel level, std::string_view message,
           std::initializer_list<LogFieldView> fields = {}) {
    if (!ShouldLog(level)) {
      return;
    }

    std::string record;
    record.reserve(96 + message.size());
    record += "ts_utc=";
    record += FormatUtcTimestamp(std::chrono::system_clock::now());
    record += " level=";
    record += ToString(level);
    record += " source=";
    AppendQuoted(record, source_);
    record += " msg=";
    AppendQuoted(record, message);
    for (const auto& field : fields) {
      record.push_back(' ');
      record.append(field.key);
      record.push_back('=');
      AppendQuoted(record, field.value);
    }
    record.push_back('\n');

    (*out_) << record;
    out_->flush();
  }

  void Debug(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kDebug, message, fields);
  }

  void Info(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kInfo, message, fields);
  }

  void Warn(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kWarn, message, fields);
  }

  void Error(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kError, message, fields);
  }

private:
  static std::string FormatUtcTimestamp(std::chrono::system_clock::time_point ts) {
    const auto millis_since_epoch =
        std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
    const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

    const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(ts);
    std::tm utc_time{};
#if defined(_WIN32)
    if (gmtime_s(&utc_time, &epoch_seconds) != 0) {
      return "";
    }
#else
    if (gmtime_r(&epoch_seconds, &utc_time) == nullptr) {
      return "";
    }
#endif

    std::ostringstream out;
    out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
        << std::setfill('0') << millis_component << 'Z';
    return out.str();
  }

  // Log values are often raw event lines, so TABs and line breaks must not
  // leak into the one-record-per-line output.
  static void AppendQuoted(std::string& out, std::string_view raw) {
    out.push_back('"');
    for (const char c : raw) {
      switch (c) {
      case '\\':
        out += "\\\\";
        break;
      case '"':
        out += "\\\"";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        out.push_back(c);
        break;
      }
    }
    out.push_back('"');
  }

  LogLevel min_level_ = LogLevel::kInfo;
  std::ostream* out_ = &std::cerr;
  std::string source_ = "-";
};

} // namespace nglog::core::logging
