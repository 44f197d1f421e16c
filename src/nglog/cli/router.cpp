#include "nglog/cli/router.hpp"

#include "codec/world_decoder.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/errors/parse_error.hpp"
#include "core/fs_utils.hpp"
#include "events/log_model.hpp"

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace nglog::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitMalformedInput = core::errors::ToInt(core::errors::ExitCode::kMalformedInput);
constexpr int kExitEncodingError = core::errors::ToInt(core::errors::ExitCode::kEncodingError);

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  nglog convert <log> [--world] [--out <file>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  nglog decode <world-log> --out <file> [--log-level <debug|info|warn|error>]\n"
      << "  nglog validate <log> [--world] [--log-level <debug|info|warn|error>]\n"
      << "  nglog version\n";
}

// Which flags a command accepts. Anything else is a usage error rather than
// silently ignored.
struct AcceptedFlags {
  bool world = false;
  bool out = false;
  bool out_required = false;
};

bool ParseCommandOptions(std::string_view command, const std::vector<std::string_view>& args,
                         const AcceptedFlags& accepted, CommandOptions& options,
                         std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--world" && accepted.world) {
      options.world = true;
      continue;
    }
    if (token == "--out" && accepted.out) {
      if (i + 1 >= args.size()) {
        error = "missing value for --out";
        return false;
      }
      options.output_path = fs::path(args[i + 1]);
      options.has_output_path = true;
      ++i;
      continue;
    }
    if (token == "--log-level") {
      if (i + 1 >= args.size()) {
        error = "missing value for --log-level";
        return false;
      }
      core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
      if (!core::logging::ParseLogLevel(args[i + 1], parsed, error)) {
        return false;
      }
      options.log_level = parsed;
      ++i;
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option for " + std::string(command) + ": " + std::string(token);
      return false;
    }

    if (!options.input_path.empty()) {
      error = std::string(command) + " accepts exactly 1 input path";
      return false;
    }
    options.input_path = fs::path(token);
  }

  if (options.input_path.empty()) {
    error = std::string(command) + " requires exactly 1 argument: <log>";
    return false;
  }
  if (accepted.out_required && !options.has_output_path) {
    error = std::string(command) + " requires --out <file>";
    return false;
  }
  return true;
}

int ExitCodeFor(const core::errors::ParseErrorCode code) {
  switch (code) {
  case core::errors::ParseErrorCode::kEncodingError:
    return kExitEncodingError;
  case core::errors::ParseErrorCode::kMalformedInput:
    return kExitMalformedInput;
  case core::errors::ParseErrorCode::kIoError:
    return kExitFailure;
  }
  return kExitFailure;
}

// Reads and parses the input named by `options`. Returns an exit code; on
// kExitSuccess `log` holds the parsed events.
int LoadLog(const CommandOptions& options, core::logging::Logger& logger, events::Log& log) {
  const std::string variant = options.world ? "world" : "local";
  logger.Debug("reading log", {{"path", options.input_path.string()}, {"variant", variant}});

  std::vector<std::uint8_t> bytes;
  std::string io_error;
  if (!core::ReadFileBytes(options.input_path, bytes, io_error)) {
    logger.Error("failed to read log", {{"error", io_error}});
    std::cerr << "error: " << io_error << '\n';
    return kExitFailure;
  }

  core::errors::ParseError parse_error;
  const bool parsed = options.world ? events::ParseWorldLog(bytes, log, parse_error)
                                    : events::ParseLocalLog(bytes, log, parse_error);
  if (!parsed) {
    const std::string formatted = core::errors::FormatParseError(parse_error);
    logger.Error("failed to parse log",
                 {{"variant", variant},
                  {"code", core::errors::ToStableErrorCode(parse_error.code)},
                  {"detail", parse_error.message}});
    std::cerr << "error: " << formatted << '\n';
    return ExitCodeFor(parse_error.code);
  }

  logger.Debug("log parsed", {{"variant", variant},
                              {"input_bytes", std::to_string(bytes.size())},
                              {"events", std::to_string(log.events.size())}});
  return kExitSuccess;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "nglog 0.1.0\n";
  return kExitSuccess;
}

int CommandConvert(const std::vector<std::string_view>& args) {
  CommandOptions options;
  std::string error;
  if (!ParseCommandOptions("convert", args, {.world = true, .out = true, .out_required = false},
                           options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);
  logger.SetSource(options.input_path.filename().string());

  events::Log log;
  if (const int load_exit = LoadLog(options, logger, log); load_exit != kExitSuccess) {
    return load_exit;
  }

  const std::string text = events::ToText(log);
  if (!options.has_output_path) {
    std::cout << text;
    std::cout.flush();
    logger.Info("log converted", {{"events", std::to_string(log.events.size())}});
    return kExitSuccess;
  }

  if (!core::WriteFileAtomic(options.output_path, text, error)) {
    logger.Error("failed to write converted log", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  logger.Info("log converted", {{"events", std::to_string(log.events.size())},
                                {"out", options.output_path.string()}});
  std::cout << "converted: " << options.output_path.string() << '\n';
  return kExitSuccess;
}

int CommandDecode(const std::vector<std::string_view>& args) {
  CommandOptions options;
  std::string error;
  if (!ParseCommandOptions("decode", args, {.world = false, .out = true, .out_required = true},
                           options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);
  logger.SetSource(options.input_path.filename().string());

  std::vector<std::uint8_t> encoded;
  if (!core::ReadFileBytes(options.input_path, encoded, error)) {
    logger.Error("failed to read world log", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  std::vector<std::uint8_t> decoded;
  core::errors::ParseError parse_error;
  if (!codec::DecodeWorldBytes(encoded, decoded, parse_error)) {
    logger.Error("failed to decode world log",
                 {{"code", core::errors::ToStableErrorCode(parse_error.code)},
                  {"detail", parse_error.message}});
    std::cerr << "error: " << core::errors::FormatParseError(parse_error) << '\n';
    return ExitCodeFor(parse_error.code);
  }

  // Decoded bytes are written verbatim; they are not required to be text.
  const std::string_view raw(reinterpret_cast<const char*>(decoded.data()), decoded.size());
  if (!core::WriteFileAtomic(options.output_path, raw, error)) {
    logger.Error("failed to write decoded log", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  logger.Info("world log decoded", {{"input_bytes", std::to_string(encoded.size())},
                                    {"output_bytes", std::to_string(decoded.size())},
                                    {"out", options.output_path.string()}});
  std::cout << "decoded: " << options.output_path.string() << '\n';
  return kExitSuccess;
}

int CommandValidate(const std::vector<std::string_view>& args) {
  CommandOptions options;
  std::string error;
  if (!ParseCommandOptions("validate", args, {.world = true, .out = false, .out_required = false},
                           options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);
  logger.SetSource(options.input_path.filename().string());

  events::Log log;
  if (const int load_exit = LoadLog(options, logger, log); load_exit != kExitSuccess) {
    return load_exit;
  }

  std::cout << "valid: " << options.input_path.string() << " events=" << log.events.size()
            << '\n';
  return kExitSuccess;
}

} // namespace

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "convert") {
    return CommandConvert(args);
  }

  if (command == "decode") {
    return CommandDecode(args);
  }

  if (command == "validate") {
    return CommandValidate(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace nglog::cli
