#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/temp_dir.hpp"
#include "common/world_fixtures.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using nglog::tests::common::AssertContains;
using nglog::tests::common::AssertEquals;
using nglog::tests::common::AssertExitCode;
using nglog::tests::common::DispatchCaptured;
using nglog::tests::common::DispatchResult;

int main() {
  const nglog::tests::common::ScopedTempDir temp("nglog-decode-validate-smoke");

  // `decode` writes raw bytes, even ones that are not text.
  const std::vector<std::uint8_t> raw = {0x00, 0xFF, 0x80, '\n'};
  std::vector<std::uint8_t> encoded;
  for (const std::uint8_t byte : raw) {
    encoded.push_back(static_cast<std::uint8_t>(byte ^ 0x5AU));
    encoded.push_back(0x5A);
  }
  const fs::path world_path = temp.path() / "raw.world.log";
  const fs::path decoded_path = temp.path() / "raw.bin";
  nglog::tests::common::WriteBytesFile(world_path, encoded);

  DispatchResult result = DispatchCaptured(
      {"nglog", "decode", world_path.string(), "--out", decoded_path.string()});
  AssertExitCode(result.exit_code, 0, "decode raw");
  AssertContains(result.stdout_text, "decoded: " + decoded_path.string());
  AssertContains(result.stderr_text, "output_bytes=\"4\"");
  AssertEquals(nglog::tests::common::ReadFileToString(decoded_path),
               std::string(raw.begin(), raw.end()), "decoded bytes");

  result = DispatchCaptured({"nglog", "decode", world_path.string()});
  AssertExitCode(result.exit_code, 2, "decode without --out");
  AssertContains(result.stderr_text, "decode requires --out <file>");

  result = DispatchCaptured(
      {"nglog", "decode", world_path.string(), "--world", "--out", decoded_path.string()});
  AssertExitCode(result.exit_code, 2, "decode with --world");
  AssertContains(result.stderr_text, "unknown option for decode: --world");

  const fs::path odd_path = temp.path() / "odd.world.log";
  nglog::tests::common::WriteBytesFile(odd_path, std::vector<std::uint8_t>(101, 0x2A));
  result = DispatchCaptured(
      {"nglog", "decode", odd_path.string(), "--out", (temp.path() / "odd.bin").string()});
  AssertExitCode(result.exit_code, 10, "decode odd length");
  AssertContains(result.stderr_text, "NGLOG_MALFORMED_INPUT: non-even log length");

  // `validate` reports the event count for both variants.
  const std::string text = "2.0\tA\tB\n3.0\tC\n";
  const fs::path local_path = temp.path() / "valid.log";
  const fs::path valid_world_path = temp.path() / "valid.world.log";
  nglog::tests::common::WriteTextFile(local_path, text);
  nglog::tests::common::WriteBytesFile(valid_world_path,
                                       nglog::tests::common::EncodeWorldBytes(text));

  result = DispatchCaptured({"nglog", "validate", local_path.string()});
  AssertExitCode(result.exit_code, 0, "validate local");
  AssertEquals(result.stdout_text, "valid: " + local_path.string() + " events=2\n",
               "validate local stdout");

  result = DispatchCaptured({"nglog", "validate", valid_world_path.string(), "--world",
                             "--log-level", "debug"});
  AssertExitCode(result.exit_code, 0, "validate world");
  AssertContains(result.stdout_text, " events=2");
  AssertContains(result.stderr_text, "level=DEBUG");
  AssertContains(result.stderr_text, "variant=\"world\"");

  result = DispatchCaptured({"nglog", "validate", local_path.string(), "--out", "x.txt"});
  AssertExitCode(result.exit_code, 2, "validate with --out");

  // Usage contract.
  result = DispatchCaptured({"nglog"});
  AssertExitCode(result.exit_code, 2, "no subcommand");
  AssertContains(result.stderr_text, "usage:");

  result = DispatchCaptured({"nglog", "frobnicate"});
  AssertExitCode(result.exit_code, 2, "unknown subcommand");
  AssertContains(result.stderr_text, "error: unknown subcommand: frobnicate");

  result = DispatchCaptured({"nglog", "convert"});
  AssertExitCode(result.exit_code, 2, "convert without input");
  AssertContains(result.stderr_text, "convert requires exactly 1 argument: <log>");

  result = DispatchCaptured({"nglog", "convert", "a.log", "b.log"});
  AssertExitCode(result.exit_code, 2, "convert with two inputs");

  result = DispatchCaptured({"nglog", "convert", "a.log", "--log-level", "loud"});
  AssertExitCode(result.exit_code, 2, "convert with bad log level");
  AssertContains(result.stderr_text, "invalid --log-level 'loud'");

  result = DispatchCaptured({"nglog", "help"});
  AssertExitCode(result.exit_code, 0, "help");
  AssertContains(result.stdout_text, "nglog convert <log>");

  result = DispatchCaptured({"nglog", "version"});
  AssertExitCode(result.exit_code, 0, "version");
  AssertEquals(result.stdout_text, "nglog 0.1.0\n", "version stdout");

  std::cout << "decode_validate_smoke: ok\n";
  return 0;
}
