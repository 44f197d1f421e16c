#ifndef NGLOG_TESTS_COMMON_CLI_DISPATCH_HPP_
#define NGLOG_TESTS_COMMON_CLI_DISPATCH_HPP_

#include "nglog/cli/router.hpp"

#include <iostream>
#include <ostream>
#include <sstream>
#include <streambuf>
#include <string>
#include <vector>

namespace nglog::tests::common {

struct DispatchResult {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
};

// Points `stream` at `target` for the lifetime of the object.
class ScopedStreamRedirect {
public:
  ScopedStreamRedirect(std::ostream& stream, std::streambuf* target)
      : stream_(stream), original_(stream.rdbuf(target)) {}

  ~ScopedStreamRedirect() {
    stream_.rdbuf(original_);
  }

  ScopedStreamRedirect(const ScopedStreamRedirect&) = delete;
  ScopedStreamRedirect& operator=(const ScopedStreamRedirect&) = delete;

private:
  std::ostream& stream_;
  std::streambuf* original_ = nullptr;
};

// Runs the router in-process with stdout/stderr captured. `argv_storage`
// includes the program name as element 0.
inline DispatchResult DispatchCaptured(const std::vector<std::string>& argv_storage) {
  std::vector<char*> argv;
  argv.reserve(argv_storage.size());
  for (const auto& arg : argv_storage) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }

  std::ostringstream captured_out;
  std::ostringstream captured_err;
  DispatchResult result;
  {
    const ScopedStreamRedirect redirect_out(std::cout, captured_out.rdbuf());
    const ScopedStreamRedirect redirect_err(std::cerr, captured_err.rdbuf());
    result.exit_code = nglog::cli::Dispatch(static_cast<int>(argv.size()), argv.data());
  }
  result.stdout_text = captured_out.str();
  result.stderr_text = captured_err.str();
  return result;
}

} // namespace nglog::tests::common

#endif // NGLOG_TESTS_COMMON_CLI_DISPATCH_HPP_
