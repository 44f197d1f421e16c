#include "nglog/cli/router.hpp"

int main(int argc, char** argv) {
  // All command parsing and exit-code contracts live in the CLI router.
  return nglog::cli::Dispatch(argc, argv);
}
