#include "sitebuild/cli/router.hpp"

int main(int argc, char** argv) {
  // All argument parsing and the exit-code contract live in the CLI router.
  return sitebuild::cli::Dispatch(argc, argv);
}
