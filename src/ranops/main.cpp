#include "ranops/cli/router.hpp"

int main(int argc, char** argv) {
  // Argument parsing, wiring and the exit-code contract live in the router.
  return ranops::cli::Dispatch(argc, argv);
}
