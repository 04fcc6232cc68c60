#include "scenkit/cli/router.hpp"

int main(int argc, char** argv) {
  // Parsing, wiring and the exit-code contract all live in the router.
  return scenkit::cli::Dispatch(argc, argv);
}
