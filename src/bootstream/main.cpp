#include "bootstream/cli/router.hpp"

int main(int argc, char** argv) {
  // All command parsing and output/exit-code contracts live in the CLI router.
  return bootstream::cli::Dispatch(argc, argv);
}
