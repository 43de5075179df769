#include "kbake/cli/router.hpp"

int main(int argc, char** argv) {
  return kbake::cli::Dispatch(argc, argv);
}
