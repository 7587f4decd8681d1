#include "camhost/cli/router.hpp"

int main(int argc, char** argv) {
  return camhost::cli::Dispatch(argc, argv);
}
