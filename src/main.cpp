#include "teamlens/cli/commands.hpp"

#include <exception>
#include <iostream>

int main(int argc, char **argv) {
  try {
    return teamlens::cli::run_cli(argc, argv);
  } catch (const std::exception &err) {
    std::cerr << "fatal: " << err.what() << "\n";
    return 1;
  }
}
