#include <iostream>
#include <string>
#include <vector>

#include "jsp/cli.hpp"

int main(int argc, char* argv[]) {
  std::vector<std::string> args(argv + 1, argv + argc);
  return jsp::run_cli(args, std::cin, std::cout, std::cerr);
}
