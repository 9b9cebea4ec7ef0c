#include <iostream>
#include <string>
#include <vector>

#include "command_line.hpp"
#include "logger.hpp"

int main(int argc, char *argv[]) {
  std::vector<std::string> args(argv + 1, argv + argc);

  sessiondb::CommandLine cli(std::cout, std::cerr);
  int status = cli.run(args);

  sessiondb::Logger::getInstance().flush();
  return status;
}
