#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "GeoHandler.hpp"

int main(int argc, char **argv) {
  std::cout << std::unitbuf;
  std::cerr << std::unitbuf;

  GeoHandler handler(std::cout, std::cerr);
  std::vector<std::string> args(argv + 1, argv + argc);
  if (args.empty()) {
    handler.printUsage();
    return EXIT_USAGE;
  }

  Parser parser;
  Command cmd;
  try {
    cmd = parser.parse(args);
  } catch (const std::runtime_error& e) {
    std::cerr << "geohash: " << e.what() << "\n";
    handler.printUsage();
    return EXIT_USAGE;
  }

  if (!handler.isGeoCommand(cmd.name)) {
    std::cerr << "geohash: unknown command '" << cmd.name << "'\n";
    handler.printUsage();
    return EXIT_USAGE;
  }

  try {
    return handler.handleCommand(cmd);
  } catch (const std::exception& e) {
    std::cerr << "geohash: " << e.what() << "\n";
    return EXIT_FAILED;
  }
}
