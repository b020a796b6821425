#pragma once
#include "Parser.hpp"
#include <ostream>
#include <string>
#include <vector>

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;

class GeoHandler {
public:
    GeoHandler(std::ostream& out, std::ostream& err);

    bool isGeoCommand(const std::string& cmd);
    int handleCommand(const Command& cmd);
    void printUsage();

private:
    std::ostream& out;
    std::ostream& err;
    Parser parser;

    int handleEncode(const Command& cmd);
    int handleDecode(const Command& cmd);
    int handleDecodeWithError(const Command& cmd);
    int sendError(const std::string& message, int status);
};
