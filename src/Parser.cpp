#include "Parser.hpp"
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

bool Parser::isOption(std::string_view token) {
    return token.size() > 2 && token[0] == '-' && token[1] == '-';
}

int Parser::parseInteger(std::string_view str) {
    int value = 0;
    auto res = std::from_chars(str.data(), str.data() + str.size(), value);
    if (res.ec == std::errc{} && res.ptr == str.data() + str.size()) {
        return value;
    }
    throw std::runtime_error("Invalid integer '" + std::string(str) + "'");
}

double Parser::parseReal(const std::string& str) {
    const char* begin = str.c_str();
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(begin, &end);
    if (str.empty() || end != begin + str.size()) {
        throw std::runtime_error("Invalid number '" + str + "'");
    }
    // Underflow returns a value at or near zero, which is kept.
    if (errno == ERANGE && std::isinf(value)) {
        throw std::runtime_error("Number out of range '" + str + "'");
    }
    return value;
}

std::optional<std::string> Parser::option(const Command& cmd, const std::string& name) {
    auto it = cmd.options.find(name);
    if (it == cmd.options.end()) return std::nullopt;
    return it->second;
}

Command Parser::parse(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        throw std::runtime_error("Missing command");
    }
    Command cmd;
    cmd.name = argv[0];
    for (size_t i = 1; i < argv.size(); ++i) {
        if (isOption(argv[i])) {
            if (i + 1 >= argv.size()) {
                throw std::runtime_error(argv[i] + " requires a value");
            }
            cmd.options[argv[i].substr(2)] = argv[i + 1];
            ++i;
        } else {
            cmd.args.push_back(argv[i]);
        }
    }
    return cmd;
}
