#pragma once
#include <string_view>
#include <string>
#include <vector>
#include <unordered_map>
#include <optional>

struct Command {
    std::string name;
    std::vector<std::string> args;
    std::unordered_map<std::string, std::string> options;
};

class Parser {
public:
    // argv without the program name. "--name value" pairs become options,
    // everything else is positional.
    Command parse(const std::vector<std::string>& argv);

    int parseInteger(std::string_view str);
    double parseReal(const std::string& str);
    std::optional<std::string> option(const Command& cmd, const std::string& name);
private:
    bool isOption(std::string_view token);
};
