#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace pak_tool {

struct Options {
    std::string command;
    std::vector<std::string> positional;
    std::filesystem::path output;
    std::filesystem::path manifest;
    int level{9};
    bool store{false};
    bool verbose{false};
    bool quiet{false};
};

void print_usage(const char* program);

// Parses and validates the command line. Prints the problem (or the usage
// text for --help) to stderr and returns false when the tool should exit.
bool parse_args(int argc, char* argv[], Options& opts);

} // namespace pak_tool
