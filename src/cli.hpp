#pragma once
#include <optional>
#include <string>
#include <vector>

namespace troupe {

struct CliArgs {
    std::optional<std::string> character;   // --character PATH
    std::optional<std::string> characters;  // --characters A,B,...
    bool help = false;

    // --characters wins over --character; empty if neither was given
    std::string characters_arg() const;
};

// Parse argv[1..]. Malformed input (unknown option, missing value) is
// logged and yields empty arguments so startup continues with defaults.
CliArgs parse_arguments(const std::vector<std::string>& args);
CliArgs parse_arguments(int argc, char* argv[]);

void print_usage();

} // namespace troupe
