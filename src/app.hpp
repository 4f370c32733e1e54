#pragma once
#include "config.hpp"
#include "http.hpp"
#include <iosfwd>
#include <string>
#include <vector>

namespace troupe {

// Whole program after process setup: parse args, load characters, start
// agents, then run the chat bridge on in/out. Returns the exit code:
// 1 for a character load failure or an aborted startup, otherwise the
// bridge's code.
int run(const std::vector<std::string>& args,
        const Config& config,
        HttpClient& http,
        std::istream& in,
        std::ostream& out);

} // namespace troupe
