#pragma once
#include "http.hpp"
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace troupe {

// Terminal loop that talks to a running agent through the front-end's
// POST {api_url}:{port}/{agent}/message endpoint.
class ChatBridge {
public:
    ChatBridge(HttpClient& http,
               std::string api_url,
               uint16_t server_port,
               std::string agent_id,
               std::istream& in,
               std::ostream& out);

    // Prompt, read one line, dispatch; repeat until "exit" or end of input.
    // Returns the process exit code.
    int run();

    // One request/response round. Throws std::runtime_error on transport,
    // HTTP status or response format errors.
    std::vector<std::string> send_message(const std::string& text);

    // Full endpoint URL for the bound agent
    std::string message_url() const;

private:
    HttpClient& http_;
    std::string api_url_;
    uint16_t server_port_;
    std::string agent_id_;
    std::istream& in_;
    std::ostream& out_;
};

// "exit" in any letter case, exactly as typed
bool is_exit_command(const std::string& line);

} // namespace troupe
