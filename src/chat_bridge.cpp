#include "chat_bridge.hpp"
#include "util.hpp"
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace troupe {

bool is_exit_command(const std::string& line) {
    return iequals(line, "exit");
}

ChatBridge::ChatBridge(HttpClient& http,
                       std::string api_url,
                       uint16_t server_port,
                       std::string agent_id,
                       std::istream& in,
                       std::ostream& out)
    : http_(http),
      api_url_(std::move(api_url)),
      server_port_(server_port),
      agent_id_(std::move(agent_id)),
      in_(in),
      out_(out) {
    while (!api_url_.empty() && api_url_.back() == '/') api_url_.pop_back();
}

std::string ChatBridge::message_url() const {
    return api_url_ + ":" + std::to_string(server_port_) + "/" +
           url_encode(agent_id_) + "/message";
}

std::vector<std::string> ChatBridge::send_message(const std::string& text) {
    nlohmann::json body = {
        {"text", text},
        {"userId", "user"},
        {"userName", "User"}
    };

    // No timeout: a hung front-end blocks the loop until it answers
    auto response = http_.post(message_url(), body.dump(),
                               {{"Content-Type", "application/json"}}, 0);

    if (response.status_code == 0) {
        throw std::runtime_error("request failed" +
                                 (response.error.empty() ? std::string{} : ": " + response.error));
    }
    if (response.status_code >= 400) {
        throw std::runtime_error("HTTP " + std::to_string(response.status_code) +
                                 ": " + response.body);
    }

    auto data = nlohmann::json::parse(response.body, nullptr, false);
    if (data.is_discarded() || !data.is_array()) {
        throw std::runtime_error("unexpected response: " + response.body);
    }

    std::vector<std::string> replies;
    for (const auto& message : data) {
        if (message.is_object() && message.contains("text") && message["text"].is_string()) {
            replies.push_back(message["text"].get<std::string>());
        }
    }
    return replies;
}

int ChatBridge::run() {
    std::string line;
    while (true) {
        out_ << "You: " << std::flush;

        if (!std::getline(in_, line)) {
            // EOF (Ctrl+D)
            out_ << "\n";
            return 0;
        }

        if (is_exit_command(line)) return 0;

        try {
            for (const auto& reply : send_message(line)) {
                out_ << "Agent: " << reply << "\n";
            }
        } catch (const std::exception& e) {
            std::cerr << "[chat] Error fetching response: " << e.what() << "\n";
        }
    }
}

} // namespace troupe
