#include "app.hpp"
#include "cli.hpp"
#include "character_loader.hpp"
#include "registry.hpp"
#include "orchestrator.hpp"
#include "chat_bridge.hpp"
#include <iostream>

namespace troupe {

int run(const std::vector<std::string>& args,
        const Config& config,
        HttpClient& http,
        std::istream& in,
        std::ostream& out) {
    auto parsed = parse_arguments(args);
    if (parsed.help) {
        print_usage();
        return 0;
    }

    std::string characters_arg = parsed.characters_arg();
    if (!characters_arg.empty()) {
        std::cerr << "[characters] Requested: " << characters_arg << "\n";
    }

    std::vector<Character> characters;
    try {
        characters = load_characters(characters_arg, config);
    } catch (const CharacterLoadError& e) {
        // A file the operator named must load; no partial startup
        std::cerr << e.what() << "\n";
        return 1;
    }

    AgentRegistry registry;
    AgentOrchestrator orchestrator(config, registry);
    try {
        auto report = orchestrator.start_agents(characters);
        for (const auto& failure : report.failures) {
            std::cerr << "[agent] " << failure.character_name << " not started ("
                      << startup_state_name(failure.state) << ")\n";
        }
    } catch (const AgentStartupError& e) {
        std::cerr << "Error starting agents: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "[chat] Chat started. Type 'exit' to quit.\n";

    ChatBridge bridge(http, config.api_url, config.server_port,
                      characters.front().name, in, out);
    return bridge.run();
}

} // namespace troupe
