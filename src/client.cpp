#include "client.hpp"
#include "plugin.hpp"
#include "runtime.hpp"
#include "util.hpp"
#include <iostream>

namespace troupe {

static void start_one(ClientInterface& client, AgentRuntime& runtime,
                      std::vector<std::unique_ptr<ClientHandle>>& out) {
    auto handle = client.start(runtime);
    if (!handle) {
        std::cerr << "[clients] " << client.name() << " did not start for "
                  << runtime.character().name << "\n";
        return;
    }
    std::cerr << "[clients] Started " << handle->client_name() << " for "
              << runtime.character().name << "\n";
    out.push_back(std::move(handle));
}

static void start_by_name(const std::string& type, AgentRuntime& runtime,
                          const PluginRegistry& registry,
                          std::vector<std::unique_ptr<ClientHandle>>& out) {
    if (!registry.has_client(type)) {
        std::cerr << "[clients] Unknown client type '" << type << "' for "
                  << runtime.character().name << ", skipping\n";
        return;
    }
    auto client = registry.create_client(type);
    if (client) start_one(*client, runtime, out);
}

std::vector<std::unique_ptr<ClientHandle>> attach_clients(const Character& character,
                                                          AgentRuntime& runtime,
                                                          const PluginRegistry& registry) {
    std::vector<std::unique_ptr<ClientHandle>> handles;

    for (const auto& type : character.clients) {
        start_by_name(to_lower(type), runtime, registry, handles);
    }

    for (const auto& decl : character.plugins) {
        if (auto plugin = registry.find_plugin(decl.name)) {
            for (const auto& client : plugin->clients) {
                if (client) start_one(*client, runtime, handles);
            }
        }
        for (const auto& type : decl.clients) {
            start_by_name(to_lower(type), runtime, registry, handles);
        }
    }

    return handles;
}

} // namespace troupe
