#include "runtime.hpp"
#include "secrets.hpp"
#include "util.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace troupe {

static void merge_unique(std::vector<std::string>& into, const std::vector<std::string>& from) {
    for (const auto& item : from) {
        if (std::find(into.begin(), into.end(), item) == into.end()) {
            into.push_back(item);
        }
    }
}

AgentRuntime::AgentRuntime(Character character,
                           StorageHandle storage,
                           std::optional<std::string> token,
                           std::vector<std::shared_ptr<const Plugin>> plugins)
    : character_(std::move(character)),
      token_(std::move(token)),
      storage_(std::move(storage)),
      plugins_(std::move(plugins)) {
    if (!storage_.database || !storage_.cache) {
        throw std::invalid_argument("AgentRuntime requires a database and a cache");
    }
}

AgentRuntime::~AgentRuntime() {
    for (auto& client : clients_) {
        client->stop();
    }
}

void AgentRuntime::initialize() {
    if (initialized_) return;
    if (!storage_.database->is_initialized()) {
        throw std::runtime_error("database for " + character_.name + " is not initialized");
    }

    for (const auto& plugin : plugins_) {
        merge_unique(actions_, plugin->actions);
        merge_unique(providers_, plugin->providers);
        merge_unique(evaluators_, plugin->evaluators);
        merge_unique(services_, plugin->services);
    }

    auto& db = *storage_.database;
    if (db.ensure_account({character_.id, character_.name, character_.username})) {
        std::cerr << "[runtime] Created account for " << character_.name << "\n";
    }
    // The agent's own room shares its id
    db.ensure_room(character_.id);
    db.ensure_participant(character_.id, character_.id);

    storage_.cache->set("agent/initialized_at", epoch_millis());
    initialized_ = true;
}

void AgentRuntime::adopt_clients(std::vector<std::unique_ptr<ClientHandle>> clients) {
    for (auto& c : clients) {
        clients_.push_back(std::move(c));
    }
}

std::vector<std::string> AgentRuntime::client_names() const {
    std::vector<std::string> names;
    names.reserve(clients_.size());
    for (const auto& c : clients_) names.push_back(c->client_name());
    return names;
}

std::shared_ptr<AgentRuntime> create_runtime(Character character,
                                             StorageHandle storage,
                                             std::optional<std::string> token,
                                             const PluginRegistry& registry) {
    if (character.model_provider.empty()) {
        throw std::invalid_argument("character " + character.name +
                                    " has no modelProvider");
    }
    if (!is_known_model_provider(character.model_provider)) {
        throw std::invalid_argument("unknown model provider '" +
                                    character.model_provider + "' for " + character.name);
    }

    auto plugins = registry.baseline_plugins();
    for (const auto& decl : character.plugins) {
        auto plugin = registry.find_plugin(decl.name);
        if (!plugin) {
            std::cerr << "[runtime] Plugin '" << decl.name << "' for " << character.name
                      << " is not registered, ignoring\n";
            continue;
        }
        bool present = std::any_of(plugins.begin(), plugins.end(),
            [&](const std::shared_ptr<const Plugin>& p) { return p->name == plugin->name; });
        if (!present) plugins.push_back(std::move(plugin));
    }

    auto runtime = std::make_shared<AgentRuntime>(std::move(character), std::move(storage),
                                                  std::move(token), std::move(plugins));
    std::cerr << "[runtime] Created runtime for character " << runtime->character().name << "\n";
    return runtime;
}

} // namespace troupe
