#pragma once
#include "character.hpp"
#include "client.hpp"
#include "plugin.hpp"
#include "storage/provisioner.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace troupe {

// Live execution context for one character. Owns its storage and its
// started clients; clients are stopped before storage is released.
class AgentRuntime {
public:
    AgentRuntime(Character character,
                 StorageHandle storage,
                 std::optional<std::string> token,
                 std::vector<std::shared_ptr<const Plugin>> plugins);
    ~AgentRuntime();

    AgentRuntime(const AgentRuntime&) = delete;
    AgentRuntime& operator=(const AgentRuntime&) = delete;

    // Merge extension capabilities and make sure the agent's account and
    // default room exist in storage. Requires an initialized database.
    void initialize();
    bool initialized() const { return initialized_; }

    const std::string& agent_id() const { return character_.id; }
    const Character& character() const { return character_; }
    const std::string& model_provider() const { return character_.model_provider; }
    const std::optional<std::string>& token() const { return token_; }

    DatabaseAdapter& database() { return *storage_.database; }
    CacheManager& cache() { return *storage_.cache; }

    const std::vector<std::shared_ptr<const Plugin>>& plugins() const { return plugins_; }
    const std::vector<std::string>& actions() const { return actions_; }
    const std::vector<std::string>& providers() const { return providers_; }
    const std::vector<std::string>& evaluators() const { return evaluators_; }
    const std::vector<std::string>& services() const { return services_; }
    const std::vector<std::string>& managers() const { return managers_; }

    // Take ownership of started clients
    void adopt_clients(std::vector<std::unique_ptr<ClientHandle>> clients);
    std::vector<std::string> client_names() const;

private:
    Character character_;
    std::optional<std::string> token_;
    StorageHandle storage_;
    std::vector<std::shared_ptr<const Plugin>> plugins_;
    std::vector<std::string> actions_;
    std::vector<std::string> providers_;
    std::vector<std::string> evaluators_;
    std::vector<std::string> services_;
    std::vector<std::string> managers_;
    bool initialized_ = false;
    std::vector<std::unique_ptr<ClientHandle>> clients_;
};

// Bind a character to its storage, credential and the baseline extensions
// plus any registered plugins the character names. No I/O. Throws
// std::invalid_argument for a missing or unknown model provider.
std::shared_ptr<AgentRuntime> create_runtime(Character character,
                                             StorageHandle storage,
                                             std::optional<std::string> token,
                                             const PluginRegistry& registry);

} // namespace troupe
