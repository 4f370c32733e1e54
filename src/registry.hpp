#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace troupe {

class AgentRuntime; // forward declaration

// Directory of running agents, shared with the front-end service that
// routes /{agentId}/message. One instance per process, passed explicitly.
// Entries are never removed; registering an id again replaces the entry.
// All methods are thread-safe.
class AgentRegistry {
public:
    void register_agent(std::shared_ptr<AgentRuntime> runtime);

    // Lookup by agent id, falling back to a case-insensitive character name
    std::shared_ptr<AgentRuntime> find(const std::string& id_or_name) const;

    bool contains(const std::string& agent_id) const;
    size_t size() const;

    // Agent ids in registration order
    std::vector<std::string> agent_ids() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<AgentRuntime>> agents_;
    std::vector<std::string> order_;
};

} // namespace troupe
