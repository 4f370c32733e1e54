#include "registry.hpp"
#include "runtime.hpp"
#include "util.hpp"
#include <stdexcept>

namespace troupe {

void AgentRegistry::register_agent(std::shared_ptr<AgentRuntime> runtime) {
    if (!runtime) throw std::invalid_argument("Cannot register null runtime");
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string& id = runtime->agent_id();
    if (agents_.find(id) == agents_.end()) order_.push_back(id);
    agents_[id] = std::move(runtime);
}

std::shared_ptr<AgentRuntime> AgentRegistry::find(const std::string& id_or_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(id_or_name);
    if (it != agents_.end()) return it->second;

    for (const auto& id : order_) {
        const auto& runtime = agents_.at(id);
        if (iequals(runtime->character().name, id_or_name)) return runtime;
    }
    return nullptr;
}

bool AgentRegistry::contains(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return agents_.count(agent_id) > 0;
}

size_t AgentRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return agents_.size();
}

std::vector<std::string> AgentRegistry::agent_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_;
}

} // namespace troupe
