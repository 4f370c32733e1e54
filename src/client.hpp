#pragma once
#include "character.hpp"
#include <memory>
#include <string>
#include <vector>

namespace troupe {

class AgentRuntime;   // forward declaration
class PluginRegistry; // forward declaration

// A started communication client bound to one runtime
class ClientHandle {
public:
    virtual ~ClientHandle() = default;
    virtual std::string client_name() const = 0;

    // Stop the client. Must be idempotent.
    virtual void stop() {}
};

// Startable client type (built-in or plugin-declared)
class ClientInterface {
public:
    virtual ~ClientInterface() = default;
    virtual std::string name() const = 0;

    // Start against a runtime. A null handle means "did not start" and is
    // skipped by the attacher; exceptions propagate.
    virtual std::unique_ptr<ClientHandle> start(AgentRuntime& runtime) = 0;
};

// Start the character's clients: its declared client types first (case-
// insensitive, unknown types logged and skipped), then clients declared by
// each of its plugins, all in declaration order.
std::vector<std::unique_ptr<ClientHandle>> attach_clients(const Character& character,
                                                          AgentRuntime& runtime,
                                                          const PluginRegistry& registry);

} // namespace troupe
