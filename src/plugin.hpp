#pragma once
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <mutex>

namespace troupe {

class ClientInterface; // forward declaration

// Capability extension attached to a runtime. Names only: behaviour behind
// them belongs to the agent engine.
struct Plugin {
    std::string name;
    std::string description;
    std::vector<std::string> actions;
    std::vector<std::string> providers;
    std::vector<std::string> evaluators;
    std::vector<std::string> services;
    std::vector<std::shared_ptr<ClientInterface>> clients;
};

using ClientFactory = std::function<std::shared_ptr<ClientInterface>()>;

// Extensions always attached to every runtime, in this order
extern const char* const kBaselinePlugins[2];

// Central registry for self-registering plugins and client types.
// All methods are thread-safe.
class PluginRegistry {
public:
    static PluginRegistry& instance();

    // Registration (last registration for a name wins)
    void register_plugin(std::shared_ptr<const Plugin> plugin);
    void register_client(const std::string& name, ClientFactory factory);

    // Lookup. Client names are case-insensitive.
    std::shared_ptr<const Plugin> find_plugin(const std::string& name) const;
    std::shared_ptr<ClientInterface> create_client(const std::string& name) const;

    // Baseline extensions; throws std::logic_error if one is not registered
    std::vector<std::shared_ptr<const Plugin>> baseline_plugins() const;

    // Query
    std::vector<std::string> plugin_names() const;
    std::vector<std::string> client_names() const;
    bool has_plugin(const std::string& name) const;
    bool has_client(const std::string& name) const;

private:
    PluginRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<const Plugin>> plugins_;
    std::unordered_map<std::string, ClientFactory> clients_;
};

// ── Self-registrar helpers (used at file scope in each plugin .cpp) ──

struct PluginRegistrar {
    explicit PluginRegistrar(Plugin plugin) {
        PluginRegistry::instance().register_plugin(
            std::make_shared<const Plugin>(std::move(plugin)));
    }
};

struct ClientRegistrar {
    ClientRegistrar(const std::string& name, ClientFactory factory) {
        PluginRegistry::instance().register_client(name, std::move(factory));
    }
};

} // namespace troupe
