#include "plugin.hpp"
#include "util.hpp"
#include <stdexcept>
#include <algorithm>

namespace troupe {

const char* const kBaselinePlugins[2] = {"bootstrap", "node"};

PluginRegistry& PluginRegistry::instance() {
    static PluginRegistry registry;
    return registry;
}

void PluginRegistry::register_plugin(std::shared_ptr<const Plugin> plugin) {
    if (!plugin) throw std::invalid_argument("Cannot register null plugin");
    std::lock_guard<std::mutex> lock(mutex_);
    plugins_[plugin->name] = std::move(plugin);
}

void PluginRegistry::register_client(const std::string& name, ClientFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    clients_[to_lower(name)] = std::move(factory);
}

std::shared_ptr<const Plugin> PluginRegistry::find_plugin(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = plugins_.find(name);
    if (it == plugins_.end()) return nullptr;
    return it->second;
}

std::shared_ptr<ClientInterface> PluginRegistry::create_client(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(to_lower(name));
    if (it == clients_.end()) {
        throw std::invalid_argument("Unknown client: " + name);
    }
    return it->second();
}

std::vector<std::shared_ptr<const Plugin>> PluginRegistry::baseline_plugins() const {
    std::vector<std::shared_ptr<const Plugin>> result;
    for (const char* name : kBaselinePlugins) {
        auto plugin = find_plugin(name);
        if (!plugin) {
            throw std::logic_error(std::string("Baseline plugin not registered: ") + name);
        }
        result.push_back(std::move(plugin));
    }
    return result;
}

std::vector<std::string> PluginRegistry::plugin_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(plugins_.size());
    for (const auto& [name, _] : plugins_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> PluginRegistry::client_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(clients_.size());
    for (const auto& [name, _] : clients_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool PluginRegistry::has_plugin(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return plugins_.count(name) > 0;
}

bool PluginRegistry::has_client(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.count(to_lower(name)) > 0;
}

} // namespace troupe
