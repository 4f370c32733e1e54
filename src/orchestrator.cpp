#include "orchestrator.hpp"
#include "secrets.hpp"
#include <iostream>

namespace troupe {

const char* startup_state_name(StartupState state) {
    switch (state) {
        case StartupState::LoadingCredential:   return "loading credential";
        case StartupState::ProvisioningStorage: return "provisioning storage";
        case StartupState::BuildingRuntime:     return "building runtime";
        case StartupState::InitializingRuntime: return "initializing runtime";
        case StartupState::AttachingClients:    return "attaching clients";
        case StartupState::Registered:          return "registered";
        case StartupState::Failed:              return "failed";
    }
    return "unknown";
}

AgentOrchestrator::AgentOrchestrator(const Config& config,
                                     AgentRegistry& registry,
                                     const PluginRegistry& plugins,
                                     DatabaseFactory database_factory)
    : config_(config),
      registry_(registry),
      plugins_(plugins),
      database_factory_(std::move(database_factory)) {}

void AgentOrchestrator::enter(StartupState state, const Character& character) {
    state_ = state;
    std::cerr << "[agent] " << character.name << ": " << startup_state_name(state) << "\n";
}

std::shared_ptr<AgentRuntime> AgentOrchestrator::start_agent(Character& character) {
    try {
        enter(StartupState::LoadingCredential, character);
        ensure_identity(character);
        auto token = resolve_provider_token(character.model_provider, character, config_);
        if (!token) {
            std::cerr << "[agent] " << character.name << ": no credential for provider '"
                      << character.model_provider << "'\n";
        }

        enter(StartupState::ProvisioningStorage, character);
        ensure_data_dir(config_.data_dir);
        StorageHandle storage;
        storage.database = database_factory_(config_, config_.data_dir);
        if (!storage.database) {
            throw std::runtime_error("no database adapter was provisioned");
        }
        storage.database->init();
        storage.cache = cache_for(character, *storage.database);

        enter(StartupState::BuildingRuntime, character);
        auto runtime = create_runtime(character, std::move(storage), std::move(token), plugins_);

        enter(StartupState::InitializingRuntime, character);
        runtime->initialize();

        enter(StartupState::AttachingClients, character);
        runtime->adopt_clients(attach_clients(character, *runtime, plugins_));

        registry_.register_agent(runtime);
        enter(StartupState::Registered, character);
        return runtime;
    } catch (const std::exception& e) {
        StartupState failed_in = state_;
        state_ = StartupState::Failed;
        std::cerr << "[agent] Error starting agent for character " << character.name
                  << " (" << startup_state_name(failed_in) << "): " << e.what() << "\n";
        throw AgentStartupError(character.name, failed_in, e.what());
    }
}

StartupReport AgentOrchestrator::start_agents(std::vector<Character>& characters) {
    StartupReport report;
    for (auto& character : characters) {
        try {
            auto runtime = start_agent(character);
            report.registered.push_back(runtime->agent_id());
        } catch (const AgentStartupError& e) {
            report.failures.push_back({e.character_name(), e.failed_state(), e.cause()});
            if (config_.failure_policy == StartupFailurePolicy::Abort) throw;
        }
    }

    std::cerr << "[agent] Started " << report.registered.size() << " of "
              << characters.size() << " agent(s)\n";
    return report;
}

} // namespace troupe
