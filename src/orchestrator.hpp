#pragma once
#include "character.hpp"
#include "config.hpp"
#include "plugin.hpp"
#include "registry.hpp"
#include "runtime.hpp"
#include "storage/provisioner.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace troupe {

// Per-character startup progression. Any state may move to Failed.
enum class StartupState {
    LoadingCredential,
    ProvisioningStorage,
    BuildingRuntime,
    InitializingRuntime,
    AttachingClients,
    Registered,
    Failed
};

const char* startup_state_name(StartupState state);

// One character failed to start. Carries the state it failed in.
class AgentStartupError : public std::runtime_error {
public:
    AgentStartupError(std::string character_name, StartupState state, const std::string& cause)
        : std::runtime_error("Error starting agent for character " + character_name +
                             " (" + startup_state_name(state) + "): " + cause),
          character_name_(std::move(character_name)), state_(state), cause_(cause) {}

    const std::string& character_name() const { return character_name_; }
    StartupState failed_state() const { return state_; }
    const std::string& cause() const { return cause_; }

private:
    std::string character_name_;
    StartupState state_;
    std::string cause_;
};

struct StartupFailure {
    std::string character_name;
    StartupState state;
    std::string error;
};

struct StartupReport {
    std::vector<std::string> registered;   // agent ids, in start order
    std::vector<StartupFailure> failures;

    bool all_started() const { return failures.empty(); }
};

class AgentOrchestrator {
public:
    AgentOrchestrator(const Config& config,
                      AgentRegistry& registry,
                      const PluginRegistry& plugins = PluginRegistry::instance(),
                      DatabaseFactory database_factory = provision_database);

    // Drive one character from credential lookup to registration. Fills in
    // the character's id and username. Throws AgentStartupError.
    std::shared_ptr<AgentRuntime> start_agent(Character& character);

    // Start characters strictly in order. Per-character failures are logged
    // and collected; with StartupFailurePolicy::Abort the first one is
    // rethrown after being recorded.
    StartupReport start_agents(std::vector<Character>& characters);

private:
    void enter(StartupState state, const Character& character);

    const Config& config_;
    AgentRegistry& registry_;
    const PluginRegistry& plugins_;
    DatabaseFactory database_factory_;
    StartupState state_ = StartupState::LoadingCredential;
};

} // namespace troupe
