#include <catch2/catch.hpp>
#include "orchestrator.hpp"
#include "character_loader.hpp"
#include "storage/sqlite_database.hpp"
#include "runtime_fixture.hpp"

#include <filesystem>
#include <set>

using namespace troupe;

static Config config_in(const TempDir& dir) {
    Config cfg;
    cfg.data_dir = (dir.path / "data").string();
    cfg.characters_dir = dir.str();
    return cfg;
}

// One SQLite file per character so agents never share a database
static DatabaseFactory per_agent_sqlite(std::vector<DatabaseAdapter*>& created) {
    return [&created](const Config&, const std::string& data_dir) {
        auto path = std::filesystem::path(data_dir) /
                    ("agent_" + std::to_string(created.size()) + ".sqlite");
        auto db = std::make_unique<SqliteDatabaseAdapter>(path.string());
        created.push_back(db.get());
        return std::unique_ptr<DatabaseAdapter>(std::move(db));
    };
}

// ── start_agent ──────────────────────────────────────────────────

TEST_CASE("AgentOrchestrator: starts and registers one character", "[orchestrator]") {
    TempDir dir("orch");
    auto cfg = config_in(dir);
    AgentRegistry registry;
    AgentOrchestrator orchestrator(cfg, registry);

    Character c;
    c.name = "Eliza";
    c.model_provider = "llama_local";
    auto runtime = orchestrator.start_agent(c);

    REQUIRE(runtime != nullptr);
    REQUIRE(c.id == string_to_uuid("Eliza"));
    REQUIRE(c.username == "Eliza");
    REQUIRE(runtime->initialized());
    REQUIRE(registry.contains(c.id));
    REQUIRE(std::filesystem::is_directory(cfg.data_dir));
    REQUIRE(std::filesystem::exists(std::filesystem::path(cfg.data_dir) / "db.sqlite"));
}

TEST_CASE("AgentOrchestrator: credential resolved into runtime", "[orchestrator]") {
    TempDir dir("orch");
    auto cfg = config_in(dir);
    cfg.settings["OPENAI_API_KEY"] = "sk-process";
    AgentRegistry registry;
    AgentOrchestrator orchestrator(cfg, registry);

    Character c;
    c.name = "Keyed";
    c.model_provider = "openai";
    c.secrets["OPENAI_API_KEY"] = "sk-character";
    auto runtime = orchestrator.start_agent(c);
    REQUIRE(runtime->token() == std::optional<std::string>("sk-character"));
}

TEST_CASE("AgentOrchestrator: missing model provider fails while building runtime",
          "[orchestrator]") {
    TempDir dir("orch");
    auto cfg = config_in(dir);
    AgentRegistry registry;
    AgentOrchestrator orchestrator(cfg, registry);

    Character c;
    c.name = "Unfinished";
    try {
        orchestrator.start_agent(c);
        FAIL("expected AgentStartupError");
    } catch (const AgentStartupError& e) {
        REQUIRE(e.character_name() == "Unfinished");
        REQUIRE(e.failed_state() == StartupState::BuildingRuntime);
        REQUIRE(std::string(e.what()).find("Unfinished") != std::string::npos);
    }
    REQUIRE(registry.size() == 0);
}

TEST_CASE("AgentOrchestrator: storage failure is reported as provisioning", "[orchestrator]") {
    TempDir dir("orch");
    auto cfg = config_in(dir);
    AgentRegistry registry;
    auto blocker = dir.write("blocker", "file");
    AgentOrchestrator orchestrator(cfg, registry, PluginRegistry::instance(),
        [blocker](const Config&, const std::string&) {
            return std::unique_ptr<DatabaseAdapter>(
                std::make_unique<SqliteDatabaseAdapter>(blocker + "/db.sqlite"));
        });

    auto c = test_character("Stranded");
    try {
        orchestrator.start_agent(c);
        FAIL("expected AgentStartupError");
    } catch (const AgentStartupError& e) {
        REQUIRE(e.failed_state() == StartupState::ProvisioningStorage);
    }
}

TEST_CASE("AgentOrchestrator: factory returning nothing fails provisioning", "[orchestrator]") {
    TempDir dir("orch");
    auto cfg = config_in(dir);
    AgentRegistry registry;
    AgentOrchestrator orchestrator(cfg, registry, PluginRegistry::instance(),
        [](const Config&, const std::string&) { return std::unique_ptr<DatabaseAdapter>(); });

    auto c = test_character("Nothing");
    REQUIRE_THROWS_AS(orchestrator.start_agent(c), AgentStartupError);
}

// ── start_agents ─────────────────────────────────────────────────

TEST_CASE("AgentOrchestrator: each agent gets its own storage instance", "[orchestrator]") {
    TempDir dir("orch");
    auto cfg = config_in(dir);
    AgentRegistry registry;
    std::vector<DatabaseAdapter*> created;
    AgentOrchestrator orchestrator(cfg, registry, PluginRegistry::instance(),
                                   per_agent_sqlite(created));

    std::vector<Character> chars = {test_character("One"), test_character("Two"),
                                    test_character("Three")};
    auto report = orchestrator.start_agents(chars);

    REQUIRE(report.all_started());
    REQUIRE(created.size() == 3);
    std::set<DatabaseAdapter*> distinct(created.begin(), created.end());
    REQUIRE(distinct.size() == 3);

    for (size_t i = 0; i < chars.size(); i++) {
        REQUIRE(&registry.find(chars[i].id)->database() == created[i]);
    }
}

TEST_CASE("AgentOrchestrator: one failure does not stop siblings", "[orchestrator]") {
    TempDir dir("orch");
    auto cfg = config_in(dir);
    AgentRegistry registry;
    AgentOrchestrator orchestrator(cfg, registry);

    std::vector<Character> chars = {test_character("First"),
                                    test_character("Broken", "skynet"),
                                    test_character("Third")};
    auto report = orchestrator.start_agents(chars);

    REQUIRE_FALSE(report.all_started());
    REQUIRE(report.failures.size() == 1);
    REQUIRE(report.failures[0].character_name == "Broken");
    REQUIRE(report.failures[0].state == StartupState::BuildingRuntime);
    REQUIRE(report.registered == std::vector<std::string>{chars[0].id, chars[2].id});
    REQUIRE(registry.agent_ids() == report.registered);
}

TEST_CASE("AgentOrchestrator: abort policy stops at the first failure", "[orchestrator]") {
    TempDir dir("orch");
    auto cfg = config_in(dir);
    cfg.failure_policy = StartupFailurePolicy::Abort;
    AgentRegistry registry;
    AgentOrchestrator orchestrator(cfg, registry);

    std::vector<Character> chars = {test_character("First"),
                                    test_character("Broken", ""),
                                    test_character("Never")};
    REQUIRE_THROWS_AS(orchestrator.start_agents(chars), AgentStartupError);
    REQUIRE(registry.size() == 1);
    REQUIRE(registry.contains(chars[0].id));
    REQUIRE_FALSE(registry.contains(chars[2].id));
}

TEST_CASE("AgentOrchestrator: two files, one missing modelProvider", "[orchestrator]") {
    TempDir dir("orch");
    auto cfg = config_in(dir);
    dir.write("ok.json", R"({"name": "Ready", "modelProvider": "openai"})");
    dir.write("incomplete.json", R"({"name": "Incomplete"})");

    auto chars = load_characters("ok.json,incomplete.json", cfg);
    REQUIRE(chars.size() == 2);

    AgentRegistry registry;
    AgentOrchestrator orchestrator(cfg, registry);
    auto report = orchestrator.start_agents(chars);

    REQUIRE(registry.size() == 1);
    REQUIRE(registry.find("Ready") != nullptr);
    REQUIRE(registry.find("Incomplete") == nullptr);
    REQUIRE(report.failures.size() == 1);
}

TEST_CASE("AgentOrchestrator: default character starts with no arguments", "[orchestrator]") {
    TempDir dir("orch");
    auto cfg = config_in(dir);
    auto chars = load_characters("", cfg);

    AgentRegistry registry;
    AgentOrchestrator orchestrator(cfg, registry);
    auto report = orchestrator.start_agents(chars);

    REQUIRE(report.all_started());
    REQUIRE(registry.find("Eliza") != nullptr);
}

TEST_CASE("startup_state_name: names every state", "[orchestrator]") {
    REQUIRE(std::string(startup_state_name(StartupState::LoadingCredential)) ==
            "loading credential");
    REQUIRE(std::string(startup_state_name(StartupState::AttachingClients)) ==
            "attaching clients");
    REQUIRE(std::string(startup_state_name(StartupState::Failed)) == "failed");
}
