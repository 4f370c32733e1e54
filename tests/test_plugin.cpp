#include <catch2/catch.hpp>
#include "plugin.hpp"
#include "client.hpp"
#include "runtime_fixture.hpp"

#include <algorithm>

using namespace troupe;

// ── Self-registration ────────────────────────────────────────────

TEST_CASE("PluginRegistry: baseline plugins self-register", "[plugin]") {
    auto& reg = PluginRegistry::instance();
    REQUIRE(reg.has_plugin("bootstrap"));
    REQUIRE(reg.has_plugin("node"));

    auto baseline = reg.baseline_plugins();
    REQUIRE(baseline.size() == 2);
    REQUIRE(baseline[0]->name == "bootstrap");
    REQUIRE(baseline[1]->name == "node");
}

TEST_CASE("PluginRegistry: bootstrap plugin contributes capabilities", "[plugin]") {
    auto bootstrap = PluginRegistry::instance().find_plugin("bootstrap");
    REQUIRE(bootstrap != nullptr);
    REQUIRE_FALSE(bootstrap->actions.empty());
    REQUIRE_FALSE(bootstrap->evaluators.empty());
    REQUIRE(std::find(bootstrap->providers.begin(), bootstrap->providers.end(), "time") !=
            bootstrap->providers.end());
}

TEST_CASE("PluginRegistry: auto client type self-registers", "[plugin]") {
    auto& reg = PluginRegistry::instance();
    REQUIRE(reg.has_client("auto"));
    REQUIRE(reg.has_client("AUTO"));

    auto client = reg.create_client("Auto");
    REQUIRE(client != nullptr);
    REQUIRE(client->name() == "auto");
}

// ── Registration and lookup ──────────────────────────────────────

TEST_CASE("PluginRegistry: register and find plugin", "[plugin]") {
    auto& reg = PluginRegistry::instance();
    Plugin p;
    p.name = "weather_plugin_test";
    p.actions = {"FORECAST"};
    reg.register_plugin(std::make_shared<const Plugin>(p));

    REQUIRE(reg.has_plugin("weather_plugin_test"));
    auto found = reg.find_plugin("weather_plugin_test");
    REQUIRE(found != nullptr);
    REQUIRE(found->actions == std::vector<std::string>{"FORECAST"});

    auto names = reg.plugin_names();
    REQUIRE(std::is_sorted(names.begin(), names.end()));
    REQUIRE(std::find(names.begin(), names.end(), "weather_plugin_test") != names.end());
}

TEST_CASE("PluginRegistry: last registration wins", "[plugin]") {
    auto& reg = PluginRegistry::instance();
    Plugin first;
    first.name = "dup_plugin_test";
    first.description = "first";
    Plugin second;
    second.name = "dup_plugin_test";
    second.description = "second";
    reg.register_plugin(std::make_shared<const Plugin>(first));
    reg.register_plugin(std::make_shared<const Plugin>(second));

    REQUIRE(reg.find_plugin("dup_plugin_test")->description == "second");
}

TEST_CASE("PluginRegistry: null plugin rejected", "[plugin]") {
    REQUIRE_THROWS_AS(PluginRegistry::instance().register_plugin(nullptr),
                      std::invalid_argument);
}

TEST_CASE("PluginRegistry: unknown lookups", "[plugin]") {
    auto& reg = PluginRegistry::instance();
    REQUIRE(reg.find_plugin("no_such_plugin_test") == nullptr);
    REQUIRE_FALSE(reg.has_client("no_such_client_test"));
    REQUIRE_THROWS_AS(reg.create_client("no_such_client_test"), std::invalid_argument);
}

TEST_CASE("PluginRegistry: client names are stored lowercase", "[plugin]") {
    static std::vector<std::string> log;
    auto& reg = PluginRegistry::instance();
    reg.register_client("MixedCase_Test", []() {
        return std::make_shared<RecordingClient>("mixedcase_test", log);
    });

    auto names = reg.client_names();
    REQUIRE(std::find(names.begin(), names.end(), "mixedcase_test") != names.end());
    REQUIRE(reg.create_client("MIXEDCASE_TEST")->name() == "mixedcase_test");
}
