#include <catch2/catch.hpp>
#include "config.hpp"
#include "temp_dir.hpp"

#include <cstdlib>

using namespace troupe;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values are sensible", "[config]") {
    Config cfg;
    REQUIRE(cfg.storage_backend == StorageBackend::Embedded);
    REQUIRE(cfg.data_dir == "data");
    REQUIRE(cfg.characters_dir == "characters");
    REQUIRE(cfg.api_url == "http://localhost");
    REQUIRE(cfg.server_port == 3000);
    REQUIRE(cfg.failure_policy == StartupFailurePolicy::Continue);
    REQUIRE(cfg.setting("OPENAI_API_KEY").empty());
}

// ── from_settings ────────────────────────────────────────────────

TEST_CASE("Config::from_settings: POSTGRES_URL selects networked backend", "[config]") {
    auto cfg = Config::from_settings({{"POSTGRES_URL", "postgresql://db/agents"}});
    REQUIRE(cfg.storage_backend == StorageBackend::Networked);
    REQUIRE(cfg.postgres_url == "postgresql://db/agents");
}

TEST_CASE("Config::from_settings: SQLITE_FILE does not override networked backend", "[config]") {
    auto cfg = Config::from_settings({
        {"POSTGRES_URL", "postgresql://db/agents"},
        {"SQLITE_FILE", "/tmp/other.sqlite"}
    });
    REQUIRE(cfg.storage_backend == StorageBackend::Networked);
    REQUIRE(cfg.sqlite_file == "/tmp/other.sqlite");
}

TEST_CASE("Config::from_settings: empty POSTGRES_URL keeps embedded backend", "[config]") {
    auto cfg = Config::from_settings({{"POSTGRES_URL", ""}});
    REQUIRE(cfg.storage_backend == StorageBackend::Embedded);
}

TEST_CASE("Config::from_settings: reads directories and bridge target", "[config]") {
    auto cfg = Config::from_settings({
        {"TROUPE_DATA_DIR", "/var/lib/troupe"},
        {"TROUPE_CHARACTERS_DIR", "/etc/troupe/characters"},
        {"API_URL", "http://agents.internal"},
        {"SERVER_PORT", "8080"}
    });
    REQUIRE(cfg.data_dir == "/var/lib/troupe");
    REQUIRE(cfg.characters_dir == "/etc/troupe/characters");
    REQUIRE(cfg.api_url == "http://agents.internal");
    REQUIRE(cfg.server_port == 8080);
}

TEST_CASE("Config::from_settings: invalid SERVER_PORT falls back to default", "[config]") {
    REQUIRE(Config::from_settings({{"SERVER_PORT", "abc"}}).server_port == 3000);
    REQUIRE(Config::from_settings({{"SERVER_PORT", "70000"}}).server_port == 3000);
    REQUIRE(Config::from_settings({{"SERVER_PORT", "80x"}}).server_port == 3000);
}

TEST_CASE("Config::from_settings: failure policy", "[config]") {
    REQUIRE(Config::from_settings({{"STARTUP_FAILURE_POLICY", "ABORT"}}).failure_policy ==
            StartupFailurePolicy::Abort);
    REQUIRE(Config::from_settings({{"STARTUP_FAILURE_POLICY", "continue"}}).failure_policy ==
            StartupFailurePolicy::Continue);
    REQUIRE(Config::from_settings({{"STARTUP_FAILURE_POLICY", "explode"}}).failure_policy ==
            StartupFailurePolicy::Continue);
}

TEST_CASE("Config::setting: returns raw values", "[config]") {
    auto cfg = Config::from_settings({{"OPENAI_API_KEY", "sk-123"}});
    REQUIRE(cfg.setting("OPENAI_API_KEY") == "sk-123");
    REQUIRE(cfg.setting("MISSING").empty());
}

TEST_CASE("storage_backend_name: names both backends", "[config]") {
    REQUIRE(std::string(storage_backend_name(StorageBackend::Networked)) == "postgres");
    REQUIRE(std::string(storage_backend_name(StorageBackend::Embedded)) == "sqlite");
}

// ── .env parsing ─────────────────────────────────────────────────

TEST_CASE("parse_dotenv: key value pairs, comments and quotes", "[config]") {
    auto s = parse_dotenv(
        "# comment\n"
        "\n"
        "OPENAI_API_KEY=sk-abc\n"
        "export SERVER_PORT=4000\n"
        "API_URL=\"http://example.com\"\n"
        "SINGLE='quoted value'\n"
        "SPACED = padded \n"
        "=novalue\n"
        "garbage line\n");

    REQUIRE(s.size() == 5);
    REQUIRE(s["OPENAI_API_KEY"] == "sk-abc");
    REQUIRE(s["SERVER_PORT"] == "4000");
    REQUIRE(s["API_URL"] == "http://example.com");
    REQUIRE(s["SINGLE"] == "quoted value");
    REQUIRE(s["SPACED"] == "padded");
}

TEST_CASE("load_dotenv: missing file yields empty settings", "[config]") {
    REQUIRE(load_dotenv("/nonexistent/troupe/.env").empty());
}

TEST_CASE("load_dotenv: reads file", "[config]") {
    TempDir dir("dotenv");
    auto path = dir.write(".env", "POSTGRES_URL=postgresql://x\n");
    auto s = load_dotenv(path);
    REQUIRE(s["POSTGRES_URL"] == "postgresql://x");
}

// ── load ─────────────────────────────────────────────────────────

TEST_CASE("Config::load: environment variables are picked up", "[config]") {
    setenv("TROUPE_TEST_MARKER", "present", 1);
    setenv("SERVER_PORT", "3999", 1);
    auto cfg = Config::load();
    REQUIRE(cfg.setting("TROUPE_TEST_MARKER") == "present");
    REQUIRE(cfg.server_port == 3999);
    unsetenv("TROUPE_TEST_MARKER");
    unsetenv("SERVER_PORT");
}
