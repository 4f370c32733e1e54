#include <catch2/catch.hpp>
#include "storage/provisioner.hpp"
#include "storage/sqlite_database.hpp"
#include "storage/postgres_database.hpp"
#include "temp_dir.hpp"

#include <filesystem>

using namespace troupe;

TEST_CASE("ensure_data_dir: creates nested directories idempotently", "[storage]") {
    TempDir dir("prov");
    auto data = (dir.path / "a" / "b" / "data").string();
    ensure_data_dir(data);
    REQUIRE(std::filesystem::is_directory(data));
    REQUIRE_NOTHROW(ensure_data_dir(data));
}

TEST_CASE("ensure_data_dir: fails when a file is in the way", "[storage]") {
    TempDir dir("prov");
    auto file = dir.write("data", "x");
    REQUIRE_THROWS_AS(ensure_data_dir(file), std::runtime_error);
}

TEST_CASE("embedded_database_path: defaults to db.sqlite in data dir", "[storage]") {
    Config cfg;
    REQUIRE(embedded_database_path(cfg, "/var/troupe") == "/var/troupe/db.sqlite");
}

TEST_CASE("embedded_database_path: SQLITE_FILE overrides", "[storage]") {
    auto cfg = Config::from_settings({{"SQLITE_FILE", "/tmp/custom.sqlite"}});
    REQUIRE(embedded_database_path(cfg, "/var/troupe") == "/tmp/custom.sqlite");
}

TEST_CASE("provision_database: embedded backend by default", "[storage]") {
    TempDir dir("prov");
    Config cfg;
    auto db = provision_database(cfg, dir.str());
    REQUIRE(db->backend_name() == "sqlite");
    REQUIRE_FALSE(db->is_initialized());

    auto* sqlite = dynamic_cast<SqliteDatabaseAdapter*>(db.get());
    REQUIRE(sqlite != nullptr);
    REQUIRE(sqlite->path() == (dir.path / "db.sqlite").string());
}

TEST_CASE("provision_database: POSTGRES_URL selects networked backend", "[storage]") {
    auto cfg = Config::from_settings({
        {"POSTGRES_URL", "postgresql://db/agents"},
        {"SQLITE_FILE", "/tmp/ignored.sqlite"}
    });
    auto db = provision_database(cfg, "unused");
    REQUIRE(db->backend_name() == "postgres");

    auto* pg = dynamic_cast<PostgresDatabaseAdapter*>(db.get());
    REQUIRE(pg != nullptr);
    REQUIRE(pg->connection_string() == "postgresql://db/agents");
}

TEST_CASE("provision_database: every call returns a distinct instance", "[storage]") {
    TempDir dir("prov");
    Config cfg;
    auto first = provision_database(cfg, dir.str());
    auto second = provision_database(cfg, dir.str());
    REQUIRE(first.get() != second.get());
}

TEST_CASE("cache_for: keyed by character id", "[storage]") {
    TempDir dir("prov");
    SqliteDatabaseAdapter db(dir.str() + "/db.sqlite");
    db.init();

    Character c;
    c.name = "Eliza";
    c.id = "agent-1";
    auto cache = cache_for(c, db);
    cache->set("k", "v");
    REQUIRE(db.get_cache("k", "agent-1").has_value());

    auto& adapter = dynamic_cast<DbCacheAdapter&>(cache->adapter());
    REQUIRE(adapter.agent_id() == "agent-1");
}

TEST_CASE("cache_for: character without id is rejected", "[storage]") {
    TempDir dir("prov");
    SqliteDatabaseAdapter db(dir.str() + "/db.sqlite");
    Character c;
    c.name = "Anon";
    REQUIRE_THROWS_AS(cache_for(c, db), std::invalid_argument);
}
