#pragma once
#include <string>
#include <cstdint>
#include <unordered_map>

namespace troupe {

// Durable store selected once at startup
enum class StorageBackend { Networked, Embedded };

// What the orchestrator does when one character fails to start
enum class StartupFailurePolicy { Continue, Abort };

const char* storage_backend_name(StorageBackend backend);

using Settings = std::unordered_map<std::string, std::string>;

struct Config {
    // Raw settings: process environment merged with .env
    Settings settings;

    StorageBackend storage_backend = StorageBackend::Embedded;
    std::string postgres_url;
    std::string sqlite_file;   // empty = <data_dir>/db.sqlite

    std::string data_dir = "data";
    std::string characters_dir = "characters";

    std::string api_url = "http://localhost";
    uint16_t server_port = 3000;

    StartupFailurePolicy failure_policy = StartupFailurePolicy::Continue;

    // Load from the process environment + ./.env (environment wins)
    static Config load();

    // Build typed fields from a settings map (used by load() and tests)
    static Config from_settings(Settings settings);

    // Raw setting lookup; empty if absent
    std::string setting(const std::string& key) const;
};

// Parse KEY=VALUE lines of a .env file. Blank lines and '#' comments are
// skipped, an optional "export " prefix is dropped and matching surrounding
// quotes are stripped from values.
Settings parse_dotenv(const std::string& content);

// Read ./.env (or the given path) if present; empty map otherwise.
Settings load_dotenv(const std::string& path = ".env");

} // namespace troupe
