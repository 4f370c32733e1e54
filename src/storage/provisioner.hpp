#pragma once
#include "database.hpp"
#include "cache.hpp"
#include "../character.hpp"
#include "../config.hpp"
#include <functional>
#include <memory>
#include <string>

namespace troupe {

// Persistence + cache pair owned by exactly one runtime.
// Member order matters: the cache refers to the database and is destroyed first.
struct StorageHandle {
    std::unique_ptr<DatabaseAdapter> database;
    std::unique_ptr<CacheManager> cache;
};

// Builds a fresh, uninitialized adapter for one character
using DatabaseFactory = std::function<std::unique_ptr<DatabaseAdapter>(
    const Config& config, const std::string& data_dir)>;

// Create the data directory (with parents) if missing. Idempotent.
void ensure_data_dir(const std::string& data_dir);

// SQLITE_FILE override, else <data_dir>/db.sqlite
std::string embedded_database_path(const Config& config, const std::string& data_dir);

// New adapter for the configured backend. Never shared: every call returns
// a distinct instance. The caller must init() it before use.
std::unique_ptr<DatabaseAdapter> provision_database(const Config& config,
                                                    const std::string& data_dir);

// Cache over an initialized database, keyed by the character's id
std::unique_ptr<CacheManager> cache_for(const Character& character, DatabaseAdapter& db);

} // namespace troupe
