#include "provisioner.hpp"
#include "sqlite_database.hpp"
#include "postgres_database.hpp"
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace troupe {

void ensure_data_dir(const std::string& data_dir) {
    std::error_code ec;
    std::filesystem::create_directories(data_dir, ec);
    if (ec) {
        throw std::runtime_error("cannot create data directory " + data_dir +
                                 ": " + ec.message());
    }
}

std::string embedded_database_path(const Config& config, const std::string& data_dir) {
    if (!config.sqlite_file.empty()) return config.sqlite_file;
    return (std::filesystem::path(data_dir) / "db.sqlite").string();
}

std::unique_ptr<DatabaseAdapter> provision_database(const Config& config,
                                                    const std::string& data_dir) {
    switch (config.storage_backend) {
        case StorageBackend::Networked:
            std::cerr << "[storage] Using postgres database\n";
            return std::make_unique<PostgresDatabaseAdapter>(config.postgres_url);
        case StorageBackend::Embedded: {
            std::string path = embedded_database_path(config, data_dir);
            std::cerr << "[storage] Using sqlite database at " << path << "\n";
            return std::make_unique<SqliteDatabaseAdapter>(path);
        }
    }
    throw std::logic_error("unhandled storage backend");
}

std::unique_ptr<CacheManager> cache_for(const Character& character, DatabaseAdapter& db) {
    if (character.id.empty()) {
        throw std::invalid_argument("cache requires a character id");
    }
    return std::make_unique<CacheManager>(
        std::make_unique<DbCacheAdapter>(db, character.id));
}

} // namespace troupe
