#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

extern char** environ;

namespace troupe {

const char* storage_backend_name(StorageBackend backend) {
    switch (backend) {
        case StorageBackend::Networked: return "postgres";
        case StorageBackend::Embedded:  return "sqlite";
    }
    return "sqlite";
}

Settings parse_dotenv(const std::string& content) {
    Settings out;
    std::istringstream stream(content);
    std::string raw;
    while (std::getline(stream, raw)) {
        std::string line = trim(raw);
        if (line.empty() || line[0] == '#') continue;
        if (line.rfind("export ", 0) == 0) line = trim(line.substr(7));

        auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (value.size() >= 2 &&
            (value.front() == '"' || value.front() == '\'') &&
            value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        out[key] = value;
    }
    return out;
}

Settings load_dotenv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return {};
    std::ostringstream ss;
    ss << file.rdbuf();
    return parse_dotenv(ss.str());
}

static Settings environment_settings() {
    Settings out;
    for (char** env = environ; env && *env; ++env) {
        std::string entry = *env;
        auto eq = entry.find('=');
        if (eq == std::string::npos) continue;
        out[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    return out;
}

Config Config::load() {
    Settings settings = environment_settings();

    // .env only fills in what the environment does not already define
    for (auto& [key, value] : load_dotenv()) {
        settings.emplace(key, value);
    }

    return from_settings(std::move(settings));
}

Config Config::from_settings(Settings settings) {
    Config cfg;
    cfg.settings = std::move(settings);

    cfg.postgres_url = cfg.setting("POSTGRES_URL");
    cfg.sqlite_file = cfg.setting("SQLITE_FILE");
    cfg.storage_backend = cfg.postgres_url.empty() ? StorageBackend::Embedded
                                                   : StorageBackend::Networked;

    std::string v;
    if (!(v = cfg.setting("TROUPE_DATA_DIR")).empty())
        cfg.data_dir = expand_home(v);
    if (!(v = cfg.setting("TROUPE_CHARACTERS_DIR")).empty())
        cfg.characters_dir = expand_home(v);
    if (!(v = cfg.setting("API_URL")).empty())
        cfg.api_url = v;

    if (!(v = cfg.setting("SERVER_PORT")).empty()) {
        try {
            size_t used = 0;
            int port = std::stoi(v, &used);
            if (used != v.size() || port <= 0 || port > 65535) {
                throw std::out_of_range("port");
            }
            cfg.server_port = static_cast<uint16_t>(port);
        } catch (const std::exception&) {
            std::cerr << "[config] Invalid SERVER_PORT '" << v
                      << "', using " << cfg.server_port << "\n";
        }
    }

    if (!(v = cfg.setting("STARTUP_FAILURE_POLICY")).empty()) {
        std::string policy = to_lower(v);
        if (policy == "abort") {
            cfg.failure_policy = StartupFailurePolicy::Abort;
        } else if (policy == "continue") {
            cfg.failure_policy = StartupFailurePolicy::Continue;
        } else {
            std::cerr << "[config] Unknown STARTUP_FAILURE_POLICY '" << v
                      << "', using continue\n";
        }
    }

    return cfg;
}

std::string Config::setting(const std::string& key) const {
    auto it = settings.find(key);
    if (it != settings.end()) return it->second;
    return {};
}

} // namespace troupe
