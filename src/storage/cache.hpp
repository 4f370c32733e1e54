#pragma once
#include "database.hpp"
#include <memory>
#include <optional>
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace troupe {

// Raw string cache backend
class CacheAdapter {
public:
    virtual ~CacheAdapter() = default;
    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual void set(const std::string& key, const std::string& value) = 0;
    virtual bool remove(const std::string& key) = 0;
};

// Cache rows stored in the agent's database, scoped by agent id.
// The database must outlive the adapter.
class DbCacheAdapter : public CacheAdapter {
public:
    DbCacheAdapter(DatabaseAdapter& db, std::string agent_id);

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value) override;
    bool remove(const std::string& key) override;

    const std::string& agent_id() const { return agent_id_; }

private:
    DatabaseAdapter& db_;
    std::string agent_id_;
};

// JSON value cache with optional expiry. Entries are stored as
// {"value": ..., "expires": <epoch ms, 0 = never>}; expired or corrupt
// entries read as absent and are removed.
class CacheManager {
public:
    explicit CacheManager(std::unique_ptr<CacheAdapter> adapter);

    std::optional<nlohmann::json> get(const std::string& key);
    void set(const std::string& key, const nlohmann::json& value,
             uint64_t expires_at_ms = 0);
    bool remove(const std::string& key);

    CacheAdapter& adapter() { return *adapter_; }

private:
    std::unique_ptr<CacheAdapter> adapter_;
};

} // namespace troupe
