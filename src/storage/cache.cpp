#include "cache.hpp"
#include "../util.hpp"

namespace troupe {

DbCacheAdapter::DbCacheAdapter(DatabaseAdapter& db, std::string agent_id)
    : db_(db), agent_id_(std::move(agent_id)) {}

std::optional<std::string> DbCacheAdapter::get(const std::string& key) {
    return db_.get_cache(key, agent_id_);
}

void DbCacheAdapter::set(const std::string& key, const std::string& value) {
    db_.set_cache(key, agent_id_, value);
}

bool DbCacheAdapter::remove(const std::string& key) {
    return db_.delete_cache(key, agent_id_);
}

CacheManager::CacheManager(std::unique_ptr<CacheAdapter> adapter)
    : adapter_(std::move(adapter)) {}

std::optional<nlohmann::json> CacheManager::get(const std::string& key) {
    auto raw = adapter_->get(key);
    if (!raw) return std::nullopt;

    nlohmann::json entry = nlohmann::json::parse(*raw, nullptr, false);
    if (entry.is_discarded() || !entry.is_object() || !entry.contains("value")) {
        adapter_->remove(key);
        return std::nullopt;
    }

    uint64_t expires = 0;
    if (entry.contains("expires") && entry["expires"].is_number_unsigned())
        expires = entry["expires"].get<uint64_t>();
    if (expires != 0 && expires <= epoch_millis()) {
        adapter_->remove(key);
        return std::nullopt;
    }
    return entry["value"];
}

void CacheManager::set(const std::string& key, const nlohmann::json& value,
                       uint64_t expires_at_ms) {
    nlohmann::json entry = {{"value", value}, {"expires", expires_at_ms}};
    adapter_->set(key, entry.dump());
}

bool CacheManager::remove(const std::string& key) {
    return adapter_->remove(key);
}

} // namespace troupe
