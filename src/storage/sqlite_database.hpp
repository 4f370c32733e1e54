#pragma once
#include "database.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace troupe {

// Embedded file-backed store
class SqliteDatabaseAdapter : public DatabaseAdapter {
public:
    explicit SqliteDatabaseAdapter(std::string path);
    ~SqliteDatabaseAdapter() override;

    // Non-copyable
    SqliteDatabaseAdapter(const SqliteDatabaseAdapter&) = delete;
    SqliteDatabaseAdapter& operator=(const SqliteDatabaseAdapter&) = delete;

    std::string backend_name() const override { return "sqlite"; }
    const std::string& path() const { return path_; }

    void init() override;
    void close() override;
    bool is_initialized() const override;

    bool ensure_account(const Account& account) override;
    std::optional<Account> get_account(const std::string& id) override;

    void ensure_room(const std::string& room_id) override;
    void ensure_participant(const std::string& user_id,
                            const std::string& room_id) override;
    bool is_participant(const std::string& user_id,
                        const std::string& room_id) override;

    std::optional<std::string> get_cache(const std::string& key,
                                         const std::string& agent_id) override;
    void set_cache(const std::string& key, const std::string& agent_id,
                   const std::string& value) override;
    bool delete_cache(const std::string& key, const std::string& agent_id) override;

private:
    void init_schema();
    void exec(const char* sql);
    void require_open() const;

    sqlite3* db_ = nullptr;
    std::string path_;
    mutable std::mutex mutex_;
};

} // namespace troupe
