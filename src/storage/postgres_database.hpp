#pragma once
#include "database.hpp"
#include <mutex>
#include <string>
#include <vector>

struct pg_conn; // forward declare (PGconn)

namespace troupe {

// Networked relational store over libpq
class PostgresDatabaseAdapter : public DatabaseAdapter {
public:
    explicit PostgresDatabaseAdapter(std::string connection_string);
    ~PostgresDatabaseAdapter() override;

    // Non-copyable
    PostgresDatabaseAdapter(const PostgresDatabaseAdapter&) = delete;
    PostgresDatabaseAdapter& operator=(const PostgresDatabaseAdapter&) = delete;

    std::string backend_name() const override { return "postgres"; }
    const std::string& connection_string() const { return connection_string_; }

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
    void require_open() const;

    pg_conn* conn_ = nullptr;
    std::string connection_string_;
    mutable std::mutex mutex_;
};

} // namespace troupe
