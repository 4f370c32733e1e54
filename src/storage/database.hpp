#pragma once
#include <string>
#include <optional>
#include <cstdint>

namespace troupe {

struct Account {
    std::string id;
    std::string name;
    std::string username;
};

// Durable store behind one agent runtime. init() must complete before any
// other call; every other call throws std::runtime_error when the adapter
// is not initialized.
class DatabaseAdapter {
public:
    virtual ~DatabaseAdapter() = default;

    virtual std::string backend_name() const = 0;

    // Open the connection/file and create the schema. Throws on failure.
    virtual void init() = 0;
    virtual void close() = 0;
    virtual bool is_initialized() const = 0;

    // Insert the account if missing. Returns true if it was created.
    virtual bool ensure_account(const Account& account) = 0;
    virtual std::optional<Account> get_account(const std::string& id) = 0;

    // Idempotent room/participant bookkeeping
    virtual void ensure_room(const std::string& room_id) = 0;
    virtual void ensure_participant(const std::string& user_id,
                                    const std::string& room_id) = 0;
    virtual bool is_participant(const std::string& user_id,
                                const std::string& room_id) = 0;

    // Raw cache rows, scoped by agent id
    virtual std::optional<std::string> get_cache(const std::string& key,
                                                 const std::string& agent_id) = 0;
    virtual void set_cache(const std::string& key, const std::string& agent_id,
                           const std::string& value) = 0;
    virtual bool delete_cache(const std::string& key, const std::string& agent_id) = 0;
};

} // namespace troupe
