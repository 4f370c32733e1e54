#include "postgres_database.hpp"
#include <libpq-fe.h>
#include <stdexcept>

namespace troupe {

// RAII wrapper for PGresult
struct ResultGuard {
    PGresult* res = nullptr;
    ~ResultGuard() { if (res) PQclear(res); }
};

static std::string trim_error(const char* msg) {
    std::string s = msg ? msg : "unknown error";
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
    return s;
}

// Run a parameterized statement; throws unless the status is expected.
static void run(PGconn* conn, const char* sql, const std::vector<std::string>& params,
                ResultGuard& g, ExecStatusType expected) {
    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) values.push_back(p.c_str());

    g.res = PQexecParams(conn, sql, static_cast<int>(values.size()), nullptr,
                         values.empty() ? nullptr : values.data(),
                         nullptr, nullptr, 0);
    if (!g.res || PQresultStatus(g.res) != expected) {
        throw std::runtime_error("postgres: " + trim_error(PQerrorMessage(conn)));
    }
}

PostgresDatabaseAdapter::PostgresDatabaseAdapter(std::string connection_string)
    : connection_string_(std::move(connection_string)) {}

PostgresDatabaseAdapter::~PostgresDatabaseAdapter() {
    close();
}

void PostgresDatabaseAdapter::init() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (conn_) return;

    conn_ = PQconnectdb(connection_string_.c_str());
    if (!conn_ || PQstatus(conn_) != CONNECTION_OK) {
        std::string err = conn_ ? trim_error(PQerrorMessage(conn_)) : "out of memory";
        if (conn_) {
            PQfinish(conn_);
            conn_ = nullptr;
        }
        throw std::runtime_error("postgres: connection failed: " + err);
    }

    try {
        init_schema();
    } catch (...) {
        PQfinish(conn_);
        conn_ = nullptr;
        throw;
    }
}

void PostgresDatabaseAdapter::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

bool PostgresDatabaseAdapter::is_initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return conn_ != nullptr;
}

void PostgresDatabaseAdapter::require_open() const {
    if (!conn_) throw std::runtime_error("postgres: database not initialized");
}

void PostgresDatabaseAdapter::init_schema() {
    static const char* statements[] = {
        "CREATE TABLE IF NOT EXISTS accounts ("
        "  id         TEXT PRIMARY KEY,"
        "  name       TEXT NOT NULL,"
        "  username   TEXT NOT NULL,"
        "  details    JSONB NOT NULL DEFAULT '{}'::jsonb,"
        "  created_at TIMESTAMPTZ NOT NULL DEFAULT now()"
        ");",

        "CREATE TABLE IF NOT EXISTS rooms ("
        "  id         TEXT PRIMARY KEY,"
        "  created_at TIMESTAMPTZ NOT NULL DEFAULT now()"
        ");",

        "CREATE TABLE IF NOT EXISTS participants ("
        "  user_id    TEXT NOT NULL,"
        "  room_id    TEXT NOT NULL,"
        "  created_at TIMESTAMPTZ NOT NULL DEFAULT now(),"
        "  PRIMARY KEY (user_id, room_id)"
        ");",

        "CREATE TABLE IF NOT EXISTS cache ("
        "  key        TEXT NOT NULL,"
        "  agent_id   TEXT NOT NULL,"
        "  value      TEXT NOT NULL DEFAULT '{}',"
        "  created_at TIMESTAMPTZ NOT NULL DEFAULT now(),"
        "  PRIMARY KEY (key, agent_id)"
        ");",
    };

    for (const char* sql : statements) {
        ResultGuard g;
        run(conn_, sql, {}, g, PGRES_COMMAND_OK);
    }
}

bool PostgresDatabaseAdapter::ensure_account(const Account& account) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    ResultGuard g;
    run(conn_, "INSERT INTO accounts (id, name, username) VALUES ($1, $2, $3) "
               "ON CONFLICT (id) DO NOTHING;",
        {account.id, account.name, account.username}, g, PGRES_COMMAND_OK);
    return std::string(PQcmdTuples(g.res)) == "1";
}

std::optional<Account> PostgresDatabaseAdapter::get_account(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    ResultGuard g;
    run(conn_, "SELECT id, name, username FROM accounts WHERE id = $1;",
        {id}, g, PGRES_TUPLES_OK);
    if (PQntuples(g.res) == 0) return std::nullopt;

    Account a;
    a.id = PQgetvalue(g.res, 0, 0);
    a.name = PQgetvalue(g.res, 0, 1);
    a.username = PQgetvalue(g.res, 0, 2);
    return a;
}

void PostgresDatabaseAdapter::ensure_room(const std::string& room_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    ResultGuard g;
    run(conn_, "INSERT INTO rooms (id) VALUES ($1) ON CONFLICT (id) DO NOTHING;",
        {room_id}, g, PGRES_COMMAND_OK);
}

void PostgresDatabaseAdapter::ensure_participant(const std::string& user_id,
                                                 const std::string& room_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    ResultGuard g;
    run(conn_, "INSERT INTO participants (user_id, room_id) VALUES ($1, $2) "
               "ON CONFLICT (user_id, room_id) DO NOTHING;",
        {user_id, room_id}, g, PGRES_COMMAND_OK);
}

bool PostgresDatabaseAdapter::is_participant(const std::string& user_id,
                                             const std::string& room_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    ResultGuard g;
    run(conn_, "SELECT 1 FROM participants WHERE user_id = $1 AND room_id = $2;",
        {user_id, room_id}, g, PGRES_TUPLES_OK);
    return PQntuples(g.res) > 0;
}

std::optional<std::string> PostgresDatabaseAdapter::get_cache(const std::string& key,
                                                              const std::string& agent_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    ResultGuard g;
    run(conn_, "SELECT value FROM cache WHERE key = $1 AND agent_id = $2;",
        {key, agent_id}, g, PGRES_TUPLES_OK);
    if (PQntuples(g.res) == 0) return std::nullopt;
    return std::string(PQgetvalue(g.res, 0, 0));
}

void PostgresDatabaseAdapter::set_cache(const std::string& key, const std::string& agent_id,
                                        const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    ResultGuard g;
    run(conn_, "INSERT INTO cache (key, agent_id, value) VALUES ($1, $2, $3) "
               "ON CONFLICT (key, agent_id) DO UPDATE SET value = EXCLUDED.value;",
        {key, agent_id, value}, g, PGRES_COMMAND_OK);
}

bool PostgresDatabaseAdapter::delete_cache(const std::string& key, const std::string& agent_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    ResultGuard g;
    run(conn_, "DELETE FROM cache WHERE key = $1 AND agent_id = $2;",
        {key, agent_id}, g, PGRES_COMMAND_OK);
    return std::string(PQcmdTuples(g.res)) == "1";
}

} // namespace troupe
