#include "sqlite_database.hpp"
#include "../util.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <stdexcept>
#include <vector>

namespace troupe {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

static void prepare(sqlite3* db, const char* sql, StmtGuard& g,
                    const std::vector<std::string>& params) {
    if (sqlite3_prepare_v2(db, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("sqlite: prepare failed: ") +
                                 sqlite3_errmsg(db));
    }
    int col = 1;
    for (const auto& p : params) {
        sqlite3_bind_text(g.stmt, col++, p.c_str(), -1, SQLITE_TRANSIENT);
    }
}

static void step_done(sqlite3* db, StmtGuard& g) {
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        throw std::runtime_error(std::string("sqlite: step failed: ") +
                                 sqlite3_errmsg(db));
    }
}

SqliteDatabaseAdapter::SqliteDatabaseAdapter(std::string path) : path_(std::move(path)) {}

SqliteDatabaseAdapter::~SqliteDatabaseAdapter() {
    close();
}

void SqliteDatabaseAdapter::init() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) return;

    // Ensure parent directory exists
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw std::runtime_error("sqlite: cannot create directory " +
                                     parent.string() + ": " + ec.message());
        }
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw std::runtime_error("sqlite: failed to open " + path_ + ": " + err);
    }

    try {
        exec("PRAGMA journal_mode=WAL;");
        exec("PRAGMA synchronous=NORMAL;");
        init_schema();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

void SqliteDatabaseAdapter::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SqliteDatabaseAdapter::is_initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

void SqliteDatabaseAdapter::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errmsg(db_);
        sqlite3_free(err);
        throw std::runtime_error("sqlite: " + msg);
    }
}

void SqliteDatabaseAdapter::require_open() const {
    if (!db_) throw std::runtime_error("sqlite: database not initialized");
}

void SqliteDatabaseAdapter::init_schema() {
    exec("CREATE TABLE IF NOT EXISTS accounts ("
         "  id         TEXT PRIMARY KEY,"
         "  name       TEXT NOT NULL,"
         "  username   TEXT NOT NULL,"
         "  details    TEXT NOT NULL DEFAULT '{}',"
         "  created_at INTEGER NOT NULL"
         ");");

    exec("CREATE TABLE IF NOT EXISTS rooms ("
         "  id         TEXT PRIMARY KEY,"
         "  created_at INTEGER NOT NULL"
         ");");

    exec("CREATE TABLE IF NOT EXISTS participants ("
         "  user_id    TEXT NOT NULL,"
         "  room_id    TEXT NOT NULL,"
         "  created_at INTEGER NOT NULL,"
         "  PRIMARY KEY (user_id, room_id)"
         ");");

    // Cache rows are scoped per agent so agents sharing a file never collide
    exec("CREATE TABLE IF NOT EXISTS cache ("
         "  key        TEXT NOT NULL,"
         "  agent_id   TEXT NOT NULL,"
         "  value      TEXT NOT NULL DEFAULT '{}',"
         "  created_at INTEGER NOT NULL,"
         "  PRIMARY KEY (key, agent_id)"
         ");");
}

bool SqliteDatabaseAdapter::ensure_account(const Account& account) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    StmtGuard g;
    prepare(db_, "INSERT OR IGNORE INTO accounts (id, name, username, created_at) "
                 "VALUES (?, ?, ?, ?);",
            g, {account.id, account.name, account.username});
    sqlite3_bind_int64(g.stmt, 4, static_cast<sqlite3_int64>(epoch_seconds()));
    step_done(db_, g);
    return sqlite3_changes(db_) > 0;
}

std::optional<Account> SqliteDatabaseAdapter::get_account(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    StmtGuard g;
    prepare(db_, "SELECT id, name, username FROM accounts WHERE id = ?;", g, {id});
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return std::nullopt;

    Account a;
    if (auto* v = sqlite3_column_text(g.stmt, 0)) a.id       = reinterpret_cast<const char*>(v);
    if (auto* v = sqlite3_column_text(g.stmt, 1)) a.name     = reinterpret_cast<const char*>(v);
    if (auto* v = sqlite3_column_text(g.stmt, 2)) a.username = reinterpret_cast<const char*>(v);
    return a;
}

void SqliteDatabaseAdapter::ensure_room(const std::string& room_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    StmtGuard g;
    prepare(db_, "INSERT OR IGNORE INTO rooms (id, created_at) VALUES (?, ?);", g, {room_id});
    sqlite3_bind_int64(g.stmt, 2, static_cast<sqlite3_int64>(epoch_seconds()));
    step_done(db_, g);
}

void SqliteDatabaseAdapter::ensure_participant(const std::string& user_id,
                                               const std::string& room_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    StmtGuard g;
    prepare(db_, "INSERT OR IGNORE INTO participants (user_id, room_id, created_at) "
                 "VALUES (?, ?, ?);",
            g, {user_id, room_id});
    sqlite3_bind_int64(g.stmt, 3, static_cast<sqlite3_int64>(epoch_seconds()));
    step_done(db_, g);
}

bool SqliteDatabaseAdapter::is_participant(const std::string& user_id,
                                           const std::string& room_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    StmtGuard g;
    prepare(db_, "SELECT 1 FROM participants WHERE user_id = ? AND room_id = ?;",
            g, {user_id, room_id});
    return sqlite3_step(g.stmt) == SQLITE_ROW;
}

std::optional<std::string> SqliteDatabaseAdapter::get_cache(const std::string& key,
                                                            const std::string& agent_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    StmtGuard g;
    prepare(db_, "SELECT value FROM cache WHERE key = ? AND agent_id = ?;", g, {key, agent_id});
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return std::nullopt;
    auto* v = sqlite3_column_text(g.stmt, 0);
    if (!v) return std::string{};
    return std::string(reinterpret_cast<const char*>(v));
}

void SqliteDatabaseAdapter::set_cache(const std::string& key, const std::string& agent_id,
                                      const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    StmtGuard g;
    prepare(db_, "INSERT INTO cache (key, agent_id, value, created_at) VALUES (?, ?, ?, ?) "
                 "ON CONFLICT(key, agent_id) DO UPDATE SET value = excluded.value;",
            g, {key, agent_id, value});
    sqlite3_bind_int64(g.stmt, 4, static_cast<sqlite3_int64>(epoch_seconds()));
    step_done(db_, g);
}

bool SqliteDatabaseAdapter::delete_cache(const std::string& key, const std::string& agent_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    StmtGuard g;
    prepare(db_, "DELETE FROM cache WHERE key = ? AND agent_id = ?;", g, {key, agent_id});
    step_done(db_, g);
    return sqlite3_changes(db_) > 0;
}

} // namespace troupe
