#include <sleuth/session_store.hpp>
#include <sleuth/log.hpp>
#include <sqlite3.h>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <sys/stat.h>

namespace sleuth {

namespace {

// mkdir -p for the directory part of path
bool ensure_parent_dir(const std::string& path, std::string& error) {
    auto slash = path.find_last_of('/');
    if (slash == std::string::npos || slash == 0) return true;

    std::string dir = path.substr(0, slash);
    for (size_t pos = 1; pos <= dir.size(); ++pos) {
        if (pos != dir.size() && dir[pos] != '/') continue;
        std::string partial = dir.substr(0, pos);
        if (mkdir(partial.c_str(), 0700) < 0 && errno != EEXIST) {
            error = "mkdir(" + partial + ") failed: " + strerror(errno);
            return false;
        }
    }
    return true;
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

} // anonymous namespace

SessionStore::SessionStore()
    : path_(default_path()) {}

SessionStore::SessionStore(std::string path)
    : path_(std::move(path)) {}

SessionStore::~SessionStore() {
    close();
}

bool SessionStore::open() {
    if (db_) return true;

    if (!ensure_parent_dir(path_, last_error_)) return false;

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        last_error_ = std::string("Error opening database: ") +
                      (db_ ? sqlite3_errmsg(db_) : "out of memory");
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    sqlite3_busy_timeout(db_, 2000);

    if (!migrate()) {
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    log_debug("store", "opened %s", path_.c_str());
    return true;
}

void SessionStore::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SessionStore::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        last_error_ = err ? err : sqlite3_errmsg(db_);
        sqlite3_free(err);
        return false;
    }
    return true;
}

int SessionStore::schema_version() {
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, "SELECT version FROM schema_version LIMIT 1", -1,
                           &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    int version = sqlite3_step(stmt) == SQLITE_ROW ? sqlite3_column_int(stmt, 0) : 0;
    sqlite3_finalize(stmt);
    return version;
}

bool SessionStore::migrate() {
    if (!exec("CREATE TABLE IF NOT EXISTS schema_version (version INTEGER NOT NULL)")) {
        return false;
    }

    int version = schema_version();
    if (version > SCHEMA_VERSION) {
        last_error_ = "Database schema v" + std::to_string(version) +
                      " is newer than supported v" + std::to_string(SCHEMA_VERSION);
        return false;
    }
    if (version == SCHEMA_VERSION) return true;

    std::cerr << "[store] Migrating schema v" << version << " -> v" << SCHEMA_VERSION << "\n";
    if (!exec("BEGIN")) return false;
    bool ok = exec("CREATE TABLE IF NOT EXISTS sessions ("
                   "  id TEXT PRIMARY KEY,"
                   "  environment TEXT NOT NULL,"
                   "  phase TEXT NOT NULL,"
                   "  created_at INTEGER NOT NULL,"
                   "  updated_at INTEGER NOT NULL,"
                   "  state TEXT NOT NULL)") &&
              exec("CREATE INDEX IF NOT EXISTS idx_sessions_updated ON sessions(updated_at)") &&
              exec("DELETE FROM schema_version") &&
              exec("INSERT INTO schema_version (version) VALUES (1)");
    if (!ok) {
        std::string error = last_error_;
        exec("ROLLBACK");
        last_error_ = error;
        return false;
    }
    return exec("COMMIT");
}

bool SessionStore::save(const SessionState& state) {
    if (!db_) {
        last_error_ = "Store not open";
        return false;
    }

    std::string payload = json(state).dump();
    const char* sql =
        "INSERT OR REPLACE INTO sessions (id, environment, phase, created_at, updated_at, state) "
        "VALUES (?, ?, ?, ?, ?, ?)";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = std::string("Error preparing save: ") + sqlite3_errmsg(db_);
        return false;
    }
    sqlite3_bind_text(stmt, 1, state.id().c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, state.environment().c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, phase_name(state.phase()), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 4, state.created_at());
    sqlite3_bind_int64(stmt, 5, state.updated_at());
    sqlite3_bind_text(stmt, 6, payload.c_str(), -1, SQLITE_TRANSIENT);

    bool ok = sqlite3_step(stmt) == SQLITE_DONE;
    if (!ok) {
        last_error_ = std::string("Error saving session: ") + sqlite3_errmsg(db_);
    }
    sqlite3_finalize(stmt);
    return ok;
}

std::optional<SessionState> SessionStore::load(const std::string& id) {
    if (!db_) {
        last_error_ = "Store not open";
        return std::nullopt;
    }

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, "SELECT state FROM sessions WHERE id = ?", -1,
                           &stmt, nullptr) != SQLITE_OK) {
        last_error_ = std::string("Error preparing load: ") + sqlite3_errmsg(db_);
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);

    std::string payload;
    bool found = sqlite3_step(stmt) == SQLITE_ROW;
    if (found) payload = column_text(stmt, 0);
    sqlite3_finalize(stmt);

    if (!found) {
        last_error_ = "No session with id " + id;
        return std::nullopt;
    }

    try {
        return json::parse(payload).get<SessionState>();
    } catch (const std::exception& e) {
        last_error_ = "Corrupt session " + id + ": " + e.what();
        return std::nullopt;
    }
}

std::vector<SessionSummary> SessionStore::list() {
    std::vector<SessionSummary> out;
    if (!db_) {
        last_error_ = "Store not open";
        return out;
    }

    sqlite3_stmt* stmt;
    const char* sql = "SELECT id, environment, phase, created_at, updated_at "
                      "FROM sessions ORDER BY updated_at DESC, id";
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = std::string("Error preparing list: ") + sqlite3_errmsg(db_);
        return out;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        SessionSummary s;
        s.id = column_text(stmt, 0);
        s.environment = column_text(stmt, 1);
        s.phase = column_text(stmt, 2);
        s.created_at = sqlite3_column_int64(stmt, 3);
        s.updated_at = sqlite3_column_int64(stmt, 4);
        out.push_back(std::move(s));
    }
    sqlite3_finalize(stmt);
    return out;
}

bool SessionStore::remove(const std::string& id) {
    if (!db_) {
        last_error_ = "Store not open";
        return false;
    }

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, "DELETE FROM sessions WHERE id = ?", -1,
                           &stmt, nullptr) != SQLITE_OK) {
        last_error_ = std::string("Error preparing remove: ") + sqlite3_errmsg(db_);
        return false;
    }
    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    bool ok = sqlite3_step(stmt) == SQLITE_DONE;
    sqlite3_finalize(stmt);
    if (!ok) {
        last_error_ = std::string("Error removing session: ") + sqlite3_errmsg(db_);
        return false;
    }
    if (sqlite3_changes(db_) == 0) {
        last_error_ = "No session with id " + id;
        return false;
    }
    return true;
}

size_t SessionStore::count() {
    if (!db_) return 0;
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM sessions", -1, &stmt, nullptr) != SQLITE_OK) {
        last_error_ = std::string("Error preparing count: ") + sqlite3_errmsg(db_);
        return 0;
    }
    size_t n = sqlite3_step(stmt) == SQLITE_ROW
        ? static_cast<size_t>(sqlite3_column_int64(stmt, 0)) : 0;
    sqlite3_finalize(stmt);
    return n;
}

} // namespace sleuth
