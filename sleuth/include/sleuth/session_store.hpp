#pragma once
// SessionStore: SQLite persistence of session snapshots
//
// One row per session, the full SessionState as JSON plus a few columns
// for listing without parsing. Saved at phase boundaries (the machine's
// checkpoint callback), so a crash loses at most the current visit.
//
// Path: --db, else SLEUTH_DB_PATH, else ~/.sleuth/sessions.db

#include "session.hpp"
#include "types.hpp"
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

namespace sleuth {

struct SessionSummary {
    std::string id;
    std::string environment;
    std::string phase;
    Timestamp created_at = 0;
    Timestamp updated_at = 0;
};

class SessionStore {
public:
    static constexpr int SCHEMA_VERSION = 1;

    static std::string default_path() {
        if (const char* db_path = std::getenv("SLEUTH_DB_PATH")) {
            return db_path;
        }
        if (const char* home = std::getenv("HOME")) {
            return std::string(home) + "/.sleuth/sessions.db";
        }
        return "sessions.db";
    }

    SessionStore();
    explicit SessionStore(std::string path);
    ~SessionStore();

    // Owns the database handle
    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    // Creates parent directory and schema as needed
    bool open();
    void close();
    bool is_open() const { return db_ != nullptr; }

    // Insert or replace
    bool save(const SessionState& state);

    // nullopt when absent or unreadable (see last_error())
    std::optional<SessionState> load(const std::string& id);

    // Newest first
    std::vector<SessionSummary> list();

    bool remove(const std::string& id);

    size_t count();

    const std::string& last_error() const { return last_error_; }
    const std::string& path() const { return path_; }

private:
    bool exec(const char* sql);
    bool migrate();
    int schema_version();

    std::string path_;
    sqlite3* db_ = nullptr;
    std::string last_error_;
};

} // namespace sleuth
