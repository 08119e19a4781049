#pragma once

#include "session.hpp"

#include <cstdint>
#include <sqlite3.h>
#include <string>
#include <vector>

struct SessionIndexEntry {
    std::string session_id;
    std::string created_at;
    std::string selected_text;
    std::string screenshot_path;
    std::string screenshot_url;
    std::string record_path;
    int64_t message_count = 0;
    std::string updated_at;
};

// Advisory list of past sessions for --list. The JSON records stay authoritative.
class SessionIndex {
public:
    SessionIndex();
    ~SessionIndex();

    SessionIndex(const SessionIndex&) = delete;
    SessionIndex& operator=(const SessionIndex&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    // Inserts or refreshes the row for session.session_id.
    bool record(const Session& session, const std::string& record_path);

    std::vector<SessionIndexEntry> recent(int limit = 10);

private:
    bool create_tables();

    sqlite3* db_ = nullptr;
    sqlite3_stmt* upsert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
