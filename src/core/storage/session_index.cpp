#include "storage/session_index.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

SessionIndex::SessionIndex() = default;

SessionIndex::~SessionIndex() {
    close();
}

bool SessionIndex::open(const std::string& path) {
    fs::path p(path);
    std::error_code ec;
    fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "index: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    // WAL lets --list run while a chat session is writing
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) {
        close();
        return false;
    }

    const char* upsert_sql =
        "INSERT INTO sessions (session_id, created_at, selected_text, screenshot_path, "
        "screenshot_url, record_path, message_count) "
        "VALUES (?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(session_id) DO UPDATE SET "
        "message_count = excluded.message_count, "
        "record_path = excluded.record_path, "
        "updated_at = strftime('%Y-%m-%dT%H:%M:%f','now')";

    const char* recent_sql =
        "SELECT session_id, created_at, selected_text, screenshot_path, screenshot_url, "
        "record_path, message_count, updated_at "
        "FROM sessions ORDER BY created_at DESC, session_id DESC LIMIT ?";

    if (sqlite3_prepare_v2(db_, upsert_sql, -1, &upsert_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "index: prepare upsert failed: {}", sqlite3_errmsg(db_));
        close();
        return false;
    }

    if (sqlite3_prepare_v2(db_, recent_sql, -1, &recent_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "index: prepare recent failed: {}", sqlite3_errmsg(db_));
        close();
        return false;
    }

    return true;
}

void SessionIndex::close() {
    if (upsert_stmt_) { sqlite3_finalize(upsert_stmt_); upsert_stmt_ = nullptr; }
    if (recent_stmt_) { sqlite3_finalize(recent_stmt_); recent_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool SessionIndex::record(const Session& session, const std::string& record_path) {
    if (!upsert_stmt_) return false;

    sqlite3_reset(upsert_stmt_);
    sqlite3_clear_bindings(upsert_stmt_);

    auto bind_nullable = [this](int idx, const std::string& val) {
        if (val.empty()) sqlite3_bind_null(upsert_stmt_, idx);
        else sqlite3_bind_text(upsert_stmt_, idx, val.c_str(), -1, SQLITE_TRANSIENT);
    };

    const auto& cap = session.captured;
    auto created_at = format_timestamp(session.created_at);

    sqlite3_bind_text(upsert_stmt_, 1, session.session_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(upsert_stmt_, 2, created_at.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(upsert_stmt_, 3, cap.text.c_str(), -1, SQLITE_TRANSIENT);
    bind_nullable(4, cap.screenshot_path.value_or(""));
    bind_nullable(5, cap.screenshot_url.value_or(""));
    sqlite3_bind_text(upsert_stmt_, 6, record_path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(upsert_stmt_, 7, static_cast<sqlite3_int64>(session.messages.size()));

    int rc = sqlite3_step(upsert_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "index: upsert failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<SessionIndexEntry> SessionIndex::recent(int limit) {
    std::vector<SessionIndexEntry> entries;
    if (!recent_stmt_) return entries;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);

    auto get_text = [](sqlite3_stmt* stmt, int col) -> std::string {
        auto* p = sqlite3_column_text(stmt, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    };

    while (sqlite3_step(recent_stmt_) == SQLITE_ROW) {
        SessionIndexEntry e;
        e.session_id = get_text(recent_stmt_, 0);
        e.created_at = get_text(recent_stmt_, 1);
        e.selected_text = get_text(recent_stmt_, 2);
        e.screenshot_path = get_text(recent_stmt_, 3);
        e.screenshot_url = get_text(recent_stmt_, 4);
        e.record_path = get_text(recent_stmt_, 5);
        e.message_count = sqlite3_column_int64(recent_stmt_, 6);
        e.updated_at = get_text(recent_stmt_, 7);
        entries.push_back(std::move(e));
    }

    return entries;
}

bool SessionIndex::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS sessions (
            session_id TEXT PRIMARY KEY,
            created_at TEXT NOT NULL,
            selected_text TEXT NOT NULL,
            screenshot_path TEXT,
            screenshot_url TEXT,
            record_path TEXT NOT NULL,
            message_count INTEGER NOT NULL DEFAULT 0,
            updated_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now'))
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "index: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
