#pragma once

#include "errors.hpp"
#include "session.hpp"

#include <expected>
#include <mutex>
#include <set>
#include <string>

// Owns the on-disk JSON records, one file per session. Every write replaces the
// record atomically (temp file + rename), so readers never see a partial file.
class SessionStore {
public:
    explicit SessionStore(std::string history_dir);

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    // Reserves a fresh id of the form YYYYMMDD_HHMMSS[_N]. Never returns an id
    // already issued by this store or one whose record exists on disk.
    std::string next_session_id();

    // Persists a new session holding only the seed message. An empty
    // session_id allocates one.
    std::expected<Session, StoreError> create(const CapturedContent& content,
                                              std::string session_id = {});

    // Write-through: session is only modified if the record was written.
    std::expected<void, StoreError> append(Session& session, Message message);
    std::expected<void, StoreError> clear(Session& session);

    std::expected<Session, StoreError> load(const std::string& session_id) const;

    std::string path_for(const std::string& session_id) const;
    const std::string& directory() const { return dir_; }

private:
    std::expected<void, StoreError> write_record(const Session& session);
    std::string allocate_id_locked();

    std::string dir_;
    mutable std::mutex mutex_;
    std::set<std::string> issued_ids_;
};
