#include "storage/session_store.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

bool valid_id(const std::string& id) {
    return !id.empty() && id.find('/') == std::string::npos && id != "." && id != "..";
}

std::string timestamp_id(Timestamp now) {
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&t, &local);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &local);
    return buf;
}

StoreError write_failure(const std::string& what) {
    return StoreError{.kind = StoreErrorKind::WriteFailure, .message = what};
}

} // namespace

SessionStore::SessionStore(std::string history_dir)
    : dir_(std::move(history_dir)) {}

std::string SessionStore::path_for(const std::string& session_id) const {
    return (fs::path(dir_) / ("chat_" + session_id + ".json")).string();
}

std::string SessionStore::next_session_id() {
    std::lock_guard lock(mutex_);
    return allocate_id_locked();
}

std::string SessionStore::allocate_id_locked() {
    auto base = timestamp_id(std::chrono::system_clock::now());
    auto id = base;
    std::error_code ec;
    for (int n = 2; issued_ids_.contains(id) || fs::exists(path_for(id), ec); ++n) {
        id = base + "_" + std::to_string(n);
    }
    issued_ids_.insert(id);
    return id;
}

std::expected<Session, StoreError> SessionStore::create(const CapturedContent& content,
                                                        std::string session_id) {
    std::lock_guard lock(mutex_);

    if (session_id.empty()) {
        session_id = allocate_id_locked();
    } else if (!valid_id(session_id)) {
        return std::unexpected(write_failure("invalid session id '" + session_id + "'"));
    } else {
        issued_ids_.insert(session_id);
    }

    auto now = std::chrono::system_clock::now();

    Session session;
    session.session_id = std::move(session_id);
    session.created_at = now;
    session.captured = content;
    session.messages.push_back(Message{
        .role = Role::User,
        .content = make_seed_message(content.text),
        .timestamp = now,
    });

    auto res = write_record(session);
    if (!res) return std::unexpected(res.error());
    return session;
}

std::expected<void, StoreError> SessionStore::append(Session& session, Message message) {
    std::lock_guard lock(mutex_);

    session.messages.push_back(std::move(message));
    auto res = write_record(session);
    if (!res) {
        session.messages.pop_back();
    }
    return res;
}

std::expected<void, StoreError> SessionStore::clear(Session& session) {
    std::lock_guard lock(mutex_);

    auto saved = std::move(session.messages);
    session.messages.clear();
    auto res = write_record(session);
    if (!res) {
        session.messages = std::move(saved);
    }
    return res;
}

std::expected<Session, StoreError> SessionStore::load(const std::string& session_id) const {
    std::lock_guard lock(mutex_);

    if (!valid_id(session_id)) {
        return std::unexpected(StoreError{.kind = StoreErrorKind::NotFound,
                                          .message = "invalid session id '" + session_id + "'"});
    }

    auto path = path_for(session_id);
    std::ifstream f(path);
    if (!f.is_open()) {
        return std::unexpected(StoreError{.kind = StoreErrorKind::NotFound,
                                          .message = "no record at " + path});
    }

    try {
        auto j = json::parse(f);
        auto session = session_from_json(j);
        if (!session) {
            return std::unexpected(StoreError{.kind = StoreErrorKind::Corrupt,
                                              .message = path + ": " + session.error()});
        }
        return std::move(*session);
    } catch (const json::exception& e) {
        return std::unexpected(StoreError{.kind = StoreErrorKind::Corrupt,
                                          .message = path + ": " + e.what()});
    }
}

std::expected<void, StoreError> SessionStore::write_record(const Session& session) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        return std::unexpected(write_failure("cannot create " + dir_ + ": " + ec.message()));
    }

    auto target = path_for(session.session_id);
    std::string data;
    try {
        data = to_json(session).dump(2, ' ', false, json::error_handler_t::replace) + "\n";
    } catch (const json::exception& e) {
        return std::unexpected(write_failure(std::string("cannot serialize session: ") + e.what()));
    }

    std::string tmpl = target + ".tmp.XXXXXX";
    std::vector<char> tmp_path(tmpl.begin(), tmpl.end());
    tmp_path.push_back('\0');

    int fd = ::mkstemp(tmp_path.data());
    if (fd < 0) {
        return std::unexpected(write_failure(std::string("mkstemp() failed: ") + std::strerror(errno)));
    }

    size_t total_written = 0;
    while (total_written < data.size()) {
        ssize_t n = ::write(fd, data.data() + total_written, data.size() - total_written);
        if (n < 0) {
            if (errno == EINTR) continue;
            auto err = write_failure(std::string("write() failed: ") + std::strerror(errno));
            ::close(fd);
            ::unlink(tmp_path.data());
            return std::unexpected(err);
        }
        total_written += static_cast<size_t>(n);
    }

    bool synced = ::fsync(fd) == 0;
    int sync_errno = errno;
    if (::close(fd) < 0 || !synced) {
        auto err = write_failure(std::string("flush failed: ") +
                                 std::strerror(synced ? errno : sync_errno));
        ::unlink(tmp_path.data());
        return std::unexpected(err);
    }

    fs::rename(tmp_path.data(), target, ec);
    if (ec) {
        ::unlink(tmp_path.data());
        return std::unexpected(write_failure("rename to " + target + " failed: " + ec.message()));
    }
    return {};
}
