#include <catch2/catch_test_macros.hpp>

#include "storage/session_store.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

// RAII temp directory that is removed with everything in it.
struct TmpDir {
    std::string path;

    TmpDir() {
        path = fs::temp_directory_path() / ("cc_test_store_" + std::to_string(getpid()));
        fs::remove_all(path);
    }

    ~TmpDir() { fs::remove_all(path); }
};

CapturedContent text_only(const std::string& text) {
    return CapturedContent{.text = text, .screenshot_path = {}, .screenshot_url = {}};
}

Message user_message(const std::string& text) {
    return Message{.role = Role::User, .content = text,
                   .timestamp = std::chrono::system_clock::now()};
}

} // namespace

TEST_CASE("SessionStore", "[store]") {
    TmpDir tmp;
    SessionStore store(tmp.path);

    SECTION("CreateThenLoadHasOnlySeed") {
        auto created = store.create(text_only("the captured text, verbatim"));
        REQUIRE(created.has_value());
        REQUIRE(fs::exists(store.path_for(created->session_id)));

        auto loaded = store.load(created->session_id);
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->session_id == created->session_id);
        REQUIRE(loaded->messages.size() == 1);
        REQUIRE(loaded->messages[0].role == Role::User);
        REQUIRE(loaded->messages[0].text() != nullptr);
        REQUIRE(*loaded->messages[0].text() == make_seed_message("the captured text, verbatim"));
    }

    SECTION("RecordFileName") {
        auto created = store.create(text_only("x"));
        REQUIRE(created.has_value());
        REQUIRE(store.path_for(created->session_id) ==
                (fs::path(tmp.path) / ("chat_" + created->session_id + ".json")).string());
    }

    SECTION("CapturedContentPersisted") {
        CapturedContent content{.text = "t",
                                .screenshot_path = "/tmp/shot.png",
                                .screenshot_url = "https://host/x.png"};
        auto created = store.create(content);
        REQUIRE(created.has_value());

        auto loaded = store.load(created->session_id);
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->captured.text == "t");
        REQUIRE(loaded->captured.screenshot_path == "/tmp/shot.png");
        REQUIRE(loaded->captured.screenshot_url == "https://host/x.png");
    }

    SECTION("AppendPersistsInOrder") {
        auto session = store.create(text_only("hello world"));
        REQUIRE(session.has_value());

        REQUIRE(store.append(*session, user_message("first")).has_value());
        REQUIRE(store.append(*session, Message{.role = Role::Assistant, .content = std::string("second"),
                                               .timestamp = std::chrono::system_clock::now()})
                    .has_value());
        REQUIRE(session->messages.size() == 3);

        auto loaded = store.load(session->session_id);
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->messages.size() == 3);
        REQUIRE(*loaded->messages[1].text() == "first");
        REQUIRE(loaded->messages[2].role == Role::Assistant);
        REQUIRE(*loaded->messages[2].text() == "second");
    }

    SECTION("ClearKeepsIdentityAndCapture") {
        CapturedContent content{.text = "keep me", .screenshot_path = "/tmp/s.png",
                                .screenshot_url = "https://host/s.png"};
        auto session = store.create(content);
        REQUIRE(session.has_value());
        REQUIRE(store.append(*session, user_message("question")).has_value());

        REQUIRE(store.clear(*session).has_value());
        REQUIRE(session->messages.empty());

        auto loaded = store.load(session->session_id);
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->messages.empty());
        REQUIRE(loaded->session_id == session->session_id);
        REQUIRE(loaded->captured.text == "keep me");
        REQUIRE(loaded->captured.screenshot_url == "https://host/s.png");
    }

    SECTION("IdsDoNotCollideWithinOneSecond") {
        auto a = store.create(text_only("a"));
        auto b = store.create(text_only("b"));
        auto c = store.create(text_only("c"));
        REQUIRE(a.has_value());
        REQUIRE(b.has_value());
        REQUIRE(c.has_value());
        REQUIRE(a->session_id != b->session_id);
        REQUIRE(b->session_id != c->session_id);
        REQUIRE(a->session_id != c->session_id);

        // Nothing was overwritten
        REQUIRE(store.load(a->session_id)->captured.text == "a");
        REQUIRE(store.load(b->session_id)->captured.text == "b");
    }

    SECTION("ExistingRecordIsNotReused") {
        SessionStore other(tmp.path);
        auto a = other.create(text_only("from another process"));
        REQUIRE(a.has_value());

        auto id = store.next_session_id();
        REQUIRE(id != a->session_id);
    }

    SECTION("CreateWithReservedId") {
        auto id = store.next_session_id();
        auto created = store.create(text_only("x"), id);
        REQUIRE(created.has_value());
        REQUIRE(created->session_id == id);
    }

    SECTION("NoTemporaryFilesLeftBehind") {
        auto session = store.create(text_only("x"));
        REQUIRE(session.has_value());
        REQUIRE(store.append(*session, user_message("y")).has_value());

        int files = 0;
        for (auto& entry : fs::directory_iterator(tmp.path)) {
            REQUIRE(entry.path().extension() == ".json");
            ++files;
        }
        REQUIRE(files == 1);
    }

    SECTION("LoadMissingIsNotFound") {
        auto loaded = store.load("19700101_000000");
        REQUIRE_FALSE(loaded.has_value());
        REQUIRE(loaded.error().kind == StoreErrorKind::NotFound);
    }

    SECTION("LoadRejectsPathTraversal") {
        auto loaded = store.load("../etc/passwd");
        REQUIRE_FALSE(loaded.has_value());
        REQUIRE(loaded.error().kind == StoreErrorKind::NotFound);
    }

    SECTION("LoadCorruptRecord") {
        fs::create_directories(tmp.path);
        std::ofstream(store.path_for("broken")) << "{\"session_id\": \"broken\", \"messages\": [";

        auto loaded = store.load("broken");
        REQUIRE_FALSE(loaded.has_value());
        REQUIRE(loaded.error().kind == StoreErrorKind::Corrupt);
    }

    SECTION("WriteFailureLeavesSessionUnchanged") {
        auto session = store.create(text_only("x"));
        REQUIRE(session.has_value());

        // Replace the history directory with a plain file so writes fail
        fs::remove_all(tmp.path);
        std::ofstream(tmp.path) << "not a directory";

        auto res = store.append(*session, user_message("lost?"));
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == StoreErrorKind::WriteFailure);
        REQUIRE(session->messages.size() == 1);

        auto cleared = store.clear(*session);
        REQUIRE_FALSE(cleared.has_value());
        REQUIRE(session->messages.size() == 1);
    }

    SECTION("InvalidUtf8IsReplacedNotFatal") {
        // Latin-1 "café" as some X11 selection owners hand it out
        auto session = store.create(text_only("caf\xe9"));
        REQUIRE(session.has_value());

        auto appended = store.append(*session, user_message("na\xefve question"));
        REQUIRE(appended.has_value());
        REQUIRE(session->messages.size() == 2);

        auto loaded = store.load(session->session_id);
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->captured.text == "caf\xef\xbf\xbd");
        REQUIRE(loaded->messages.size() == 2);
        REQUIRE(*loaded->messages[1].text() == "na\xef\xbf\xbdve question");
    }
}
