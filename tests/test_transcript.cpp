#include <catch2/catch_test_macros.hpp>

#include "chat/transcript.hpp"

#include <chrono>

namespace {

Session sample_session() {
    Session s;
    s.session_id = "20250914_102231";
    s.created_at = std::chrono::system_clock::now();
    s.captured.text = "hello world";
    s.captured.screenshot_path = "/home/u/.copyq_screenshots/screenshot_20250914_102231.png";
    s.captured.screenshot_url = "https://host/x.png";
    auto now = std::chrono::system_clock::now();
    s.messages.push_back(Message{.role = Role::User, .content = make_seed_message("hello world"),
                                 .timestamp = now});
    s.messages.push_back(Message{.role = Role::User, .content = "summarize", .timestamp = now});
    s.messages.push_back(Message{.role = Role::Assistant, .content = "Summary.", .timestamp = now});
    return s;
}

} // namespace

TEST_CASE("Transcript", "[transcript]") {
    auto s = sample_session();

    SECTION("MessageLabels") {
        REQUIRE(transcript::format_message(s.messages[1]) == "**YOU:** summarize\n");
        REQUIRE(transcript::format_message(s.messages[2]) == "**ASSISTANT:** Summary.\n");

        Message sys{.role = Role::System, .content = "be brief",
                    .timestamp = std::chrono::system_clock::now()};
        REQUIRE(transcript::format_message(sys) == "**SYSTEM:** be brief\n");
    }

    SECTION("HeaderAndMessages") {
        auto out = transcript::format(s);
        REQUIRE(out.starts_with("=== CopyQ Chat Assistant ===\n"));
        REQUIRE(out.find("Session ID: 20250914_102231\n") != std::string::npos);
        REQUIRE(out.find("Selected text: hello world\n") != std::string::npos);
        REQUIRE(out.find("Screenshot URL: https://host/x.png\n") != std::string::npos);

        auto history = out.find("=== Chat History ===\n");
        REQUIRE(history != std::string::npos);
        auto you = out.find("**YOU:** summarize", history);
        auto assistant = out.find("**ASSISTANT:** Summary.", history);
        REQUIRE(you != std::string::npos);
        REQUIRE(assistant != std::string::npos);
        REQUIRE(you < assistant);
        REQUIRE(out.ends_with("**ASSISTANT:** Summary.\n\n"));
    }

    SECTION("NoScreenshot") {
        s.captured.screenshot_path.reset();
        s.captured.screenshot_url.reset();
        auto out = transcript::format(s);
        REQUIRE(out.find("Screenshot: \n") != std::string::npos);
        REQUIRE(out.find("Screenshot URL: \n") != std::string::npos);
    }

    SECTION("History") {
        REQUIRE(transcript::format_history(s) ==
                "user: " + make_seed_message("hello world") + "\nuser: summarize\nassistant: Summary.");

        s.messages.clear();
        REQUIRE(transcript::format_history(s) == "No history available");
    }

    SECTION("HelpListsCommands") {
        std::string help = transcript::kHelpText;
        for (const char* cmd : {"exit", "quit", "bye", "help", "history", "clear"}) {
            REQUIRE(help.find(cmd) != std::string::npos);
        }
    }
}
