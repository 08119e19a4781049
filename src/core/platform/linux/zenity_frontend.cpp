#include "platform/linux/zenity_frontend.hpp"

#include "chat/transcript.hpp"
#include "platform/linux/clipboard_tools.hpp"
#include "platform/linux/notify_send.hpp"
#include "platform/linux/subprocess.hpp"

#include <print>

ZenityFrontend::ZenityFrontend(bool verbose)
    : verbose_(verbose) {}

std::optional<std::string> ZenityFrontend::read_input() {
    // The seed alone is not worth a window; show it once something was said.
    if (transcript_dirty_ && !first_prompt_) {
        show_transcript();
    }
    first_prompt_ = false;

    auto res = platform::run_process({"zenity", "--entry", "--title=Chat Input",
                                      "--text=Enter your question or command:", "--width=600"});
    if (!res) {
        std::println(stderr, "zenity: {}", res.error());
        return std::nullopt;
    }
    if (res->exit_code != 0) {
        log("input dialog closed");
        return std::nullopt;
    }
    return platform::trim_trailing_newlines(std::move(res->out));
}

void ZenityFrontend::on_transcript_changed(const Session& session) {
    transcript_ = transcript::format(session);
    session_id_ = session.session_id;
    transcript_dirty_ = true;
}

void ZenityFrontend::on_notice(const std::string& message, Severity severity) {
    std::expected<void, std::string> res;
    switch (severity) {
        case Severity::Info:
            res = platform::notify("Chat Assistant", message, 3000);
            break;
        case Severity::Warning:
            res = platform::notify("Chat Warning", message, 3000);
            break;
        case Severity::Error:
            res = platform::notify("Chat Error", message, 5000);
            run_dialog({"zenity", "--error", "--no-markup", "--title=Chat Error",
                        "--text=" + message});
            break;
    }
    if (!res) {
        log("notification failed: " + res.error());
    }
}

void ZenityFrontend::show_help(const std::string& text) {
    run_dialog({"zenity", "--info", "--no-markup", "--title=Help", "--text=" + text});
}

void ZenityFrontend::show_history(const Session& session) {
    auto text = transcript::format_history(session);
    run_dialog({"zenity", "--text-info", "--title=Chat History", "--width=600", "--height=400"},
               &text);
}

void ZenityFrontend::show_transcript() {
    run_dialog({"zenity", "--text-info", "--title=CopyQ Chat Assistant - Session " + session_id_,
                "--width=800", "--height=600"},
               &transcript_);
    transcript_dirty_ = false;
}

void ZenityFrontend::run_dialog(const std::vector<std::string>& argv, const std::string* input) {
    auto res = platform::run_process(argv, std::chrono::milliseconds{0}, input);
    if (!res) {
        std::println(stderr, "zenity: {}", res.error());
    }
}

void ZenityFrontend::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[copyq-chat] {}", msg);
    }
}
