#include "platform/linux/terminal_frontend.hpp"

#include "chat/transcript.hpp"

#include <cstdio>
#include <iostream>
#include <print>

std::optional<std::string> TerminalFrontend::read_input() {
    std::print("> ");
    std::fflush(stdout);

    std::string line;
    if (!std::getline(std::cin, line)) {
        std::println("");
        return std::nullopt;
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

void TerminalFrontend::on_transcript_changed(const Session& session) {
    // New session or cleared history: redraw from the header
    if (session.session_id != session_id_ || session.messages.size() < printed_) {
        session_id_ = session.session_id;
        std::print("{}", transcript::format(session));
        printed_ = session.messages.size();
        return;
    }

    for (size_t i = printed_; i < session.messages.size(); ++i) {
        // The user just typed their own message
        if (session.messages[i].role == Role::User) continue;
        std::println("{}", transcript::format_message(session.messages[i]));
    }
    printed_ = session.messages.size();
}

void TerminalFrontend::on_notice(const std::string& message, Severity severity) {
    switch (severity) {
        case Severity::Info: std::println(stderr, "{}", message); break;
        case Severity::Warning: std::println(stderr, "warning: {}", message); break;
        case Severity::Error: std::println(stderr, "error: {}", message); break;
    }
}

void TerminalFrontend::show_help(const std::string& text) {
    std::println("{}", text);
}

void TerminalFrontend::show_history(const Session& session) {
    std::println("{}", transcript::format_history(session));
}
