#pragma once

#include "chat/frontend.hpp"

#include <cstddef>
#include <string>

// Line-based frontend on stdin/stdout for use without a desktop session.
class TerminalFrontend : public ChatFrontend {
public:
    std::optional<std::string> read_input() override;
    void on_transcript_changed(const Session& session) override;
    void on_notice(const std::string& message, Severity severity) override;
    void show_help(const std::string& text) override;
    void show_history(const Session& session) override;

private:
    std::string session_id_;
    size_t printed_ = 0; // messages already on screen
};
