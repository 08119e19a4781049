#pragma once

#include "chat/frontend.hpp"

#include <string>
#include <vector>

// zenity dialogs for input and transcript, notify-send for notices.
class ZenityFrontend : public ChatFrontend {
public:
    explicit ZenityFrontend(bool verbose = false);

    std::optional<std::string> read_input() override;
    void on_transcript_changed(const Session& session) override;
    void on_notice(const std::string& message, Severity severity) override;
    void show_help(const std::string& text) override;
    void show_history(const Session& session) override;

private:
    // Blocks until the user closes the transcript window.
    void show_transcript();
    void run_dialog(const std::vector<std::string>& argv, const std::string* input = nullptr);
    void log(const std::string& msg);

    bool verbose_;
    bool transcript_dirty_ = false;
    bool first_prompt_ = true;
    std::string transcript_;
    std::string session_id_;
};
