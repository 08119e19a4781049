#pragma once

#include "notice.hpp"
#include "session.hpp"

#include <optional>
#include <string>

// Presentation boundary of the chat loop. Implementations own dialogs,
// notifications and rendering; the orchestrator only calls these hooks.
class ChatFrontend {
public:
    virtual ~ChatFrontend() = default;

    // Blocks for the next line of user input. nullopt means the user cancelled.
    virtual std::optional<std::string> read_input() = 0;

    // Called after every mutation of the session's messages.
    virtual void on_transcript_changed(const Session& session) = 0;

    virtual void on_notice(const std::string& message, Severity severity) = 0;

    virtual void show_help(const std::string& text) = 0;

    // Read-only view of the stored conversation.
    virtual void show_history(const Session& session) = 0;
};
