#include "chat/transcript.hpp"

namespace transcript {

const char* const kHelpText =
    "Available commands:\n"
    "exit/quit/bye - End chat session\n"
    "help - Show this help\n"
    "history - Show chat history\n"
    "clear - Clear current conversation";

std::string format_message(const Message& msg) {
    const char* label = "**SYSTEM:**";
    switch (msg.role) {
        case Role::User: label = "**YOU:**"; break;
        case Role::Assistant: label = "**ASSISTANT:**"; break;
        case Role::System: break;
    }
    return std::string(label) + " " + content_text(msg.content) + "\n";
}

std::string format(const Session& session) {
    const auto& cap = session.captured;

    std::string out;
    out += "=== CopyQ Chat Assistant ===\n";
    out += "Session ID: " + session.session_id + "\n";
    out += "Selected text: " + cap.text + "\n";
    out += "Screenshot: " + cap.screenshot_path.value_or("") + "\n";
    out += "Screenshot URL: " + cap.screenshot_url.value_or("") + "\n";
    out += "\n";
    out += "Context has been captured. You can now ask questions about the selected text "
           "and screenshot.\n";
    out += "\n";
    out += "Available commands:\n";
    out += "- Type 'exit', 'quit', or 'bye' to end the session\n";
    out += "- Type 'help' for available commands\n";
    out += "- Type 'history' to show chat history\n";
    out += "- Type 'clear' to clear current conversation\n";
    out += "\n";
    out += "=== Chat History ===\n";

    for (const auto& msg : session.messages) {
        out += format_message(msg);
        out += "\n";
    }
    return out;
}

std::string format_history(const Session& session) {
    if (session.messages.empty()) return "No history available";

    std::string out;
    for (const auto& msg : session.messages) {
        if (!out.empty()) out += "\n";
        out += role_name(msg.role) + ": " + content_text(msg.content);
    }
    return out;
}

} // namespace transcript
