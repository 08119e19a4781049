#pragma once

#include "session.hpp"

#include <string>

namespace transcript {

extern const char* const kHelpText;

// Full transcript window: session header, command list, then every message
// as "**YOU:** ..." / "**ASSISTANT:** ..." / "**SYSTEM:** ...".
std::string format(const Session& session);

// One "role: content" line per message, or "No history available".
std::string format_history(const Session& session);

// "**YOU:** text\n" etc.
std::string format_message(const Message& msg);

} // namespace transcript
