#pragma once

#include "capture/cascade.hpp"

#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace platform {

// Runs argv and returns its stdout without trailing newlines. Absent on any
// error, non-zero exit, timeout or whitespace-only output.
std::optional<std::string> read_command_text(const std::vector<std::string>& argv,
                                             std::chrono::milliseconds timeout);

// Primary selection (xclip), CopyQ selection, primary selection (xsel),
// CopyQ clipboard.
Cascade default_text_sources(std::chrono::milliseconds timeout);

// Pipes text into "copyq add -".
std::expected<void, std::string> add_to_clipboard_manager(const std::string& text);

std::string trim_trailing_newlines(std::string s);

} // namespace platform
