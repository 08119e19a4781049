#include "platform/linux/clipboard_tools.hpp"

#include "platform/linux/subprocess.hpp"

#include <algorithm>
#include <cctype>

namespace platform {

std::string trim_trailing_newlines(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
    return s;
}

std::optional<std::string> read_command_text(const std::vector<std::string>& argv,
                                             std::chrono::milliseconds timeout) {
    auto res = run_process(argv, timeout);
    if (!res || res->exit_code != 0) return std::nullopt;

    auto text = trim_trailing_newlines(std::move(res->out));
    bool blank = std::ranges::all_of(text, [](unsigned char c) { return std::isspace(c); });
    if (blank) return std::nullopt;
    return text;
}

Cascade default_text_sources(std::chrono::milliseconds timeout) {
    auto source = [timeout](std::string name, std::vector<std::string> argv) {
        return Capability{std::move(name), [argv = std::move(argv), timeout] {
            return read_command_text(argv, timeout);
        }};
    };

    return {
        source("primary selection", {"xclip", "-selection", "primary", "-o"}),
        source("copyq selection", {"copyq", "selection"}),
        source("xsel primary", {"xsel", "-p"}),
        source("copyq clipboard", {"copyq", "clipboard"}),
    };
}

std::expected<void, std::string> add_to_clipboard_manager(const std::string& text) {
    auto res = run_process({"copyq", "add", "-"}, std::chrono::seconds(5), &text);
    if (!res) return std::unexpected(res.error());
    if (res->exit_code != 0) {
        return std::unexpected("copyq exited with code " + std::to_string(res->exit_code));
    }
    return {};
}

} // namespace platform
