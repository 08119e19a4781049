#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

struct Config {
    struct Api {
        std::string key;
        std::string model = "openrouter/sonoma-sky-alpha";
        std::string endpoint = "https://openrouter.ai/api/v1/chat/completions";
        long timeout_s = 30;
    } api;

    // "~" is expanded where the paths are used.
    struct Storage {
        std::string history_dir = "~/.copyq_chat_history";
        std::string screenshot_dir = "~/.copyq_screenshots";
    } storage;

    struct Capture {
        bool screenshot = true;
        uint32_t text_timeout_ms = 2000;
        uint32_t screenshot_timeout_ms = 5000;
        long upload_timeout_s = 10;
    } capture;

    struct Translate {
        std::string model = "nvidia/nemotron-nano-9b-v2:free";
    } translate;

    // Port of the optional web presentation surface.
    int port = 8085;

    static Config load(const std::string& path);
    static Config load_default();

    // Overrides fields from OPENROUTER_API_KEY, OPENROUTER_MODEL, COPYQ_CHAT_PORT,
    // COPYQ_CHAT_HISTORY_DIR and COPYQ_SCREENSHOT_DIR when they are set.
    void apply_env();
};

// Whole-string decimal integer; nullopt on junk, trailing text or overflow.
std::optional<int> parse_int(std::string_view text);

// parse_int() limited to 1..65535.
std::optional<int> parse_port(std::string_view text);
