#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("api")) {
            auto& a = j["api"];
            if (a.contains("key")) cfg.api.key = a["key"].get<std::string>();
            if (a.contains("model")) cfg.api.model = a["model"].get<std::string>();
            if (a.contains("endpoint")) cfg.api.endpoint = a["endpoint"].get<std::string>();
            if (a.contains("timeout_s")) cfg.api.timeout_s = a["timeout_s"].get<long>();
        }

        if (j.contains("storage")) {
            auto& s = j["storage"];
            if (s.contains("history_dir")) cfg.storage.history_dir = s["history_dir"].get<std::string>();
            if (s.contains("screenshot_dir")) cfg.storage.screenshot_dir = s["screenshot_dir"].get<std::string>();
        }

        if (j.contains("capture")) {
            auto& c = j["capture"];
            if (c.contains("screenshot")) cfg.capture.screenshot = c["screenshot"].get<bool>();
            if (c.contains("text_timeout_ms")) cfg.capture.text_timeout_ms = c["text_timeout_ms"].get<uint32_t>();
            if (c.contains("screenshot_timeout_ms"))
                cfg.capture.screenshot_timeout_ms = c["screenshot_timeout_ms"].get<uint32_t>();
            if (c.contains("upload_timeout_s")) cfg.capture.upload_timeout_s = c["upload_timeout_s"].get<long>();
        }

        if (j.contains("translate")) {
            auto& t = j["translate"];
            if (t.contains("model")) cfg.translate.model = t["model"].get<std::string>();
        }

        if (j.contains("port")) cfg.port = j["port"].get<int>();

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}

void Config::apply_env() {
    auto env = [](const char* name) -> std::string {
        const char* v = std::getenv(name);
        return v ? v : "";
    };

    if (auto v = env("OPENROUTER_API_KEY"); !v.empty()) api.key = v;
    if (auto v = env("OPENROUTER_MODEL"); !v.empty()) api.model = v;
    if (auto v = env("COPYQ_CHAT_HISTORY_DIR"); !v.empty()) storage.history_dir = v;
    if (auto v = env("COPYQ_SCREENSHOT_DIR"); !v.empty()) storage.screenshot_dir = v;

    if (auto v = env("COPYQ_CHAT_PORT"); !v.empty()) {
        if (auto parsed = parse_port(v)) {
            port = *parsed;
        } else {
            std::println(stderr, "config: ignoring invalid COPYQ_CHAT_PORT '{}'", v);
        }
    }
}

std::optional<int> parse_int(std::string_view text) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

std::optional<int> parse_port(std::string_view text) {
    auto value = parse_int(text);
    if (!value || *value < 1 || *value > 65535) return std::nullopt;
    return value;
}
