#include <catch2/catch_test_macros.hpp>

#include "config.hpp"
#include "platform/platform_paths.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "cc_test_config_XXXXXX";
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        REQUIRE(::write(fd, content.data(), content.size()) == static_cast<ssize_t>(content.size()));
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

// Sets an environment variable for the lifetime of the guard.
struct EnvGuard {
    std::string name;

    EnvGuard(std::string n, const std::string& value) : name(std::move(n)) {
        ::setenv(name.c_str(), value.c_str(), 1);
    }

    ~EnvGuard() { ::unsetenv(name.c_str()); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.api.key.empty());
        REQUIRE(cfg.api.model == "openrouter/sonoma-sky-alpha");
        REQUIRE(cfg.api.endpoint == "https://openrouter.ai/api/v1/chat/completions");
        REQUIRE(cfg.api.timeout_s == 30);
        REQUIRE(cfg.storage.history_dir == "~/.copyq_chat_history");
        REQUIRE(cfg.storage.screenshot_dir == "~/.copyq_screenshots");
        REQUIRE(cfg.capture.screenshot);
        REQUIRE(cfg.capture.text_timeout_ms == 2000);
        REQUIRE(cfg.capture.screenshot_timeout_ms == 5000);
        REQUIRE(cfg.capture.upload_timeout_s == 10);
        REQUIRE(cfg.translate.model == "nvidia/nemotron-nano-9b-v2:free");
        REQUIRE(cfg.port == 8085);
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "api": {
                "key": "sk-test",
                "model": "openai/gpt-4o",
                "endpoint": "http://localhost:9000/v1/chat/completions",
                "timeout_s": 60
            },
            "storage": { "history_dir": "/tmp/h", "screenshot_dir": "/tmp/s" },
            "capture": { "screenshot": false, "text_timeout_ms": 500,
                         "screenshot_timeout_ms": 1000, "upload_timeout_s": 3 },
            "translate": { "model": "some/model" },
            "port": 9090
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.api.key == "sk-test");
        REQUIRE(cfg.api.model == "openai/gpt-4o");
        REQUIRE(cfg.api.endpoint == "http://localhost:9000/v1/chat/completions");
        REQUIRE(cfg.api.timeout_s == 60);
        REQUIRE(cfg.storage.history_dir == "/tmp/h");
        REQUIRE(cfg.storage.screenshot_dir == "/tmp/s");
        REQUIRE_FALSE(cfg.capture.screenshot);
        REQUIRE(cfg.capture.text_timeout_ms == 500);
        REQUIRE(cfg.capture.screenshot_timeout_ms == 1000);
        REQUIRE(cfg.capture.upload_timeout_s == 3);
        REQUIRE(cfg.translate.model == "some/model");
        REQUIRE(cfg.port == 9090);
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "api": { "model": "x/y" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.api.model == "x/y");
        // Other fields retain defaults
        REQUIRE(cfg.api.endpoint == "https://openrouter.ai/api/v1/chat/completions");
        REQUIRE(cfg.storage.history_dir == "~/.copyq_chat_history");
        REQUIRE(cfg.port == 8085);
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.api.model == "openrouter/sonoma-sky-alpha");
        REQUIRE(cfg.port == 8085);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/cc_test_nonexistent_config_file.json");
        REQUIRE(cfg.api.model == "openrouter/sonoma-sky-alpha");
        REQUIRE(cfg.port == 8085);
    }

    SECTION("EnvironmentOverridesFile") {
        TmpFile f(R"({ "api": { "key": "from-file", "model": "file/model" }, "port": 9000 })");
        EnvGuard key("OPENROUTER_API_KEY", "from-env");
        EnvGuard model("OPENROUTER_MODEL", "env/model");
        EnvGuard port("COPYQ_CHAT_PORT", "8123");
        EnvGuard hist("COPYQ_CHAT_HISTORY_DIR", "/tmp/env-history");

        auto cfg = Config::load(f.path);
        cfg.apply_env();
        REQUIRE(cfg.api.key == "from-env");
        REQUIRE(cfg.api.model == "env/model");
        REQUIRE(cfg.port == 8123);
        REQUIRE(cfg.storage.history_dir == "/tmp/env-history");
        REQUIRE(cfg.storage.screenshot_dir == "~/.copyq_screenshots");
    }

    SECTION("InvalidPortInEnvironmentIgnored") {
        EnvGuard port("COPYQ_CHAT_PORT", "eighty");

        Config cfg;
        cfg.apply_env();
        REQUIRE(cfg.port == 8085);
    }
}

TEST_CASE("Numeric option parsing", "[config]") {

    SECTION("Integers") {
        REQUIRE(parse_int("10") == 10);
        REQUIRE(parse_int("-1") == -1);
        REQUIRE_FALSE(parse_int("").has_value());
        REQUIRE_FALSE(parse_int("abc").has_value());
        REQUIRE_FALSE(parse_int("12abc").has_value());
        REQUIRE_FALSE(parse_int(" 12").has_value());
        REQUIRE_FALSE(parse_int("99999999999").has_value());
    }

    SECTION("Ports") {
        REQUIRE(parse_port("8085") == 8085);
        REQUIRE(parse_port("1") == 1);
        REQUIRE(parse_port("65535") == 65535);
        REQUIRE_FALSE(parse_port("0").has_value());
        REQUIRE_FALSE(parse_port("65536").has_value());
        REQUIRE_FALSE(parse_port("abc").has_value());
        REQUIRE_FALSE(parse_port("-80").has_value());
    }
}

TEST_CASE("expand_user", "[config]") {
    EnvGuard home("HOME", "/home/tester");

    REQUIRE(platform::expand_user("~/.copyq_chat_history") == "/home/tester/.copyq_chat_history");
    REQUIRE(platform::expand_user("~") == "/home/tester");
    REQUIRE(platform::expand_user("/abs/path") == "/abs/path");
    REQUIRE(platform::expand_user("~other/x") == "~other/x");
}
