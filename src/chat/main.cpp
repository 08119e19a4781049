#include "api/openrouter_backend.hpp"
#include "capture/capture_source.hpp"
#include "capture/image_host.hpp"
#include "chat/chat_orchestrator.hpp"
#include "chat/transcript.hpp"
#include "config.hpp"
#include "platform/linux/clipboard_tools.hpp"
#include "platform/linux/screenshot_tools.hpp"
#include "platform/linux/terminal_frontend.hpp"
#include "platform/linux/zenity_frontend.hpp"
#include "platform/platform_paths.hpp"
#include "storage/session_index.hpp"
#include "storage/session_store.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <print>
#include <signal.h>
#include <string>

namespace fs = std::filesystem;

static void usage() {
    std::println("Usage: copyq-chat [options]");
    std::println("Captures the selected text and a screenshot, then chats about them.");
    std::println("Options:");
    std::println("  -c, --config PATH   Config file path");
    std::println("      --api-key KEY   OpenRouter API key (default: $OPENROUTER_API_KEY)");
    std::println("      --model NAME    Model to use (default: $OPENROUTER_MODEL or openrouter/sonoma-sky-alpha)");
    std::println("      --port N        Port for the web interface (default: $COPYQ_CHAT_PORT or 8085)");
    std::println("      --no-screenshot Capture text only");
    std::println("      --tty           Chat on the terminal instead of zenity dialogs");
    std::println("      --resume ID     Continue a stored session");
    std::println("      --show ID       Print a stored session and exit");
    std::println("      --list          List recent sessions and exit");
    std::println("      --limit N       Number of sessions for --list (default: 10)");
    std::println("  -v, --verbose       Enable verbose logging");
    std::println("  -h, --help          Show this help");
}

static std::string index_path() {
    auto data = platform::data_dir();
    if (!data.empty()) return data + "/sessions.db";
    return "/tmp/copyq-chat/sessions.db";
}

static int list_sessions(int limit) {
    SessionIndex index;
    if (!index.open(index_path())) return 1;

    auto entries = index.recent(limit);
    if (entries.empty()) {
        std::println("No sessions recorded");
        return 0;
    }
    for (auto& e : entries) {
        std::println("[{}] {} ({} messages)", e.created_at, e.session_id, e.message_count);
        std::println("  Text: {}", e.selected_text.substr(0, 60));
        std::println("  Record: {}", e.record_path);
    }
    return 0;
}

static int show_session(const SessionStore& store, const std::string& id) {
    auto session = store.load(id);
    if (!session) {
        std::println(stderr, "Error: {}", describe(session.error()));
        return 1;
    }
    std::print("{}", transcript::format(*session));
    return 0;
}

int main(int argc, char* argv[]) {
    ::signal(SIGPIPE, SIG_IGN);

    bool verbose = false;
    bool tty = false;
    bool no_screenshot = false;
    bool list = false;
    int limit = 10;
    std::optional<int> port;
    std::string config_path, api_key, model, resume_id, show_id;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--api-key" && i + 1 < argc) {
            api_key = argv[++i];
        } else if (arg == "--model" && i + 1 < argc) {
            model = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            port = parse_port(argv[++i]);
            if (!port) {
                std::println(stderr, "Invalid port: {} (expected 1-65535)", argv[i]);
                return 1;
            }
        } else if (arg == "--resume" && i + 1 < argc) {
            resume_id = argv[++i];
        } else if (arg == "--show" && i + 1 < argc) {
            show_id = argv[++i];
        } else if (arg == "--limit" && i + 1 < argc) {
            auto parsed = parse_int(argv[++i]);
            if (!parsed || *parsed < 1) {
                std::println(stderr, "Invalid limit: {} (expected a positive number)", argv[i]);
                return 1;
            }
            limit = *parsed;
        } else if (arg == "--list") {
            list = true;
        } else if (arg == "--tty") {
            tty = true;
        } else if (arg == "--no-screenshot") {
            no_screenshot = true;
        } else if (arg == "--help" || arg == "-h") {
            usage();
            return 0;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            usage();
            return 1;
        }
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    config.apply_env();
    if (!api_key.empty()) config.api.key = api_key;
    if (!model.empty()) config.api.model = model;
    if (port) config.port = *port;
    if (no_screenshot) config.capture.screenshot = false;

    auto history_dir = platform::expand_user(config.storage.history_dir);
    auto screenshot_dir = platform::expand_user(config.storage.screenshot_dir);

    if (verbose) {
        std::println(stderr, "[copyq-chat] model: {}", config.api.model);
        std::println(stderr, "[copyq-chat] port: {}", config.port);
        std::println(stderr, "[copyq-chat] history dir: {}", history_dir);
        std::println(stderr, "[copyq-chat] screenshot dir: {}", screenshot_dir);
    }

    SessionStore store(history_dir);

    if (list) return list_sessions(limit);
    if (!show_id.empty()) return show_session(store, show_id);

    std::unique_ptr<ChatFrontend> frontend;
    if (tty) {
        frontend = std::make_unique<TerminalFrontend>();
    } else {
        frontend = std::make_unique<ZenityFrontend>(verbose);
    }

    if (config.api.key.empty()) {
        std::println(stderr, "Error: OPENROUTER_API_KEY not provided");
        std::println(stderr, "Set it via: export OPENROUTER_API_KEY='your-key' or pass --api-key");
        frontend->on_notice("OPENROUTER_API_KEY not set. Please export it or pass --api-key.",
                            Severity::Error);
        return 1;
    }

    SessionIndex index;
    if (!index.open(index_path())) {
        frontend->on_notice("Session index unavailable, --list will miss this session",
                            Severity::Warning);
    }

    Session session;
    if (!resume_id.empty()) {
        auto loaded = store.load(resume_id);
        if (!loaded) {
            frontend->on_notice("Cannot resume session: " + describe(loaded.error()),
                                Severity::Error);
            return 1;
        }
        session = std::move(*loaded);
    } else {
        auto id = store.next_session_id();
        std::string screenshot_path;
        if (config.capture.screenshot) {
            screenshot_path = (fs::path(screenshot_dir) / ("screenshot_" + id + ".png")).string();
        }

        ImageHostUploader uploader(config.capture.upload_timeout_s);
        CaptureSource::Capabilities caps;
        caps.text = platform::default_text_sources(
            std::chrono::milliseconds(config.capture.text_timeout_ms));
        caps.screenshot = platform::default_screenshot_methods(
            std::chrono::milliseconds(config.capture.screenshot_timeout_ms));
        for (auto& host : default_image_hosts()) {
            caps.upload.push_back({host.name, [&uploader, host, verbose](const std::string& path)
                                                  -> std::optional<std::string> {
                auto url = uploader.upload(host, path);
                if (!url) {
                    if (verbose) std::println(stderr, "[copyq-chat] upload: {}", url.error());
                    return std::nullopt;
                }
                return *url;
            }});
        }

        CaptureSource capture(std::move(caps),
                              [&frontend](const std::string& msg, Severity s) {
                                  frontend->on_notice(msg, s);
                              },
                              verbose);

        auto content = capture.resolve(screenshot_path);
        if (!content) {
            frontend->on_notice(content.error().message, Severity::Error);
            return 1;
        }

        auto created = store.create(*content, id);
        if (!created) {
            frontend->on_notice("Could not save chat history: " + describe(created.error()),
                                Severity::Error);
            return 1;
        }
        session = std::move(*created);
        frontend->on_notice("Context captured! Starting chat session...", Severity::Info);
    }

    if (index.is_open() && !index.record(session, store.path_for(session.session_id))) {
        std::println(stderr, "[copyq-chat] index: could not record session {}", session.session_id);
    }

    OpenRouterBackend backend(config.api.endpoint, config.api.key, config.api.timeout_s);
    ChatOrchestrator chat(config, store, backend, *frontend, verbose);
    if (!chat.start(std::move(session))) return 1;

    bool ok = chat.run();

    if (index.is_open() &&
        !index.record(chat.session(), store.path_for(chat.session().session_id))) {
        std::println(stderr, "[copyq-chat] index: could not update session {}",
                     chat.session().session_id);
    }

    std::println("Chat session ended. History saved to: {}",
                 store.path_for(chat.session().session_id));
    return ok ? 0 : 1;
}
