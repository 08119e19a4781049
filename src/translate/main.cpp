#include "translation.hpp"

#include "api/openrouter_backend.hpp"
#include "capture/capture_source.hpp"
#include "config.hpp"
#include "platform/linux/clipboard_tools.hpp"
#include "platform/linux/notify_send.hpp"
#include "platform/linux/subprocess.hpp"

#include <print>
#include <signal.h>
#include <string>

static void notify(const std::string& title, const std::string& body, int timeout_ms) {
    auto res = platform::notify(title, body, timeout_ms);
    if (!res) std::println(stderr, "translate: {}", res.error());
}

int main(int argc, char* argv[]) {
    ::signal(SIGPIPE, SIG_IGN);

    bool verbose = false;
    std::string config_path, model;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--model" && i + 1 < argc) {
            model = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::println("Usage: copyq-translate [options]");
            std::println("Translates the selected text between English and Russian.");
            std::println("Options:");
            std::println("  -c, --config PATH   Config file path");
            std::println("      --model NAME    Model to use (default: nvidia/nemotron-nano-9b-v2:free)");
            std::println("  -v, --verbose       Enable verbose logging");
            std::println("  -h, --help          Show this help");
            return 0;
        }
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    config.apply_env();
    if (!model.empty()) config.translate.model = model;

    if (config.api.key.empty()) {
        notify("Translation Error", "OPENROUTER_API_KEY not set. Please add it to .env file or export it.",
               5000);
        return 1;
    }

    notify("Translation", "Processing translation...", 2000);

    CaptureSource::Capabilities caps;
    caps.text = platform::default_text_sources(
        std::chrono::milliseconds(config.capture.text_timeout_ms));
    CaptureSource capture(std::move(caps), nullptr, verbose);

    auto text = capture.resolve_text();
    if (!text) {
        notify("Translation Error",
               "No text selected or clipboard empty. Please select some text and try again.", 3000);
        return 1;
    }

    notify("Translation", "Calling translation API...", 2000);

    OpenRouterBackend backend(config.api.endpoint, config.api.key, config.api.timeout_s);
    std::vector<WireMessage> messages{
        WireMessage{.role = Role::User, .content = translation::make_prompt(*text)},
    };
    auto result = backend.complete(config.translate.model, messages);
    if (!result) {
        std::println(stderr, "translate: {}", describe(result.error()));
        notify("Translation Error", "Failed to get translation from API", 5000);
        return 1;
    }

    auto clean = translation::strip_markdown(*result);
    notify("Translation", translation::summary(clean, 3), 8000);

    auto copied = platform::add_to_clipboard_manager(*result);
    if (!copied) std::println(stderr, "translate: {}", copied.error());

    auto dialog = platform::run_process({"zenity", "--info", "--no-markup", "--title=Full Translation:",
                                         "--text=" + translation::head(clean, 20),
                                         "--width=600", "--height=400"});
    if (!dialog) std::println(stderr, "translate: {}", dialog.error());

    return 0;
}
