#include "platform/linux/screenshot_tools.hpp"

#include "platform/linux/subprocess.hpp"

#include <functional>

namespace platform {

std::vector<CaptureSource::NamedScreenshotMethod>
default_screenshot_methods(std::chrono::milliseconds timeout) {
    using ArgvFor = std::function<std::vector<std::string>(const std::string&)>;

    auto method = [timeout](std::string name, ArgvFor argv_for) {
        return CaptureSource::NamedScreenshotMethod{
            std::move(name),
            [argv_for = std::move(argv_for), timeout](const std::string& path) {
                auto res = run_process(argv_for(path), timeout);
                return res && res->exit_code == 0;
            }};
    };

    return {
        method("import", [](const std::string& p) {
            return std::vector<std::string>{"import", "-window", "root", p};
        }),
        method("scrot", [](const std::string& p) {
            return std::vector<std::string>{"scrot", p};
        }),
        method("gnome-screenshot", [](const std::string& p) {
            return std::vector<std::string>{"gnome-screenshot", "-f", p};
        }),
    };
}

} // namespace platform
