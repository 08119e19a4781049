#include "platform/linux/notify_send.hpp"

#include "platform/linux/subprocess.hpp"

namespace platform {

std::expected<void, std::string> notify(const std::string& title, const std::string& body,
                                        int timeout_ms) {
    auto res = run_process({"notify-send", "-t", std::to_string(timeout_ms), title, body},
                           std::chrono::seconds(5));
    if (!res) return std::unexpected(res.error());
    if (res->exit_code != 0) {
        return std::unexpected("notify-send exited with code " + std::to_string(res->exit_code));
    }
    return {};
}

} // namespace platform
