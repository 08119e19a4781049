#pragma once

#include <expected>
#include <string>

namespace platform {

// Desktop notification through notify-send.
std::expected<void, std::string> notify(const std::string& title, const std::string& body,
                                        int timeout_ms);

} // namespace platform
