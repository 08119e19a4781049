#pragma once

#include <string>

namespace platform {

// $XDG_CONFIG_HOME/copyq-chat or ~/.config/copyq-chat; empty if HOME is unset.
std::string config_dir();

// $XDG_DATA_HOME/copyq-chat or ~/.local/share/copyq-chat; empty if HOME is unset.
std::string data_dir();

// Replaces a leading "~" or "~/" with $HOME. Other paths are returned unchanged.
std::string expand_user(const std::string& path);

} // namespace platform
