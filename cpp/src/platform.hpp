#pragma once
#include <filesystem>

namespace platform {

// First match of: $NANAKSHAHI_CONFIG, $XDG_CONFIG_HOME/nanakshahi/config.toml,
// $HOME/.config/nanakshahi/config.toml (%APPDATA% on Windows), and finally
// ./nanakshahi.toml when no home directory is known.
std::filesystem::path resolve_config_path();

} // namespace platform
