#include "platform.hpp"
#include <cstdlib>
#include <optional>

namespace fs = std::filesystem;

namespace platform {

static std::optional<fs::path> env_path(const char* name){
    const char* v = std::getenv(name);
    if (!v || !*v) return std::nullopt;
    return fs::path(v);
}

// Directory that holds per-user configuration, if any
static std::optional<fs::path> user_config_dir(){
#if defined(_WIN32)
    return env_path("APPDATA");
#else
    if (auto xdg = env_path("XDG_CONFIG_HOME")) return xdg;
    if (auto home = env_path("HOME")) return *home / ".config";
    return std::nullopt;
#endif
}

fs::path resolve_config_path(){
    if (auto explicit_path = env_path("NANAKSHAHI_CONFIG")) return *explicit_path;
    if (auto dir = user_config_dir()) return *dir / "nanakshahi" / "config.toml";
    return fs::path("nanakshahi.toml");
}

} // namespace platform
