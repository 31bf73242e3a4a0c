#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace modlink::infrastructure {

namespace fs = std::filesystem;

namespace {
// Steam app id of Arma 3; Workshop downloads land under this directory.
constexpr const char* kWorkshopAppId = "107410";

// $variable if set, else $HOME/homeRelative, else the working directory.
fs::path XdgDirectory(const char* variable, const fs::path& homeRelative) {
    const char* value = std::getenv(variable);
    if (value && *value) {
        return fs::path(value);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / homeRelative;
    }
    return fs::current_path();
}

} // namespace

fs::path PathUtils::GetDataHome() {
    return XdgDirectory("XDG_DATA_HOME", fs::path(".local") / "share");
}

fs::path PathUtils::GetConfigHome() {
    return XdgDirectory("XDG_CONFIG_HOME", ".config");
}

fs::path PathUtils::GetSettingsFile() {
    return GetConfigHome() / "modlink" / "settings.json";
}

fs::path PathUtils::GetDefaultContentRoot() {
    return GetDataHome() / "Steam" / "steamapps" / "workshop" / "content" / kWorkshopAppId;
}

fs::path PathUtils::GetDefaultLinksRoot() {
    return GetDataHome() / "modlink" / "links";
}

} // namespace modlink::infrastructure
