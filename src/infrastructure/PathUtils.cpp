#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace loopbinder::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetDefaultSettingsPath() {
    return GetConfigHome() / "loopbinder" / "settings.json";
}

fs::path PathUtils::Resolve(const fs::path& base, const std::string& value) {
    if (value.empty()) return {};
    fs::path p(value);
    if (p.is_absolute()) return p;
    return base / p;
}

} // namespace loopbinder::infrastructure
