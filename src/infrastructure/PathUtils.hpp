// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace loopbinder::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();

    /** @brief Default settings file: <config home>/loopbinder/settings.json */
    static std::filesystem::path GetDefaultSettingsPath();

    /** @brief Resolves a settings value relative to the settings file's directory. */
    static std::filesystem::path Resolve(const std::filesystem::path& base, const std::string& value);
};

} // namespace loopbinder::infrastructure
