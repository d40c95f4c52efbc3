// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace storykeep::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetCacheHome();

    /** @brief Default settings file: <config home>/storykeep/settings.json */
    static std::filesystem::path GetDefaultConfigFile();

    /** @brief Scratch directory for index databases, created on demand. */
    static std::filesystem::path GetIndexCacheDir();
};

} // namespace storykeep::infrastructure
