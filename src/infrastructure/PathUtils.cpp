#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace storykeep::infrastructure {

namespace fs = std::filesystem;

namespace {

fs::path FromEnvironment(const char* xdgVariable, const char* homeSuffix) {
    const char* xdg = std::getenv(xdgVariable);
    if (xdg && *xdg) {
        return fs::path(xdg);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / homeSuffix;
    }
    return fs::current_path(); // Fallback
}

} // namespace

fs::path PathUtils::GetConfigHome() {
    return FromEnvironment("XDG_CONFIG_HOME", ".config");
}

fs::path PathUtils::GetCacheHome() {
    return FromEnvironment("XDG_CACHE_HOME", ".cache");
}

fs::path PathUtils::GetDefaultConfigFile() {
    return GetConfigHome() / "storykeep" / "settings.json";
}

fs::path PathUtils::GetIndexCacheDir() {
    fs::path base = GetCacheHome() / "storykeep" / "index";
    std::error_code ec;
    fs::create_directories(base, ec);
    if (ec) {
        std::cerr << "[PathUtils] Could not create " << base << ": " << ec.message() << std::endl;
    }
    return base;
}

} // namespace storykeep::infrastructure
