/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading application configuration (settings.json).
 *
 * Provides a unified way to access crawl policy, index and remote settings
 * without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <nlohmann/json.hpp>

namespace storykeep::infrastructure {

struct RemoteConfig {
    std::string baseUrl = "https://www.fimfiction.net";
    int timeoutSeconds = 60;
};

/** @brief Crawl pacing. Delays are in seconds. */
struct UpdateConfig {
    double successDelay = 5;
    double skippedDelay = 2;
    double failureDelay = 300;
    int maxRetries = 10;
    int maxSkips = 500;
};

struct IndexConfig {
    std::string backend = "auto";
    std::size_t workers = 0;
    std::uint64_t sqliteThresholdBytes = 1ull << 30;
    bool verifyPayloads = true;
};

struct BlacklistConfig {
    std::set<std::int64_t> authors;
    std::set<std::int64_t> stories;
};

struct AppConfig {
    std::string workdir = "worktree/update";
    RemoteConfig remote;
    UpdateConfig update;
    IndexConfig index;
    BlacklistConfig blacklist;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings from a JSON file.
     * @param path Path to settings.json.
     * @return Parsed settings; defaults for a missing file, missing keys or a malformed file.
     */
    static AppConfig Load(const std::string& path);

    /** @brief Applies the keys present in @p j on top of the defaults. */
    static AppConfig FromJson(const nlohmann::json& j);
};

} // namespace storykeep::infrastructure
