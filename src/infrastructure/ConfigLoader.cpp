/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>

namespace storykeep::infrastructure {

namespace {

template <typename T>
void Read(const nlohmann::json& j, const char* key, T& target) {
    if (j.contains(key) && !j[key].is_null()) {
        target = j[key].get<T>();
    }
}

void ReadKeys(const nlohmann::json& j, const char* key, std::set<std::int64_t>& target) {
    if (!j.contains(key) || !j[key].is_array()) return;
    for (const auto& value : j[key]) {
        target.insert(value.get<std::int64_t>());
    }
}

} // namespace

AppConfig ConfigLoader::FromJson(const nlohmann::json& j) {
    AppConfig config;
    if (!j.is_object()) return config;

    Read(j, "workdir", config.workdir);

    if (j.contains("remote") && j["remote"].is_object()) {
        const auto& remote = j["remote"];
        Read(remote, "base_url", config.remote.baseUrl);
        Read(remote, "timeout_seconds", config.remote.timeoutSeconds);
    }

    if (j.contains("update") && j["update"].is_object()) {
        const auto& update = j["update"];
        Read(update, "success_delay", config.update.successDelay);
        Read(update, "skipped_delay", config.update.skippedDelay);
        Read(update, "failure_delay", config.update.failureDelay);
        Read(update, "max_retries", config.update.maxRetries);
        Read(update, "max_skips", config.update.maxSkips);
    }

    if (j.contains("index") && j["index"].is_object()) {
        const auto& index = j["index"];
        Read(index, "backend", config.index.backend);
        Read(index, "workers", config.index.workers);
        Read(index, "sqlite_threshold_bytes", config.index.sqliteThresholdBytes);
        Read(index, "verify_payloads", config.index.verifyPayloads);
    }

    if (j.contains("blacklist") && j["blacklist"].is_object()) {
        ReadKeys(j["blacklist"], "authors", config.blacklist.authors);
        ReadKeys(j["blacklist"], "stories", config.blacklist.stories);
    }

    return config;
}

AppConfig ConfigLoader::Load(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        return AppConfig{};
    }

    try {
        std::ifstream f(path);
        nlohmann::json j;
        f >> j;
        return FromJson(j);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << path << ": " << e.what() << std::endl;
    }

    return AppConfig{};
}

} // namespace storykeep::infrastructure
