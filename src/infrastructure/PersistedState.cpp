/**
 * @file PersistedState.cpp
 * @brief Implementation of PersistedState.
 */

#include "infrastructure/PersistedState.hpp"
#include "domain/Errors.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <utility>

namespace storykeep::infrastructure {

namespace fs = std::filesystem;

PersistedState::PersistedState(std::string path, nlohmann::json defaults)
    : m_path(std::move(path)), m_defaults(std::move(defaults)) {
    load();
}

void PersistedState::load() {
    m_data = nlohmann::json::object();

    if (fs::exists(m_path)) {
        std::ifstream f(m_path);
        if (!f.is_open()) {
            throw domain::StorySourceError("Could not read state file: " + m_path);
        }
        try {
            f >> m_data;
        } catch (const nlohmann::json::exception& e) {
            throw domain::StorySourceError("State file is not valid JSON: " + m_path + ": " + e.what());
        }
        if (!m_data.is_object()) {
            throw domain::StorySourceError("State file is not a JSON object: " + m_path);
        }
    }

    for (const auto& item : m_defaults.items()) {
        if (!m_data.contains(item.key())) {
            m_data[item.key()] = item.value();
        }
    }
}

void PersistedState::save() const {
    performAtomicWrite(m_data.dump(4));
}

void PersistedState::performAtomicWrite(const std::string& content) const {
    fs::path finalPath = m_path;

    // Unique temp path per operation: <file>.<timestamp>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    // 1. Ensure directory exists
    std::error_code ec;
    if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path())) {
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            throw domain::StorySourceError("Could not create directory for " + m_path + ": " + ec.message());
        }
    }

    // 2. Write to temp
    {
        std::ofstream ofs(tempPath);
        if (!ofs.is_open()) {
            throw domain::StorySourceError("Failed to open temp file: " + tempPath.string());
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            fs::remove(tempPath, ec);
            throw domain::StorySourceError("Write failed during output: " + tempPath.string());
        }
    }

    // 3. Atomic rename
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        if (cleanup) {
            std::cerr << "[PersistedState] Could not remove " << tempPath << ": " << cleanup.message() << std::endl;
        }
        throw domain::StorySourceError("Rename failed for " + m_path + ": " + ec.message());
    }
}

} // namespace storykeep::infrastructure
