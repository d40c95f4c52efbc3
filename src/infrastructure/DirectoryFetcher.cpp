/**
 * @file DirectoryFetcher.cpp
 * @brief Implementation of the DirectoryFetcher class.
 */
#include "infrastructure/DirectoryFetcher.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace storykeep::infrastructure {

namespace {

void CollectKeys(const std::string& directory, std::set<std::int64_t>& keys) {
    if (directory.empty()) return;

    if (!fs::is_directory(directory)) {
        throw domain::StorySourceError("Path is not a directory: " + directory);
    }

    for (const auto& entry : fs::directory_iterator(directory)) {
        if (!entry.is_regular_file()) {
            throw domain::StorySourceError("Path is not a file: " + entry.path().string());
        }

        std::string name = entry.path().filename().string();
        bool numeric = !name.empty() && name.size() <= 18 &&
            std::all_of(name.begin(), name.end(), [](unsigned char c) { return std::isdigit(c); });
        if (!numeric) {
            throw domain::StorySourceError("Name is not a digit: " + entry.path().string());
        }

        keys.insert(std::stoll(name));
    }
}

} // namespace

DirectoryFetcher::DirectoryFetcher(std::string metaPath, std::string dataPath, domain::FlavorSet flavors)
    : m_metaPath(std::move(metaPath)), m_dataPath(std::move(dataPath)), m_flavors(std::move(flavors)) {}

std::set<std::int64_t> DirectoryFetcher::listKeys() const {
    std::set<std::int64_t> keys;
    CollectKeys(m_metaPath, keys);
    CollectKeys(m_dataPath, keys);
    return keys;
}

std::size_t DirectoryFetcher::size() {
    if (!m_size) {
        m_size = listKeys().size();
    }
    return *m_size;
}

std::string DirectoryFetcher::readFile(const std::string& path) const {
    if (!fs::exists(path)) {
        throw domain::InvalidStoryError("File does not exist.");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw domain::StorySourceError("Unable to read file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw domain::StorySourceError("Unable to read file: " + path);
    }
    return buffer.str();
}

nlohmann::json DirectoryFetcher::fetchMeta(std::int64_t key) {
    if (m_metaPath.empty()) {
        throw domain::StorySourceError("Meta path is undefined.");
    }

    std::string raw = readFile((fs::path(m_metaPath) / std::to_string(key)).string());
    try {
        return nlohmann::json::parse(raw);
    } catch (const nlohmann::json::parse_error& e) {
        throw domain::StorySourceError("Meta for story " + std::to_string(key) + " is not valid JSON: " + e.what());
    }
}

std::string DirectoryFetcher::fetchData(std::int64_t key) {
    if (m_dataPath.empty()) {
        throw domain::StorySourceError("Data path is undefined.");
    }
    return readFile((fs::path(m_dataPath) / std::to_string(key)).string());
}

} // namespace storykeep::infrastructure
