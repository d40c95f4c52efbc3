/**
 * @file TestSupport.hpp
 * @brief Shared fixtures for the test executables: in-memory fetcher and temp dirs.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>
#include "domain/Errors.hpp"
#include "domain/Fetcher.hpp"
#include "infrastructure/ZipArchive.hpp"

namespace storykeep::test {

/**
 * @class MemoryFetcher
 * @brief Fetcher backed by maps, counting every fetch call.
 */
class MemoryFetcher : public domain::Fetcher {
public:
    explicit MemoryFetcher(domain::FlavorSet flavors = {}, bool prefetchMeta = false, bool prefetchData = false)
        : m_flavors(std::move(flavors)), m_prefetchMeta(prefetchMeta), m_prefetchData(prefetchData) {}

    void put(std::int64_t key, nlohmann::json meta, std::optional<std::string> data = std::nullopt) {
        m_meta[key] = std::move(meta);
        if (data) m_data[key] = *data;
    }

    /** @brief Makes every fetch of the key raise StorySourceError. */
    void breakKey(std::int64_t key) { m_broken.insert(key); }
    void repairKey(std::int64_t key) { m_broken.erase(key); }

    nlohmann::json fetchMeta(std::int64_t key) override {
        ++metaCalls;
        if (m_broken.count(key)) throw domain::StorySourceError("Source is down.");
        auto it = m_meta.find(key);
        if (it == m_meta.end()) throw domain::InvalidStoryError();
        return it->second;
    }

    std::string fetchData(std::int64_t key) override {
        ++dataCalls;
        if (m_broken.count(key)) throw domain::StorySourceError("Source is down.");
        auto it = m_data.find(key);
        if (it == m_data.end()) throw domain::InvalidStoryError();
        return it->second;
    }

    domain::FlavorSet flavors() const override { return m_flavors; }
    bool prefetchMeta() const override { return m_prefetchMeta; }
    bool prefetchData() const override { return m_prefetchData; }

    int metaCalls = 0;
    int dataCalls = 0;

private:
    domain::FlavorSet m_flavors;
    bool m_prefetchMeta;
    bool m_prefetchData;
    std::map<std::int64_t, nlohmann::json> m_meta;
    std::map<std::int64_t, std::string> m_data;
    std::set<std::int64_t> m_broken;
};

/** @brief Creates a unique directory under the system temp dir and removes it on destruction. */
class TempDir {
public:
    explicit TempDir(const std::string& prefix) {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        m_path = std::filesystem::temp_directory_path() / (prefix + "_" + std::to_string(stamp));
        std::filesystem::create_directories(m_path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return m_path; }
    std::string operator/(const std::string& name) const { return (m_path / name).string(); }

private:
    std::filesystem::path m_path;
};

/** @brief Story meta with one chapter per modification date. */
inline nlohmann::json MakeMeta(std::int64_t id, std::int64_t modified, int chapters = 1) {
    nlohmann::json meta = {
        {"id", id},
        {"title", "Story " + std::to_string(id)},
        {"author", {{"id", 100 + id}, {"name", "Author " + std::to_string(id)}}},
        {"date_modified", modified},
        {"chapters", nlohmann::json::array()},
    };
    for (int i = 0; i < chapters; ++i) {
        meta["chapters"].push_back({{"id", id * 10 + i}, {"date_modified", modified}});
    }
    return meta;
}

/** @brief A tiny valid zip standing in for a packaged story. */
inline std::string MakePackage(const std::string& dir, const std::string& text) {
    std::string path = (std::filesystem::path(dir) / "package.tmp.zip").string();
    {
        infrastructure::ZipWriter zip(path);
        zip.add("mimetype", "application/epub+zip");
        zip.add("content.html", text, infrastructure::ZipMethod::Deflated);
        zip.close();
    }
    std::string bytes;
    {
        std::ifstream in(path, std::ios::binary);
        bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
    std::filesystem::remove(path);
    return bytes;
}

} // namespace storykeep::test
