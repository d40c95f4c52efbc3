/**
 * @file ArchiveFetcher.hpp
 * @brief Fetcher reading stories from an existing archive release.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "domain/Fetcher.hpp"
#include "infrastructure/IndexBackend.hpp"
#include "infrastructure/ZipArchive.hpp"

namespace storykeep::infrastructure {

/**
 * @enum IndexBackendKind
 * @brief Storage used for the loaded index.
 */
enum class IndexBackendKind {
    Auto,       ///< Memory below the size threshold, SQLite above it.
    Memory,     ///< msgpack in memory.
    Compressed, ///< msgpack + zlib in memory.
    Sqlite      ///< Temporary SQLite database on disk.
};

inline std::string IndexBackendKindToString(IndexBackendKind kind) {
    switch (kind) {
        case IndexBackendKind::Auto: return "auto";
        case IndexBackendKind::Memory: return "memory";
        case IndexBackendKind::Compressed: return "compressed";
        case IndexBackendKind::Sqlite: return "sqlite";
        default: return "unknown";
    }
}

/** @brief Parses a backend name, returning nullopt for unknown names. */
std::optional<IndexBackendKind> ParseIndexBackendKind(const std::string& name);

struct ArchiveFetcherOptions {
    IndexBackendKind backend = IndexBackendKind::Auto;
    std::size_t workers = 0;                                   ///< 0 means hardware concurrency.
    std::uint64_t sqliteThresholdBytes = 1ull << 30;           ///< Uncompressed index size for Auto.
    bool verifyPayloads = true;                                ///< Test each payload package on read.
    std::string cacheDir;                                      ///< Empty means PathUtils::GetIndexCacheDir().
    std::size_t pathCacheSize = 1024;                          ///< Payload paths remembered from meta reads.
};

/**
 * @class ArchiveFetcher
 * @brief Serves stories from a zip release with an `index.json` entry.
 *
 * The whole index is loaded on construction. Meta lookups return deep
 * copies; payloads are read from the container on demand.
 */
class ArchiveFetcher : public domain::Fetcher {
public:
    /**
     * @brief Opens the archive and loads its index.
     * @throws StorySourceError If no valid release can be loaded.
     */
    explicit ArchiveFetcher(const std::string& path, ArchiveFetcherOptions options = {});
    ~ArchiveFetcher() override;

    ArchiveFetcher(const ArchiveFetcher&) = delete;
    ArchiveFetcher& operator=(const ArchiveFetcher&) = delete;

    void close() override;

    /**
     * @brief Checks that a story exists in the index.
     * @throws InvalidStoryError If the story does not exist.
     * @throws StorySourceError If the fetcher is closed.
     */
    void validate(std::int64_t key);

    nlohmann::json fetchMeta(std::int64_t key) override;
    std::string fetchData(std::int64_t key) override;

    domain::FlavorSet flavors() const override;
    bool prefetchMeta() const override { return true; }
    bool prefetchData() const override { return true; }

    /** @brief All keys in the index, ascending. */
    std::vector<std::int64_t> keys();
    std::size_t size();

    bool isOpen() const { return m_open; }

    /** @brief The backend actually selected, useful when Auto was requested. */
    IndexBackendKind backendKind() const { return m_kind; }

    /** @brief Number of payload paths currently cached. */
    std::size_t cachedPaths() const { return m_paths.size(); }

    /**
     * @brief Reads every container entry and checks its CRC.
     * @return The first bad entry name, or an empty string.
     * @throws StorySourceError If the fetcher is closed.
     */
    std::string testContainer();

private:
    void load(const std::string& path);
    std::unique_ptr<IndexBackend> makeBackend(std::uint64_t indexSize);
    std::optional<std::string> pathOf(const nlohmann::json& meta) const;

    ArchiveFetcherOptions m_options;
    IndexBackendKind m_kind = IndexBackendKind::Memory;
    std::optional<ZipReader> m_archive;
    std::unique_ptr<IndexBackend> m_index;
    std::unordered_map<std::int64_t, std::string> m_paths;
    bool m_open = false;
};

} // namespace storykeep::infrastructure
