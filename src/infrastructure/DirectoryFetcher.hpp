/**
 * @file DirectoryFetcher.hpp
 * @brief Filesystem-based fetcher for loose story files.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include "domain/Fetcher.hpp"

namespace storykeep::infrastructure {

/**
 * @class DirectoryFetcher
 * @brief Reads stories from directories holding one file per key.
 *
 * Meta files contain JSON, data files contain the raw payload. File names
 * are the story keys. Either directory may be left empty to disable it.
 */
class DirectoryFetcher : public domain::Fetcher {
public:
    /**
     * @brief Constructor for DirectoryFetcher.
     * @param metaPath Directory for story meta, empty if undefined.
     * @param dataPath Directory for story data, empty if undefined.
     * @param flavors Flavors added to every fetched story.
     */
    DirectoryFetcher(std::string metaPath, std::string dataPath, domain::FlavorSet flavors = {});

    /**
     * @brief Lists all keys found in either directory.
     * @throws StorySourceError If a path is not a directory or holds a non-numeric file.
     */
    std::set<std::int64_t> listKeys() const;

    /** @brief Total number of stories, computed once. */
    std::size_t size();

    /** @brief Calls @p visit with each story, ordered by key. */
    template <typename Visitor>
    void forEach(Visitor&& visit) {
        for (std::int64_t key : listKeys()) {
            domain::Story story = fetch(key);
            visit(story);
        }
    }

    /** @throws InvalidStoryError If the file does not exist. */
    nlohmann::json fetchMeta(std::int64_t key) override;

    /** @throws InvalidStoryError If the file does not exist. */
    std::string fetchData(std::int64_t key) override;

    domain::FlavorSet flavors() const override { return m_flavors; }

private:
    std::string readFile(const std::string& path) const;

    std::string m_metaPath; ///< Meta directory, empty if undefined.
    std::string m_dataPath; ///< Data directory, empty if undefined.
    domain::FlavorSet m_flavors;
    std::optional<std::size_t> m_size;
};

} // namespace storykeep::infrastructure
