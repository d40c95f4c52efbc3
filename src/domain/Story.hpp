/**
 * @file Story.hpp
 * @brief Domain entity for a single archived story (key, meta, data, flavors).
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "Flavor.hpp"

namespace storykeep::domain {

class Fetcher;

/**
 * @struct StoryOverrides
 * @brief Fields to replace when merging a story into a new instance.
 */
struct StoryOverrides {
    std::optional<nlohmann::json> meta;
    std::optional<std::string> data;
    std::optional<FlavorSet> flavors;
};

/**
 * @class Story
 * @brief A story that may be lazily populated from its fetcher.
 *
 * Meta and data are fetched at most once and then cached. Cached values
 * are immutable and shared between merged copies, so a merge never copies
 * the payload bytes. The fetcher is not owned and must outlive the story.
 */
class Story {
public:
    /**
     * @brief Constructor for Story.
     * @param key Primary key of the story.
     * @param fetcher Source for lazy fetches, may be null if meta and data are given.
     * @param meta Already fetched meta.
     * @param data Already fetched data.
     * @param flavors Initial flavors, copied into the story.
     * @throws std::invalid_argument If the story is lazy but has no fetcher.
     */
    Story(std::int64_t key,
          Fetcher* fetcher,
          std::optional<nlohmann::json> meta = std::nullopt,
          std::optional<std::string> data = std::nullopt,
          FlavorSet flavors = {});

    std::int64_t key() const { return m_key; }
    Fetcher* fetcher() const { return m_fetcher; }

    /** @brief True if no more fetches are necessary. */
    bool isFetched() const { return hasMeta() && hasData(); }

    bool hasMeta() const { return m_meta != nullptr; }

    /**
     * @brief Returns the story meta, fetching it on first access.
     * @throws InvalidStoryError If the story does not exist.
     * @throws StorySourceError If the source fails.
     */
    const nlohmann::json& meta();

    bool hasData() const { return m_data != nullptr; }

    /**
     * @brief Returns the story data, fetching it on first access.
     * @throws InvalidStoryError If the story does not exist.
     * @throws StorySourceError If the source fails.
     */
    const std::string& data();

    FlavorSet& flavors() { return m_flavors; }
    const FlavorSet& flavors() const { return m_flavors; }

    /** @brief Returns a copy of this story with the given fields replaced. */
    Story merge(const StoryOverrides& overrides) const;

    Story withMeta(nlohmann::json meta) const;
    Story withData(std::string data) const;

private:
    Story(std::int64_t key,
          Fetcher* fetcher,
          std::shared_ptr<const nlohmann::json> meta,
          std::shared_ptr<const std::string> data,
          FlavorSet flavors);

    std::int64_t m_key;
    Fetcher* m_fetcher;
    std::shared_ptr<const nlohmann::json> m_meta;
    std::shared_ptr<const std::string> m_data;
    FlavorSet m_flavors;
};

} // namespace storykeep::domain
