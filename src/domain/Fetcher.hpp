/**
 * @file Fetcher.hpp
 * @brief Interface for anything capable of producing stories by key.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "Flavor.hpp"
#include "Story.hpp"

namespace storykeep::domain {

/**
 * @class Fetcher
 * @brief Abstract source of stories.
 *
 * Implementations raise InvalidStoryError when a key does not exist and
 * StorySourceError when the source itself is unusable.
 */
class Fetcher {
public:
    virtual ~Fetcher() = default;

    /** @brief Closes file descriptors and frees memory. */
    virtual void close() {}

    /**
     * @brief Creates a story for the key.
     * @param key Primary key of the story.
     * @param prefetchMeta Forces (or suppresses) eager meta fetching.
     * @param prefetchData Forces (or suppresses) eager data fetching.
     * @return A new story bound to this fetcher.
     */
    virtual Story fetch(std::int64_t key,
                        std::optional<bool> prefetchMeta = std::nullopt,
                        std::optional<bool> prefetchData = std::nullopt);

    /** @brief Fetches story meta for the key. */
    virtual nlohmann::json fetchMeta(std::int64_t key) = 0;

    /** @brief Fetches story content bytes for the key. */
    virtual std::string fetchData(std::int64_t key) = 0;

    /** @brief Flavors given to every story created by this fetcher. */
    virtual FlavorSet flavors() const { return {}; }

    virtual bool prefetchMeta() const { return false; }
    virtual bool prefetchData() const { return false; }
};

} // namespace storykeep::domain
