/**
 * @file RemoteFetcher.hpp
 * @brief HTTP fetcher for the live story site.
 */

#pragma once

#include <string>
#include "domain/Fetcher.hpp"

namespace storykeep::infrastructure {

/**
 * @class RemoteFetcher
 * @brief Fetches meta from the story API and data from the HTML download.
 *
 * Meta is prefetched, data is fetched lazily. Every request opens its own
 * connection, so instances are cheap and hold no sockets between calls.
 */
class RemoteFetcher : public domain::Fetcher {
public:
    /**
     * @param baseUrl Scheme, host and optional port, e.g. "https://www.fimfiction.net".
     * @param timeoutSeconds Connection and read timeout.
     */
    explicit RemoteFetcher(std::string baseUrl = "https://www.fimfiction.net", int timeoutSeconds = 60);

    /**
     * @throws InvalidStoryError If the story does not exist or access is denied.
     * @throws StorySourceError If the server fails or returns garbage.
     */
    nlohmann::json fetchMeta(std::int64_t key) override;

    /**
     * @throws InvalidStoryError If the body is empty or has no chapters.
     * @throws StorySourceError If the server fails or the body is truncated.
     */
    std::string fetchData(std::int64_t key) override;

    domain::FlavorSet flavors() const override;
    bool prefetchMeta() const override { return true; }
    bool prefetchData() const override { return false; }

    static std::string MetaPath(std::int64_t key);
    static std::string DataPath(std::int64_t key);

private:
    /** @brief Performs a GET and maps transport failures to story errors. */
    std::string get(const std::string& path) const;

    std::string m_baseUrl;
    int m_timeoutSeconds;
};

} // namespace storykeep::infrastructure
