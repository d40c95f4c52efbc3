/**
 * @file IndexLoader.hpp
 * @brief Streams a line-delimited archive index into an IndexBackend.
 */

#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include "infrastructure/IndexBackend.hpp"
#include "infrastructure/ZipArchive.hpp"

namespace storykeep::infrastructure {

/**
 * @class IndexLoader
 * @brief Parses `"<key>": {...}` lines on a bounded pool of worker threads.
 *
 * Lines are read on the calling thread and handed out in batches. Each
 * worker parses and encodes its batch; the encoded results are inserted
 * into the backend by the calling thread in input order.
 */
class IndexLoader {
public:
    /**
     * @param backend Destination for the encoded entries.
     * @param workers Maximum worker threads, 0 for hardware concurrency.
     * @param batchSize Lines per worker batch.
     */
    IndexLoader(IndexBackend& backend, std::size_t workers = 0, std::size_t batchSize = 1024);

    /**
     * @brief Loads every entry from the stream.
     * @return Number of entries read.
     * @throws StorySourceError If the index is malformed.
     * @throws ZipError If the container entry is corrupt.
     */
    std::size_t load(ZipEntryStream& stream);

    /**
     * @brief Splits one index line into its key and JSON fragment.
     *
     * The split happens at the first colon outside a quoted string. The key
     * is stripped of whitespace and quotes, the fragment of whitespace and
     * trailing commas.
     * @return False if the line has no such colon.
     */
    static bool SplitLine(const std::string& line, std::string& key, std::string& fragment);

    /**
     * @brief Parses one index line.
     * @throws StorySourceError Naming the key if the line is malformed.
     */
    static std::pair<std::int64_t, nlohmann::json> ParseLine(const std::string& line);

    std::size_t workers() const { return m_workers; }

private:
    void flush(std::vector<std::vector<std::string>>& batches);

    IndexBackend& m_backend;
    std::size_t m_workers;
    std::size_t m_batchSize;
};

} // namespace storykeep::infrastructure
