/**
 * @file ArchiveWriter.hpp
 * @brief Streams stories into a new archive release.
 */

#pragma once

#include <cstdint>
#include <fstream>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include "domain/StoryWriter.hpp"
#include "infrastructure/ZipArchive.hpp"

namespace storykeep::infrastructure {

/** @brief Extra file stored at the archive root, as (name, contents). */
using ExtraFile = std::pair<std::string, std::string>;

/**
 * @class ArchiveWriter
 * @brief Writes payloads into a zip and the index into a side-channel file.
 *
 * Each written story adds one stored zip entry and one line of the index.
 * On close, the extras and a deflated copy of the index are appended to the
 * zip. A writer never overwrites existing files. A writer destroyed before
 * close() discards both files, so only finished releases reach the disk.
 */
class ArchiveWriter : public domain::StoryWriter {
public:
    /**
     * @param archivePath Target zip, must end in `.zip`.
     * @param indexPath Side-channel index file.
     * @param extras Files appended to the archive on close.
     * @throws std::invalid_argument If the archive extension is wrong.
     * @throws InvariantViolation If either path already exists.
     * @throws StorySourceError If the files cannot be created.
     */
    ArchiveWriter(const std::string& archivePath,
                  const std::string& indexPath,
                  std::vector<ExtraFile> extras = {});
    ~ArchiveWriter() override;

    ArchiveWriter(const ArchiveWriter&) = delete;
    ArchiveWriter& operator=(const ArchiveWriter&) = delete;

    /**
     * @brief Adds the story payload and its index line.
     * @throws InvariantViolation On id mismatch, duplicates or after close.
     */
    void write(domain::Story& story) override;

    /**
     * @brief Finishes the index and the zip. Safe to call twice.
     * @throws StorySourceError If finishing fails; both files are discarded.
     */
    void close();

    /** @brief Stops writing and deletes the archive and the side index. */
    void abort();

    bool isOpen() const { return m_open; }
    std::size_t count() const { return m_keys.size(); }

    /** @brief Lowercase ASCII slug with runs of other characters collapsed to '-'. */
    static std::string Slugify(const std::string& text);

    /** @brief Builds `<ext>/<c>/<author-slug>-<author-id>/<title-slug>-<id>.<ext>`. */
    static std::string PathFor(const nlohmann::json& meta, const std::string& extension);

private:
    void finish();

    std::string m_archivePath;
    std::string m_indexPath;
    std::vector<ExtraFile> m_extras;
    std::unique_ptr<ZipWriter> m_zip;
    std::ofstream m_index;
    std::set<std::int64_t> m_keys;
    std::set<std::string> m_paths;
    bool m_open = false;
};

} // namespace storykeep::infrastructure
