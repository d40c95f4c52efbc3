/**
 * @file BuildTask.hpp
 * @brief Assembles a new archive release from upcoming stories.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <set>
#include <string>
#include <vector>
#include "domain/Fetcher.hpp"
#include "domain/Timestamp.hpp"
#include "infrastructure/ArchiveWriter.hpp"

namespace storykeep::application {

/** @brief Authors and stories excluded from releases. */
struct Blacklist {
    std::set<std::int64_t> authors;
    std::set<std::int64_t> stories;

    /** @brief True if the story key or its author id is listed. */
    bool contains(domain::Story& story) const;
};

using StoryVisitor = std::function<void(domain::Story&)>;

/** @brief Calls the visitor once per upcoming story, in key order. */
using StorySequence = std::function<void(const StoryVisitor&)>;

/**
 * @class BuildTask
 * @brief Writes `fimfarchive-YYYYMMDD.zip` into the output directory.
 *
 * Stories whose payload is missing upstream are revived from the previous
 * release. Blacklisted stories are left out.
 */
class BuildTask {
public:
    /**
     * @param output Existing directory for the new archive.
     * @param upcoming Stories for the new archive.
     * @param previous Previous release, may be null.
     * @param extrasDir Directory of extra files for the archive root, may be empty.
     * @param blacklist Exclusions.
     * @param now Date used for the archive name.
     * @throws StorySourceError If the output directory does not exist.
     */
    BuildTask(const std::string& output,
              StorySequence upcoming,
              domain::Fetcher* previous = nullptr,
              std::string extrasDir = {},
              Blacklist blacklist = {},
              domain::Timestamp now = std::chrono::system_clock::now());

    /** @brief `fimfarchive-YYYYMMDD.zip` for the given date. */
    static std::string ArchiveName(domain::Timestamp now);

    const std::string& archivePath() const { return m_archivePath; }
    const std::string& indexPath() const { return m_indexPath; }

    /**
     * @brief Returns the story with its payload taken from the previous release.
     * @throws StorySourceError If there is no previous release or it lacks the story.
     */
    domain::Story revive(domain::Story& story);

    /** @brief Returns a story guaranteed to carry data. */
    domain::Story resolve(domain::Story story);

    /**
     * @brief Writes the archive.
     * @return Number of stories written.
     */
    std::size_t run();

private:
    std::vector<infrastructure::ExtraFile> readExtras() const;

    std::string m_archivePath;
    std::string m_indexPath;
    StorySequence m_upcoming;
    domain::Fetcher* m_previous;
    std::string m_extrasDir;
    Blacklist m_blacklist;
};

} // namespace storykeep::application
