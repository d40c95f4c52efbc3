/**
 * @file DirectoryWriter.hpp
 * @brief Filesystem sink writing story meta and data as loose files.
 */

#pragma once

#include <string>
#include "domain/StoryMappers.hpp"
#include "domain/StoryWriter.hpp"

namespace storykeep::infrastructure {

/**
 * @class DirectoryWriter
 * @brief Writes meta as pretty JSON and data as raw bytes.
 *
 * Either mapper may be empty, or return an empty path, to skip that part.
 */
class DirectoryWriter : public domain::StoryWriter {
public:
    /**
     * @brief Constructor for DirectoryWriter.
     * @param metaPath Maps a story to its meta file.
     * @param dataPath Maps a story to its data file.
     * @param overwrite Allow replacing existing files.
     * @param makeDirs Create missing parent directories.
     */
    DirectoryWriter(domain::PathMapper metaPath,
                    domain::PathMapper dataPath,
                    bool overwrite = false,
                    bool makeDirs = true);

    /** @brief Writer storing files as `<directory>/<key>`, empty directories disable a part. */
    static DirectoryWriter ForDirectories(const std::string& metaDir,
                                          const std::string& dataDir,
                                          bool overwrite = false,
                                          bool makeDirs = true);

    /**
     * @throws InvariantViolation If a file exists and overwrite is disabled.
     * @throws StorySourceError If a parent directory is missing or unwritable.
     */
    void write(domain::Story& story) override;

private:
    void checkOverwrite(const std::string& path) const;
    void checkDirectory(const std::string& path) const;
    void performWrite(const std::string& contents, const std::string& path) const;

    domain::PathMapper m_metaPath;
    domain::PathMapper m_dataPath;
    bool m_overwrite;
    bool m_makeDirs;
};

} // namespace storykeep::infrastructure
