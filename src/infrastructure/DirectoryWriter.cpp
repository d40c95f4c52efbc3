/**
 * @file DirectoryWriter.cpp
 * @brief Implementation of the DirectoryWriter class.
 */
#include "infrastructure/DirectoryWriter.hpp"
#include "domain/Errors.hpp"
#include <filesystem>
#include <fstream>
#include <utility>

namespace fs = std::filesystem;

namespace storykeep::infrastructure {

DirectoryWriter::DirectoryWriter(domain::PathMapper metaPath,
                                 domain::PathMapper dataPath,
                                 bool overwrite,
                                 bool makeDirs)
    : m_metaPath(std::move(metaPath)),
      m_dataPath(std::move(dataPath)),
      m_overwrite(overwrite),
      m_makeDirs(makeDirs) {}

DirectoryWriter DirectoryWriter::ForDirectories(const std::string& metaDir,
                                                const std::string& dataDir,
                                                bool overwrite,
                                                bool makeDirs) {
    domain::PathMapper meta;
    domain::PathMapper data;
    if (!metaDir.empty()) meta = domain::StoryPathMapper(metaDir);
    if (!dataDir.empty()) data = domain::StoryPathMapper(dataDir);
    return DirectoryWriter(std::move(meta), std::move(data), overwrite, makeDirs);
}

void DirectoryWriter::checkOverwrite(const std::string& path) const {
    if (!m_overwrite && fs::exists(path)) {
        throw domain::InvariantViolation("Would overwrite: '" + path + "'.");
    }
}

void DirectoryWriter::checkDirectory(const std::string& path) const {
    fs::path parent = fs::path(path).parent_path();
    if (parent.empty() || fs::is_directory(parent)) {
        return;
    }

    if (!m_makeDirs) {
        throw domain::StorySourceError("Directory does not exist: " + parent.string());
    }

    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        throw domain::StorySourceError("Could not create " + parent.string() + ": " + ec.message());
    }
}

void DirectoryWriter::performWrite(const std::string& contents, const std::string& path) const {
    checkOverwrite(path);
    checkDirectory(path);

    // Replace through a temp file so an interrupted write never leaves a truncated story.
    const std::string tempPath = path + ".tmp";
    {
        std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw domain::StorySourceError("Failed to open file: " + tempPath);
        }
        file << contents;
        file.close();
        if (file.fail()) {
            std::error_code cleanup;
            fs::remove(tempPath, cleanup);
            throw domain::StorySourceError("Write failed: " + path);
        }
    }

    std::error_code ec;
    fs::rename(tempPath, path, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        throw domain::StorySourceError("Rename failed for " + path + ": " + ec.message());
    }
}

void DirectoryWriter::write(domain::Story& story) {
    std::string metaPath = m_metaPath ? m_metaPath(story) : std::string();
    std::string dataPath = m_dataPath ? m_dataPath(story) : std::string();

    if (!metaPath.empty()) {
        performWrite(story.meta().dump(4), metaPath);
    }

    if (!dataPath.empty()) {
        performWrite(story.data(), dataPath);
    }
}

} // namespace storykeep::infrastructure
