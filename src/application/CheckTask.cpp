/**
 * @file CheckTask.cpp
 * @brief Implementation of CheckTask.
 */

#include "application/CheckTask.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/ZipArchive.hpp"
#include <iostream>

namespace storykeep::application {

using domain::StorySourceError;
using infrastructure::ZipError;
using infrastructure::ZipReader;

std::string CheckFailure::toString() const {
    return "Invalid CRC: " + (key ? std::to_string(*key) : std::string("Archive"));
}

CheckTask::CheckTask(infrastructure::ArchiveFetcher& archive) : m_archive(archive) {}

std::optional<CheckFailure> CheckTask::run() {
    m_checked = 0;

    const std::string entry = m_archive.testContainer();
    if (!entry.empty()) {
        return CheckFailure{std::nullopt, "Bad entry " + entry};
    }

    for (std::int64_t key : m_archive.keys()) {
        std::string data;
        try {
            data = m_archive.fetchData(key);
            const std::string bad = ZipReader::openView(data).test();
            if (!bad.empty()) {
                return CheckFailure{key, "Bad package entry " + bad};
            }
        } catch (const StorySourceError& e) {
            return CheckFailure{key, e.what()};
        } catch (const ZipError& e) {
            return CheckFailure{key, e.what()};
        }
        ++m_checked;
    }

    std::cerr << "[CheckTask] " << m_checked << " stories passed" << std::endl;
    return std::nullopt;
}

} // namespace storykeep::application
