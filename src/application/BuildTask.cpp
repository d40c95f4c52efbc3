/**
 * @file BuildTask.cpp
 * @brief Implementation of BuildTask.
 */

#include "application/BuildTask.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>

namespace storykeep::application {

namespace fs = std::filesystem;
using domain::InvalidStoryError;
using domain::Story;
using domain::StorySourceError;

bool Blacklist::contains(Story& story) const {
    if (stories.count(story.key())) return true;
    if (authors.empty()) return false;

    const nlohmann::json& meta = story.meta();
    auto author = meta.find("author");
    if (author == meta.end() || !author->is_object()) return false;

    auto id = author->find("id");
    return id != author->end() && id->is_number_integer() && authors.count(id->get<std::int64_t>()) > 0;
}

BuildTask::BuildTask(const std::string& output,
                     StorySequence upcoming,
                     domain::Fetcher* previous,
                     std::string extrasDir,
                     Blacklist blacklist,
                     domain::Timestamp now)
    : m_upcoming(std::move(upcoming)),
      m_previous(previous),
      m_extrasDir(std::move(extrasDir)),
      m_blacklist(std::move(blacklist)) {
    std::error_code ec;
    fs::path directory = fs::canonical(output, ec);
    if (ec || !fs::is_directory(directory)) {
        throw StorySourceError("Output directory does not exist: " + output);
    }

    fs::path archive = directory / ArchiveName(now);
    m_archivePath = archive.string();
    m_indexPath = fs::path(archive).replace_extension(".json").string();
}

std::string BuildTask::ArchiveName(domain::Timestamp now) {
    return "fimfarchive-" + domain::FormatDateStamp(now) + ".zip";
}

std::vector<infrastructure::ExtraFile> BuildTask::readExtras() const {
    std::vector<infrastructure::ExtraFile> extras;
    if (m_extrasDir.empty()) return extras;

    if (!fs::is_directory(m_extrasDir)) {
        throw StorySourceError("Extras path is not a directory: " + m_extrasDir);
    }

    for (const auto& entry : fs::directory_iterator(m_extrasDir)) {
        if (!entry.is_regular_file()) continue;

        std::ifstream file(entry.path(), std::ios::binary);
        if (!file.is_open()) {
            throw StorySourceError("Unable to read extra file: " + entry.path().string());
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        extras.emplace_back(entry.path().filename().string(), buffer.str());
    }

    std::sort(extras.begin(), extras.end(),
              [](const infrastructure::ExtraFile& a, const infrastructure::ExtraFile& b) { return a.first < b.first; });
    return extras;
}

Story BuildTask::revive(Story& story) {
    if (!m_previous) {
        throw StorySourceError("Missing previous fetcher.");
    }

    try {
        Story revived = m_previous->fetch(story.key());
        return story.withData(revived.data());
    } catch (const InvalidStoryError&) {
        throw StorySourceError("Missing revived story " + std::to_string(story.key()) + ".");
    }
}

Story BuildTask::resolve(Story story) {
    try {
        story.data();
    } catch (const InvalidStoryError&) {
        return revive(story);
    }
    return story;
}

std::size_t BuildTask::run() {
    infrastructure::ArchiveWriter writer(m_archivePath, m_indexPath, readExtras());
    std::size_t skipped = 0;

    m_upcoming([&](Story& story) {
        if (m_blacklist.contains(story)) {
            ++skipped;
            return;
        }
        Story resolved = resolve(story);
        writer.write(resolved);
    });

    writer.close();

    std::cerr << "[BuildTask] Wrote " << writer.count() << " stories, skipped " << skipped
              << " blacklisted, to " << m_archivePath << std::endl;
    return writer.count();
}

} // namespace storykeep::application
