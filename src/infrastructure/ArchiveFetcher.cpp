/**
 * @file ArchiveFetcher.cpp
 * @brief Implementation of ArchiveFetcher.
 */

#include "infrastructure/ArchiveFetcher.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/IndexLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>

namespace storykeep::infrastructure {

namespace fs = std::filesystem;
using domain::InvalidStoryError;
using domain::StorySourceError;

namespace {
const char* const kIndexName = "index.json";
}

std::optional<IndexBackendKind> ParseIndexBackendKind(const std::string& name) {
    if (name == "auto") return IndexBackendKind::Auto;
    if (name == "memory") return IndexBackendKind::Memory;
    if (name == "compressed") return IndexBackendKind::Compressed;
    if (name == "sqlite") return IndexBackendKind::Sqlite;
    return std::nullopt;
}

ArchiveFetcher::ArchiveFetcher(const std::string& path, ArchiveFetcherOptions options)
    : m_options(std::move(options)) {
    try {
        load(path);
    } catch (...) {
        close();
        throw;
    }
    m_open = true;
}

ArchiveFetcher::~ArchiveFetcher() {
    close();
}

std::unique_ptr<IndexBackend> ArchiveFetcher::makeBackend(std::uint64_t indexSize) {
    m_kind = m_options.backend;
    if (m_kind == IndexBackendKind::Auto) {
        m_kind = indexSize > m_options.sqliteThresholdBytes ? IndexBackendKind::Sqlite : IndexBackendKind::Memory;
    }

    switch (m_kind) {
        case IndexBackendKind::Sqlite: {
            std::string dir = m_options.cacheDir.empty() ? PathUtils::GetIndexCacheDir().string() : m_options.cacheDir;
            return std::make_unique<SqliteIndexBackend>(dir);
        }
        case IndexBackendKind::Compressed:
            return std::make_unique<MemoryIndexBackend>(true);
        default:
            return std::make_unique<MemoryIndexBackend>(false);
    }
}

void ArchiveFetcher::load(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw StorySourceError("Could not read from file: " + path);
    }

    try {
        m_archive.emplace(ZipReader::openFile(path));
    } catch (const ZipError& e) {
        std::cerr << "[ArchiveFetcher] " << e.what() << std::endl;
        throw StorySourceError("Archive is not a valid ZIP-file.");
    }

    const ZipEntryInfo* info = m_archive->find(kIndexName);
    if (!info) {
        throw StorySourceError("Archive is missing the index.");
    }

    m_index = makeBackend(info->uncompressedSize);
    IndexLoader loader(*m_index, m_options.workers);

    auto start = std::chrono::steady_clock::now();
    std::size_t count = 0;
    try {
        auto stream = m_archive->open(kIndexName);
        count = loader.load(*stream);
    } catch (const ZipError& e) {
        std::cerr << "[ArchiveFetcher] " << e.what() << std::endl;
        throw StorySourceError("Archive is corrupt.");
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    std::cerr << "[ArchiveFetcher] Loaded " << count << " index entries into " << m_index->name()
              << " backend using " << loader.workers() << " workers in " << elapsed.count() << " ms" << std::endl;
}

void ArchiveFetcher::close() {
    m_open = false;
    m_paths.clear();
    if (m_index) {
        m_index->close();
        m_index.reset();
    }
    m_archive.reset();
}

domain::FlavorSet ArchiveFetcher::flavors() const {
    return {domain::StorySource::Archive, domain::DataFormat::Epub, domain::MetaPurity::Clean};
}

void ArchiveFetcher::validate(std::int64_t key) {
    if (!m_open) {
        throw StorySourceError("Fetcher is closed.");
    }
    if (!m_index->contains(key)) {
        throw InvalidStoryError();
    }
}

std::optional<std::string> ArchiveFetcher::pathOf(const nlohmann::json& meta) const {
    auto archive = meta.find("archive");
    if (archive != meta.end() && archive->is_object()) {
        auto path = archive->find("path");
        if (path != archive->end() && path->is_string()) {
            return path->get<std::string>();
        }
    }

    auto legacy = meta.find("path");
    if (legacy != meta.end() && legacy->is_string()) {
        return legacy->get<std::string>();
    }

    return std::nullopt;
}

nlohmann::json ArchiveFetcher::fetchMeta(std::int64_t key) {
    if (!m_open) {
        throw StorySourceError("Fetcher is closed.");
    }

    std::optional<nlohmann::json> meta = m_index->find(key);
    if (!meta) {
        throw InvalidStoryError();
    }

    auto id = meta->find("id");
    if (id == meta->end() || !id->is_number_integer() || id->get<std::int64_t>() != key) {
        throw StorySourceError("Index entry " + std::to_string(key) + " has a mismatching id.");
    }

    if (auto path = pathOf(*meta)) {
        // Reads go meta then data for the same key, a bounded cache is enough.
        if (m_paths.size() >= std::max<std::size_t>(m_options.pathCacheSize, 1)) {
            m_paths.clear();
        }
        m_paths[key] = *path;
    }

    return std::move(*meta);
}

std::string ArchiveFetcher::fetchData(std::int64_t key) {
    validate(key);

    auto cached = m_paths.find(key);
    if (cached == m_paths.end()) {
        fetchMeta(key);
        cached = m_paths.find(key);
    }
    if (cached == m_paths.end()) {
        throw StorySourceError("Index is missing a path value.");
    }

    const std::string& path = cached->second;
    if (!m_archive->find(path)) {
        throw StorySourceError("Archive is missing a file: " + path);
    }

    std::string data;
    try {
        data = m_archive->read(path);
    } catch (const ZipError& e) {
        std::cerr << "[ArchiveFetcher] " << e.what() << std::endl;
        throw StorySourceError("Archive is corrupt.");
    }

    if (m_options.verifyPayloads) {
        try {
            if (!ZipReader::openView(data).test().empty()) {
                throw StorySourceError("Story is corrupt.");
            }
        } catch (const ZipError& e) {
            std::cerr << "[ArchiveFetcher] Story " << key << ": " << e.what() << std::endl;
            throw StorySourceError("Story is corrupt.");
        }
    }

    return data;
}

std::string ArchiveFetcher::testContainer() {
    if (!m_open) {
        throw StorySourceError("Fetcher is closed.");
    }
    try {
        return m_archive->test();
    } catch (const ZipError& e) {
        std::cerr << "[ArchiveFetcher] " << e.what() << std::endl;
        throw StorySourceError("Archive is corrupt.");
    }
}

std::vector<std::int64_t> ArchiveFetcher::keys() {
    if (!m_open) {
        throw StorySourceError("Fetcher is closed.");
    }
    return m_index->keys();
}

std::size_t ArchiveFetcher::size() {
    if (!m_open) {
        throw StorySourceError("Fetcher is closed.");
    }
    return m_index->size();
}

} // namespace storykeep::infrastructure
