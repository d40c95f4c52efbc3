/**
 * @file ArchiveWriter.cpp
 * @brief Implementation of ArchiveWriter.
 */

#include "infrastructure/ArchiveWriter.hpp"
#include "domain/Errors.hpp"
#include "domain/Stamper.hpp"
#include <cctype>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace storykeep::infrastructure {

namespace fs = std::filesystem;
using domain::InvariantViolation;
using domain::StorySourceError;

namespace {

std::string IdOf(const nlohmann::json& object) {
    auto id = object.find("id");
    if (id == object.end()) return {};
    if (id->is_number_integer()) return std::to_string(id->get<std::int64_t>());
    if (id->is_string()) return id->get<std::string>();
    return {};
}

std::string StringOf(const nlohmann::json& object, const char* field) {
    auto value = object.find(field);
    if (value != object.end() && value->is_string()) return value->get<std::string>();
    return {};
}

std::string Join(const std::string& slug, const std::string& id) {
    if (slug.empty()) return id;
    if (id.empty()) return slug;
    return slug + "-" + id;
}

} // namespace

ArchiveWriter::ArchiveWriter(const std::string& archivePath,
                             const std::string& indexPath,
                             std::vector<ExtraFile> extras)
    : m_archivePath(archivePath), m_indexPath(indexPath), m_extras(std::move(extras)) {
    if (fs::path(m_archivePath).extension() != ".zip") {
        throw std::invalid_argument("Archive path must end in .zip: " + m_archivePath);
    }

    for (const auto& path : {m_archivePath, m_indexPath}) {
        if (fs::exists(path)) {
            throw InvariantViolation("Would overwrite: " + path);
        }
    }

    m_index.open(m_indexPath, std::ios::binary);
    if (!m_index.is_open()) {
        throw StorySourceError("Could not create index file: " + m_indexPath);
    }

    try {
        m_zip = std::make_unique<ZipWriter>(m_archivePath);
    } catch (const ZipError& e) {
        m_index.close();
        std::error_code ec;
        fs::remove(m_indexPath, ec);
        throw StorySourceError(e.what());
    }

    m_index << "{\n";
    m_open = true;
}

ArchiveWriter::~ArchiveWriter() {
    if (m_open) {
        std::cerr << "[ArchiveWriter] Discarding unfinished " << m_archivePath << std::endl;
        abort();
    }
}

void ArchiveWriter::abort() {
    if (!m_open) return;
    m_open = false;
    m_zip->abort();
    m_index.close();

    for (const auto& path : {m_archivePath, m_indexPath}) {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            std::cerr << "[ArchiveWriter] Could not remove " << path << ": " << ec.message() << std::endl;
        }
    }
}

std::string ArchiveWriter::Slugify(const std::string& text) {
    std::string slug;
    bool pending = false;

    for (unsigned char c : text) {
        if (c < 0x80 && std::isalnum(c)) {
            if (pending && !slug.empty()) slug.push_back('-');
            slug.push_back(static_cast<char>(std::tolower(c)));
            pending = false;
        } else {
            pending = true;
        }
    }
    return slug;
}

std::string ArchiveWriter::PathFor(const nlohmann::json& meta, const std::string& extension) {
    std::string authorSlug;
    std::string authorId;

    auto author = meta.find("author");
    if (author != meta.end() && author->is_object()) {
        authorSlug = Slugify(StringOf(*author, "name"));
        authorId = IdOf(*author);
    }

    std::string authorDir = Join(authorSlug, authorId);
    if (authorDir.empty()) authorDir = "_";

    const std::string initial = authorSlug.empty() ? "_" : authorSlug.substr(0, 1);
    const std::string file = Join(Slugify(StringOf(meta, "title")), IdOf(meta));

    return extension + "/" + initial + "/" + authorDir + "/" + file + "." + extension;
}

void ArchiveWriter::write(domain::Story& story) {
    if (!m_open) {
        throw InvariantViolation("Writer is closed.");
    }

    const std::int64_t key = story.key();
    nlohmann::json meta = story.meta();

    auto id = meta.find("id");
    if (id == meta.end() || !id->is_number_integer() || id->get<std::int64_t>() != key) {
        throw InvariantViolation("Story " + std::to_string(key) + " has a mismatching id.");
    }
    if (m_keys.count(key)) {
        throw InvariantViolation("Duplicate story key: " + std::to_string(key));
    }

    const auto format = story.flavors().get<domain::DataFormat>().value_or(domain::DataFormat::Epub);
    const std::string extension = domain::DataFormatToString(format);

    nlohmann::json& archive = domain::Stamper::archiveOf(meta);
    archive["format"] = extension;
    if (!archive.contains("path") || !archive["path"].is_string()) {
        archive["path"] = PathFor(meta, extension);
    }

    const std::string path = archive["path"].get<std::string>();
    if (m_paths.count(path)) {
        throw InvariantViolation("Duplicate story path: " + path);
    }

    std::string line;
    try {
        line = meta.dump();
    } catch (const nlohmann::json::type_error& e) {
        throw StorySourceError("Story " + std::to_string(key) + " has unencodable meta: " + e.what());
    }

    try {
        m_zip->add(path, story.data(), ZipMethod::Stored);
    } catch (const ZipError& e) {
        throw StorySourceError(e.what());
    }

    m_index << (m_keys.empty() ? "" : ",\n") << "\"" << key << "\": " << line;
    if (!m_index) {
        throw StorySourceError("Could not write index file: " + m_indexPath);
    }

    m_keys.insert(key);
    m_paths.insert(path);
}

void ArchiveWriter::close() {
    if (!m_open) return;
    try {
        finish();
    } catch (const StorySourceError&) {
        abort();
        throw;
    }
    m_open = false;

    std::cerr << "[ArchiveWriter] Wrote " << m_keys.size() << " stories to " << m_archivePath << std::endl;
}

void ArchiveWriter::finish() {
    m_index << (m_keys.empty() ? "" : "\n") << "}\n";
    m_index.close();
    if (m_index.fail()) {
        throw StorySourceError("Could not write index file: " + m_indexPath);
    }

    std::ifstream index(m_indexPath, std::ios::binary);
    std::stringstream buffer;
    buffer << index.rdbuf();
    if (!index) {
        throw StorySourceError("Could not read back index file: " + m_indexPath);
    }

    try {
        for (const auto& extra : m_extras) {
            m_zip->add(extra.first, extra.second, ZipMethod::Stored);
        }
        m_zip->add("index.json", buffer.str(), ZipMethod::Deflated);
        m_zip->close();
    } catch (const ZipError& e) {
        throw StorySourceError(e.what());
    }
}

} // namespace storykeep::infrastructure
