/**
 * @file StoryMappers.hpp
 * @brief Small callables deriving values (dates, paths, formats) from stories.
 */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include "Flavor.hpp"
#include "Story.hpp"
#include "Timestamp.hpp"

namespace storykeep::domain {

/** @brief Maps a story to its latest modification date. */
using DateMapper = std::function<std::optional<Timestamp>(Story&)>;

/** @brief Maps a story to a file path, or an empty string for none. */
using PathMapper = std::function<std::string(const Story&)>;

/**
 * @class StoryDateMapper
 * @brief Returns the latest `date_modified` of a story and its chapters.
 *
 * Yields nullopt for invalid stories and for meta without any dates.
 */
class StoryDateMapper {
public:
    std::optional<Timestamp> operator()(Story& story) const;
    std::optional<Timestamp> operator()(std::optional<Story>& story) const;
};

/**
 * @class StoryPathMapper
 * @brief Joins a directory with the story key.
 */
class StoryPathMapper {
public:
    explicit StoryPathMapper(std::string directory) : m_directory(std::move(directory)) {}

    std::string operator()(const Story& story) const;

    const std::string& directory() const { return m_directory; }

private:
    std::string m_directory;
};

/**
 * @class MetaFormatMapper
 * @brief Guesses the meta format from its keys.
 *
 * An existing MetaFormat flavor takes precedence. Conflicting keys yield nullopt.
 */
class MetaFormatMapper {
public:
    std::optional<MetaFormat> operator()(Story& story) const;
};

} // namespace storykeep::domain
