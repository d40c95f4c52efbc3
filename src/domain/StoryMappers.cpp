/**
 * @file StoryMappers.cpp
 * @brief Implementation of the story mappers.
 */

#include "domain/StoryMappers.hpp"
#include "domain/Errors.hpp"
#include <filesystem>

namespace storykeep::domain {

namespace {

const char* const kModified = "date_modified";
const char* const kChapters = "chapters";

std::optional<Timestamp> Latest(std::optional<Timestamp> current, const nlohmann::json& value) {
    auto parsed = ParseTimestamp(value);
    if (!parsed) return current;
    if (!current || *current < *parsed) return parsed;
    return current;
}

} // namespace

std::optional<Timestamp> StoryDateMapper::operator()(Story& story) const {
    const nlohmann::json* found = nullptr;
    try {
        found = &story.meta();
    } catch (const InvalidStoryError&) {
        return std::nullopt;
    }

    const nlohmann::json& meta = *found;
    if (!meta.is_object()) return std::nullopt;

    std::optional<Timestamp> latest;
    if (meta.contains(kModified)) {
        latest = Latest(latest, meta[kModified]);
    }

    if (meta.contains(kChapters) && meta[kChapters].is_array()) {
        for (const auto& chapter : meta[kChapters]) {
            if (chapter.is_object() && chapter.contains(kModified)) {
                latest = Latest(latest, chapter[kModified]);
            }
        }
    }

    return latest;
}

std::optional<Timestamp> StoryDateMapper::operator()(std::optional<Story>& story) const {
    if (!story) return std::nullopt;
    return (*this)(*story);
}

std::string StoryPathMapper::operator()(const Story& story) const {
    return (std::filesystem::path(m_directory) / std::to_string(story.key())).string();
}

std::optional<MetaFormat> MetaFormatMapper::operator()(Story& story) const {
    if (auto existing = story.flavors().get<MetaFormat>()) {
        return existing;
    }

    static const char* const alphaKeys[] = {"likes", "dislikes", "words"};
    static const char* const betaKeys[] = {"num_likes", "num_dislikes", "num_words"};

    const auto& meta = story.meta();
    bool alpha = false;
    bool beta = false;

    for (const char* key : alphaKeys) alpha = alpha || meta.contains(key);
    for (const char* key : betaKeys) beta = beta || meta.contains(key);

    if (alpha && !beta) return MetaFormat::Alpha;
    if (beta && !alpha) return MetaFormat::Beta;
    return std::nullopt;
}

} // namespace storykeep::domain
