/**
 * @file Selector.cpp
 * @brief Implementation of UpdateSelector and RefetchSelector.
 */

#include "domain/Selector.hpp"
#include "domain/Errors.hpp"
#include <stdexcept>
#include <utility>

namespace storykeep::domain {

UpdateSelector::UpdateSelector(DateMapper dateMapper) : m_dateMapper(std::move(dateMapper)) {}

std::optional<Story> UpdateSelector::filterEmpty(std::optional<Story> story) const {
    if (!story) return std::nullopt;

    try {
        const auto& meta = story->meta();
        if (meta.is_object() && meta.contains("chapters")) {
            const auto& chapters = meta["chapters"];
            if (chapters.is_array() && !chapters.empty()) {
                return story;
            }
        }
    } catch (const InvalidStoryError&) {
        return std::nullopt;
    }

    return std::nullopt;
}

std::optional<Story> UpdateSelector::filterInvalid(std::optional<Story> story) const {
    if (!story) return std::nullopt;

    try {
        story->meta();
        story->data();
    } catch (const InvalidStoryError&) {
        return std::nullopt;
    }

    return story;
}

std::optional<Story> UpdateSelector::filterUnchanged(Story& old, Story& fresh) const {
    auto oldDate = m_dateMapper(old);
    auto newDate = m_dateMapper(fresh);

    if (!oldDate) {
        throw std::invalid_argument("Missing old date.");
    }
    if (!newDate) {
        throw std::invalid_argument("Missing new date.");
    }

    if (*oldDate < *newDate) return fresh;
    return std::nullopt;
}

Story UpdateSelector::flavored(Story story, UpdateStatus status) {
    story.flavors().add(status);
    return story;
}

std::optional<Story> UpdateSelector::select(std::optional<Story> old, std::optional<Story> fresh) {
    old = filterEmpty(std::move(old));
    fresh = filterEmpty(std::move(fresh));
    bool deleted = old && !fresh;

    if (old) {
        old = filterInvalid(std::move(old));
    }

    if (old && fresh) {
        fresh = filterUnchanged(*old, *fresh);
    }

    if (fresh) {
        fresh = filterInvalid(std::move(fresh));
        deleted = old && !fresh;
    }

    if (!old && fresh) return flavored(std::move(*fresh), UpdateStatus::Created);
    if (old && !fresh && !deleted) return flavored(std::move(*old), UpdateStatus::Revived);
    if (old && fresh) return flavored(std::move(*fresh), UpdateStatus::Updated);
    if (old && !fresh && deleted) return flavored(std::move(*old), UpdateStatus::Deleted);
    return std::nullopt;
}

std::optional<Story> RefetchSelector::filterUnchanged(Story& old, Story& fresh) const {
    (void)old;
    return fresh;
}

} // namespace storykeep::domain
