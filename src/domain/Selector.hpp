/**
 * @file Selector.hpp
 * @brief Decides how a stored story evolves given a freshly fetched one.
 */

#pragma once

#include <optional>
#include "Story.hpp"
#include "StoryMappers.hpp"

namespace storykeep::domain {

/**
 * @class Selector
 * @brief Picks one of two supplied stories, or neither.
 */
class Selector {
public:
    virtual ~Selector() = default;

    /**
     * @param old The currently stored story, if any.
     * @param fresh The potential replacement story, if any.
     * @return One of the two stories, or nullopt.
     */
    virtual std::optional<Story> select(std::optional<Story> old, std::optional<Story> fresh) = 0;
};

/**
 * @class UpdateSelector
 * @brief Selects the new story if it needs to be updated.
 *
 * Every returned story carries an UpdateStatus flavor and is fully
 * fetched. Data is never fetched from a new story unless it changed.
 *
 * | old     | new after filters               | result        |
 * |---------|---------------------------------|---------------|
 * | absent  | present                         | new, Created  |
 * | present | dropped as unchanged            | old, Revived  |
 * | present | present                         | new, Updated  |
 * | present | absent or invalid               | old, Deleted  |
 * | absent  | absent                          | nullopt       |
 */
class UpdateSelector : public Selector {
public:
    explicit UpdateSelector(DateMapper dateMapper = StoryDateMapper());

    std::optional<Story> select(std::optional<Story> old, std::optional<Story> fresh) override;

    /** @brief Returns the story if it has chapters, otherwise nullopt. */
    std::optional<Story> filterEmpty(std::optional<Story> story) const;

    /** @brief Returns the story if both meta and data can be fetched. */
    std::optional<Story> filterInvalid(std::optional<Story> story) const;

    /**
     * @brief Returns the new story if it is strictly newer than the old one.
     * @throws std::invalid_argument If either date is missing.
     */
    virtual std::optional<Story> filterUnchanged(Story& old, Story& fresh) const;

    /** @brief Adds the flavor to the story and returns it. */
    static Story flavored(Story story, UpdateStatus status);

protected:
    DateMapper m_dateMapper;
};

/**
 * @class RefetchSelector
 * @brief Selects the new story whenever it is available.
 */
class RefetchSelector : public UpdateSelector {
public:
    using UpdateSelector::UpdateSelector;

    std::optional<Story> filterUnchanged(Story& old, Story& fresh) const override;
};

} // namespace storykeep::domain
