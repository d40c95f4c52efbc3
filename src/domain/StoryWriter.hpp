/**
 * @file StoryWriter.hpp
 * @brief Interface for sinks that persist stories.
 */

#pragma once

#include "Story.hpp"

namespace storykeep::domain {

/**
 * @class StoryWriter
 * @brief Abstract sink for finalized stories.
 */
class StoryWriter {
public:
    virtual ~StoryWriter() = default;

    /**
     * @brief Saves the story somewhere.
     * @throws InvariantViolation If the write would break a storage invariant.
     * @throws StorySourceError If the underlying storage fails.
     */
    virtual void write(Story& story) = 0;
};

} // namespace storykeep::domain
