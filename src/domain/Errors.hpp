/**
 * @file Errors.hpp
 * @brief Exception types shared by fetchers, selectors and tasks.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace storykeep::domain {

/** @brief Base class for all storykeep errors. */
class StorykeepError : public std::runtime_error {
public:
    explicit StorykeepError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief The requested story does not exist at this source.
 *
 * Expected during iteration and diffing; callers usually map it to an
 * absent story.
 */
class InvalidStoryError : public StorykeepError {
public:
    explicit InvalidStoryError(const std::string& message = "Story does not exist.")
        : StorykeepError(message) {}
};

/** @brief The source cannot be used (I/O failure, corrupt archive, bad schema). */
class StorySourceError : public StorykeepError {
public:
    explicit StorySourceError(const std::string& message) : StorykeepError(message) {}
};

/** @brief A logic error that retrying cannot fix. */
class InvariantViolation : public StorykeepError {
public:
    explicit InvariantViolation(const std::string& message) : StorykeepError(message) {}
};

} // namespace storykeep::domain
