/**
 * @file CountTask.hpp
 * @brief Summarizes how an upcoming release differs from the previous one.
 */

#pragma once

#include <cstddef>
#include <string>
#include "application/BuildTask.hpp"
#include "infrastructure/ArchiveFetcher.hpp"
#include "infrastructure/DirectoryFetcher.hpp"

namespace storykeep::application {

struct CountReport {
    std::size_t previous = 0;
    std::size_t upcoming = 0;
    std::size_t created = 0;
    std::size_t revived = 0;
    std::size_t updated = 0;
    std::size_t deleted = 0;
    std::size_t blocked = 0;
    std::size_t uniform = 0;

    /** @brief One `Label: count` line per field. */
    std::string toString() const;
};

/**
 * @class CountTask
 * @brief Classifies every upcoming story against the previous release.
 *
 * Upcoming stories without data count as revived, stories with identical
 * payloads as uniform.
 */
class CountTask {
public:
    CountTask(infrastructure::ArchiveFetcher& previous,
              infrastructure::DirectoryFetcher& upcoming,
              Blacklist blacklist = {});

    /** @throws InvariantViolation If a story id does not match its key. */
    CountReport run();

private:
    infrastructure::ArchiveFetcher& m_previous;
    infrastructure::DirectoryFetcher& m_upcoming;
    Blacklist m_blacklist;
};

} // namespace storykeep::application
