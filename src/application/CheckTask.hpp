/**
 * @file CheckTask.hpp
 * @brief Integrity check of a release: the container, then every story package.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "infrastructure/ArchiveFetcher.hpp"

namespace storykeep::application {

/** @brief First problem found by CheckTask. */
struct CheckFailure {
    std::optional<std::int64_t> key; ///< Empty when the container itself is bad.
    std::string reason;

    /** @brief `Invalid CRC: Archive` or `Invalid CRC: <key>`. */
    std::string toString() const;
};

/**
 * @class CheckTask
 * @brief Tests every CRC of a release and stops at the first failure.
 */
class CheckTask {
public:
    explicit CheckTask(infrastructure::ArchiveFetcher& archive);

    /** @return The first failure, or nullopt if the release is intact. */
    std::optional<CheckFailure> run();

    /** @brief Stories checked by the last run. */
    std::size_t checked() const { return m_checked; }

private:
    infrastructure::ArchiveFetcher& m_archive;
    std::size_t m_checked = 0;
};

} // namespace storykeep::application
