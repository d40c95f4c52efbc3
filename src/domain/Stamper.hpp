/**
 * @file Stamper.hpp
 * @brief Adds archive bookkeeping fields to story meta.
 */

#pragma once

#include <functional>
#include <nlohmann/json.hpp>
#include "Story.hpp"
#include "Timestamp.hpp"

namespace storykeep::domain {

/**
 * @class Stamper
 * @brief Applies archive-related information to stories.
 */
class Stamper {
public:
    virtual ~Stamper() = default;

    /** @brief Replaces the story meta with a stamped copy. */
    virtual void stamp(Story& story) = 0;

    /** @brief Returns the `archive` object of the meta, creating it if missing. */
    static nlohmann::json& archiveOf(nlohmann::json& meta);
};

/**
 * @class UpdateStamper
 * @brief Refreshes the archive dates implied by the story's UpdateStatus.
 *
 * `date_checked` is always set. Created sets created, fetched and updated;
 * Updated sets fetched and updated; Revived sets fetched; Deleted sets
 * nothing else. Missing fields are initialized to null.
 */
class UpdateStamper : public Stamper {
public:
    using Clock = std::function<Timestamp()>;

    explicit UpdateStamper(Clock clock = [] { return std::chrono::system_clock::now(); });

    void stamp(Story& story) override;

private:
    Clock m_clock;
};

} // namespace storykeep::domain
