/**
 * @file UpdatePrinter.hpp
 * @brief Console observer for UpdateTask progress.
 */

#pragma once

#include <iosfwd>
#include <string>
#include "application/UpdateObserver.hpp"

namespace storykeep::app {

/**
 * @class UpdatePrinter
 * @brief Prints one block per attempt: key, counters and story summary.
 */
class UpdatePrinter : public application::UpdateObserver {
public:
    explicit UpdatePrinter(std::ostream& out);

    void onAttempt(std::int64_t key, int skipped, int retried) override;
    void onSuccess(std::int64_t key, const domain::Story& story) override;
    void onSkipped(std::int64_t key) override;
    void onFailure(std::int64_t key, const std::exception& error) override;

    /**
     * @brief Renders title, author, status, counts, approval, chapters and action.
     *
     * Missing fields are shown as "None".
     */
    static std::string FormatStory(domain::Story story);

private:
    std::ostream& m_out;
};

} // namespace storykeep::app
