/**
 * @file UpdateObserver.hpp
 * @brief Progress notifications emitted by UpdateTask.
 */

#pragma once

#include <cstdint>
#include <exception>
#include "domain/Story.hpp"

namespace storykeep::application {

/**
 * @class UpdateObserver
 * @brief Receives one call per crawl event.
 */
class UpdateObserver {
public:
    virtual ~UpdateObserver() = default;

    /** @brief A key is about to be processed. */
    virtual void onAttempt(std::int64_t key, int skipped, int retried) = 0;

    /** @brief A story was selected, stamped and written. */
    virtual void onSuccess(std::int64_t key, const domain::Story& story) = 0;

    /** @brief Nothing was selected for the key. */
    virtual void onSkipped(std::int64_t key) = 0;

    /** @brief The attempt failed and will be retried, unless the error is fatal. */
    virtual void onFailure(std::int64_t key, const std::exception& error) = 0;
};

/** @brief Observer that ignores every event. */
class NullUpdateObserver : public UpdateObserver {
public:
    void onAttempt(std::int64_t, int, int) override {}
    void onSuccess(std::int64_t, const domain::Story&) override {}
    void onSkipped(std::int64_t) override {}
    void onFailure(std::int64_t, const std::exception&) override {}
};

} // namespace storykeep::application
