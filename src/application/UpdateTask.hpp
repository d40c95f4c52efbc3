/**
 * @file UpdateTask.hpp
 * @brief Crawl loop keeping a working tree in sync with a remote source.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "application/UpdateObserver.hpp"
#include "domain/Fetcher.hpp"
#include "domain/Selector.hpp"
#include "domain/Stamper.hpp"
#include "infrastructure/DirectoryWriter.hpp"
#include "infrastructure/PersistedState.hpp"

namespace storykeep::application {

/**
 * @struct UpdatePolicy
 * @brief Pacing and give-up limits for UpdateTask.
 *
 * Lowering the delays floods the remote with requests. The defaults keep a
 * single synchronous client polite.
 */
struct UpdatePolicy {
    std::chrono::milliseconds successDelay{5000};
    std::chrono::milliseconds skippedDelay{2000};
    std::chrono::milliseconds failureDelay{300000};
    int maxRetries = 10;
    int maxSkips = 500;
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

/**
 * @class UpdateTask
 * @brief Walks keys from a persisted cursor, diffing archive against remote.
 *
 * Each key is fetched from both sources, the selector decides what to keep,
 * and the result is stamped and written below the working directory:
 * `meta/`, `skip/`, `epub/`, `html/` and `json/`, plus the `state.json`
 * cursor. The loop stops after maxSkips consecutive skips or maxRetries
 * consecutive failures. InvariantViolation stops it immediately.
 */
class UpdateTask {
public:
    static constexpr const char* kDefaultWorkdir = "worktree/update";
    static constexpr const char* kStateFile = "state.json";

    /**
     * @param archive Fetcher for the old release. Not owned.
     * @param remote Fetcher for the new release. Not owned.
     * @param workdir Directory for the cursor and written stories.
     * @param policy Delays and limits.
     * @param selector Defaults to UpdateSelector.
     * @param stamper Defaults to UpdateStamper.
     * @throws StorySourceError If the cursor file is unreadable.
     */
    UpdateTask(domain::Fetcher& archive,
               domain::Fetcher& remote,
               std::string workdir = kDefaultWorkdir,
               UpdatePolicy policy = {},
               std::unique_ptr<domain::Selector> selector = nullptr,
               std::unique_ptr<domain::Stamper> stamper = nullptr);

    /** @brief Sets the event receiver. Not owned; nullptr restores the silent default. */
    void setObserver(UpdateObserver* observer);

    /** @brief Replaces the rate-limit sleep, mainly for tests. */
    void setSleeper(Sleeper sleeper);

    /** @brief Runs until the skip or retry budget is exhausted. */
    void run();

    /**
     * @brief Processes a single key without touching the cursor.
     * @return The selected story, or nullopt if the key was skipped.
     */
    std::optional<domain::Story> update(std::int64_t key);

    /** @brief Fetches a story, mapping InvalidStoryError to nullopt. */
    std::optional<domain::Story> fetch(domain::Fetcher& fetcher, std::int64_t key);

    /**
     * @brief Copies the `archive` object from old meta into new meta.
     * @throws InvariantViolation If the new meta already has one.
     */
    void copyArchiveMeta(std::optional<domain::Story>& old, std::optional<domain::Story>& fresh);

    /**
     * @brief Routes the story to the sink matching its flavors.
     * @throws InvariantViolation If no sink accepts the story.
     */
    void write(domain::Story& story);

    /** @brief The next key to process. */
    std::int64_t cursor() const;

    const std::string& workdir() const { return m_workdir; }

private:
    std::string subdir(const char* name) const;

    domain::Fetcher& m_archive;
    domain::Fetcher& m_remote;
    std::string m_workdir;
    UpdatePolicy m_policy;
    std::unique_ptr<domain::Selector> m_selector;
    std::unique_ptr<domain::Stamper> m_stamper;
    std::unique_ptr<infrastructure::PersistedState> m_state;

    std::unique_ptr<infrastructure::DirectoryWriter> m_metaWriter;
    std::unique_ptr<infrastructure::DirectoryWriter> m_skipWriter;
    std::unique_ptr<infrastructure::DirectoryWriter> m_epubWriter;
    std::unique_ptr<infrastructure::DirectoryWriter> m_htmlWriter;
    std::unique_ptr<infrastructure::DirectoryWriter> m_jsonWriter;

    NullUpdateObserver m_nullObserver;
    UpdateObserver* m_observer;
    Sleeper m_sleep;
};

} // namespace storykeep::application
