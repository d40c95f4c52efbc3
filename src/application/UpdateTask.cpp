/**
 * @file UpdateTask.cpp
 * @brief Implementation of UpdateTask.
 */

#include "application/UpdateTask.hpp"
#include "domain/Errors.hpp"
#include <filesystem>
#include <iostream>
#include <thread>
#include <utility>

namespace storykeep::application {

namespace fs = std::filesystem;
using domain::DataFormat;
using domain::InvalidStoryError;
using domain::InvariantViolation;
using domain::Story;
using domain::StoryPathMapper;

UpdateTask::UpdateTask(domain::Fetcher& archive,
                       domain::Fetcher& remote,
                       std::string workdir,
                       UpdatePolicy policy,
                       std::unique_ptr<domain::Selector> selector,
                       std::unique_ptr<domain::Stamper> stamper)
    : m_archive(archive),
      m_remote(remote),
      m_workdir(std::move(workdir)),
      m_policy(policy),
      m_selector(std::move(selector)),
      m_stamper(std::move(stamper)),
      m_observer(&m_nullObserver),
      m_sleep([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); }) {
    if (!m_selector) m_selector = std::make_unique<domain::UpdateSelector>();
    if (!m_stamper) m_stamper = std::make_unique<domain::UpdateStamper>();

    std::error_code ec;
    fs::create_directories(m_workdir, ec);
    if (ec) {
        throw domain::StorySourceError("Could not create working directory " + m_workdir + ": " + ec.message());
    }

    m_state = std::make_unique<infrastructure::PersistedState>(
        (fs::path(m_workdir) / kStateFile).string(), nlohmann::json{{"key", 0}});
    if (!(*m_state)["key"].is_number_integer()) {
        throw domain::StorySourceError("Cursor in " + m_state->path() + " is not an integer.");
    }

    StoryPathMapper meta(subdir("meta"));
    StoryPathMapper skip(subdir("skip"));

    // A key is redone after an interrupted run, so its files may already exist.
    const bool overwrite = true;
    m_metaWriter = std::make_unique<infrastructure::DirectoryWriter>(meta, nullptr, overwrite);
    m_skipWriter = std::make_unique<infrastructure::DirectoryWriter>(skip, nullptr, overwrite);
    m_epubWriter = std::make_unique<infrastructure::DirectoryWriter>(meta, StoryPathMapper(subdir("epub")), overwrite);
    m_htmlWriter = std::make_unique<infrastructure::DirectoryWriter>(meta, StoryPathMapper(subdir("html")), overwrite);
    m_jsonWriter = std::make_unique<infrastructure::DirectoryWriter>(meta, StoryPathMapper(subdir("json")), overwrite);
}

std::string UpdateTask::subdir(const char* name) const {
    return (fs::path(m_workdir) / name).string();
}

void UpdateTask::setObserver(UpdateObserver* observer) {
    m_observer = observer ? observer : &m_nullObserver;
}

void UpdateTask::setSleeper(Sleeper sleeper) {
    m_sleep = std::move(sleeper);
}

std::int64_t UpdateTask::cursor() const {
    return m_state->data().at("key").get<std::int64_t>();
}

std::optional<Story> UpdateTask::fetch(domain::Fetcher& fetcher, std::int64_t key) {
    try {
        return fetcher.fetch(key);
    } catch (const InvalidStoryError&) {
        return std::nullopt;
    }
}

void UpdateTask::write(Story& story) {
    const auto& flavors = story.flavors();

    if (flavors.contains(domain::StorySource::Archive)) {
        m_metaWriter->write(story);
    } else if (flavors.contains(DataFormat::Html)) {
        m_htmlWriter->write(story);
    } else if (flavors.contains(DataFormat::Json)) {
        m_jsonWriter->write(story);
    } else if (flavors.contains(DataFormat::Epub)) {
        m_epubWriter->write(story);
    } else {
        throw InvariantViolation("Unsupported story flavor for story " + std::to_string(story.key()) + ".");
    }
}

void UpdateTask::copyArchiveMeta(std::optional<Story>& old, std::optional<Story>& fresh) {
    if (!old || !fresh) return;

    nlohmann::json meta;
    try {
        meta = fresh->meta();
        if (meta.contains("archive")) {
            throw InvariantViolation("New story " + std::to_string(fresh->key()) + " contains archive meta.");
        }

        const nlohmann::json& oldMeta = old->meta();
        auto archive = oldMeta.find("archive");
        if (archive == oldMeta.end()) return;
        meta["archive"] = *archive;
    } catch (const InvalidStoryError&) {
        return;
    }

    fresh = fresh->withMeta(std::move(meta));
}

std::optional<Story> UpdateTask::update(std::int64_t key) {
    std::optional<Story> old = fetch(m_archive, key);
    std::optional<Story> fresh = fetch(m_remote, key);

    copyArchiveMeta(old, fresh);
    std::optional<Story> selected = m_selector->select(old, fresh);

    // Revived keeps the stored payload but takes the remote meta.
    if (selected && selected->flavors().contains(domain::UpdateStatus::Revived)) {
        if (!fresh) {
            throw InvariantViolation("Revived story " + std::to_string(key) + " has no new story.");
        }
        selected = selected->withMeta(fresh->meta());
    }

    if (selected) {
        m_stamper->stamp(*selected);
        write(*selected);
    } else if (fresh) {
        m_skipWriter->write(*fresh);
    } else if (old) {
        m_skipWriter->write(*old);
    }

    return selected;
}

void UpdateTask::run() {
    int retried = 0;
    int skipped = 0;

    while (skipped < m_policy.maxSkips && retried < m_policy.maxRetries) {
        const std::int64_t key = cursor();
        m_observer->onAttempt(key, skipped, retried);

        std::optional<Story> story;
        try {
            story = update(key);
        } catch (const InvariantViolation& e) {
            m_observer->onFailure(key, e);
            throw;
        } catch (const std::exception& e) {
            ++retried;
            m_observer->onFailure(key, e);
            m_sleep(m_policy.failureDelay);
            continue;
        }

        retried = 0;
        (*m_state)["key"] = key + 1;
        m_state->save();

        if (story) {
            skipped = 0;
            m_observer->onSuccess(key, *story);
            m_sleep(m_policy.successDelay);
        } else {
            ++skipped;
            m_observer->onSkipped(key);
            m_sleep(m_policy.skippedDelay);
        }
    }

    std::cerr << "[UpdateTask] Stopped at key " << cursor() << " after " << skipped << " skips and "
              << retried << " retries" << std::endl;
}

} // namespace storykeep::application
