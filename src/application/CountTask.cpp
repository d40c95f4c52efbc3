/**
 * @file CountTask.cpp
 * @brief Implementation of CountTask.
 */

#include "application/CountTask.hpp"
#include "domain/Errors.hpp"
#include <set>
#include <sstream>
#include <utility>

namespace storykeep::application {

using domain::InvalidStoryError;
using domain::InvariantViolation;
using domain::Story;

namespace {

void CheckId(Story& story) {
    const nlohmann::json& meta = story.meta();
    auto id = meta.find("id");
    if (id == meta.end() || !id->is_number_integer() || id->get<std::int64_t>() != story.key()) {
        throw InvariantViolation("Story " + std::to_string(story.key()) + " has a mismatching id.");
    }
}

} // namespace

std::string CountReport::toString() const {
    std::ostringstream out;
    out << "Previous: " << previous << "\n"
        << "Upcoming: " << upcoming << "\n"
        << "Created: " << created << "\n"
        << "Revived: " << revived << "\n"
        << "Updated: " << updated << "\n"
        << "Deleted: " << deleted << "\n"
        << "Blocked: " << blocked << "\n"
        << "Uniform: " << uniform;
    return out.str();
}

CountTask::CountTask(infrastructure::ArchiveFetcher& previous,
                     infrastructure::DirectoryFetcher& upcoming,
                     Blacklist blacklist)
    : m_previous(previous), m_upcoming(upcoming), m_blacklist(std::move(blacklist)) {}

CountReport CountTask::run() {
    CountReport report;
    std::vector<std::int64_t> keys = m_previous.keys();
    std::set<std::int64_t> previous(keys.begin(), keys.end());
    std::set<std::int64_t> upcoming;

    m_upcoming.forEach([&](Story& fresh) {
        const std::int64_t key = fresh.key();
        CheckId(fresh);

        if (m_blacklist.contains(fresh)) {
            ++report.blocked;
            return;
        }

        upcoming.insert(key);

        if (!previous.count(key)) {
            ++report.created;
            return;
        }

        try {
            fresh.data();
        } catch (const InvalidStoryError&) {
            ++report.revived;
            return;
        }

        Story old = m_previous.fetch(key);
        CheckId(old);

        if (old.data() != fresh.data()) {
            ++report.updated;
        } else {
            ++report.uniform;
        }
    });

    report.previous = previous.size();
    report.upcoming = upcoming.size();
    for (std::int64_t key : previous) {
        if (!upcoming.count(key)) ++report.deleted;
    }
    return report;
}

} // namespace storykeep::application
