/**
 * @file Stamper.cpp
 * @brief Implementation of UpdateStamper.
 */

#include "domain/Stamper.hpp"
#include <utility>

namespace storykeep::domain {

nlohmann::json& Stamper::archiveOf(nlohmann::json& meta) {
    if (!meta.contains("archive") || !meta["archive"].is_object()) {
        meta["archive"] = nlohmann::json::object();
    }
    return meta["archive"];
}

UpdateStamper::UpdateStamper(Clock clock) : m_clock(std::move(clock)) {}

void UpdateStamper::stamp(Story& story) {
    nlohmann::json meta = story.meta();
    nlohmann::json& archive = archiveOf(meta);
    const std::string now = FormatTimestamp(m_clock());

    for (const char* field : {"date_checked", "date_created", "date_fetched", "date_updated"}) {
        if (!archive.contains(field)) archive[field] = nullptr;
    }

    archive["date_checked"] = now;

    auto status = story.flavors().get<UpdateStatus>();
    if (status == UpdateStatus::Created) {
        archive["date_created"] = now;
    }
    if (status == UpdateStatus::Created || status == UpdateStatus::Updated || status == UpdateStatus::Revived) {
        archive["date_fetched"] = now;
    }
    if (status == UpdateStatus::Created || status == UpdateStatus::Updated) {
        archive["date_updated"] = now;
    }

    story = story.withMeta(std::move(meta));
}

} // namespace storykeep::domain
