/**
 * @file UpdatePrinter.cpp
 * @brief Implementation of UpdatePrinter.
 */

#include "app/UpdatePrinter.hpp"
#include <cmath>
#include <ostream>
#include <sstream>

namespace storykeep::app {

namespace {

std::string Show(const nlohmann::json& meta, const char* key) {
    auto it = meta.find(key);
    if (it == meta.end() || it->is_null()) return "None";
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

std::string Approval(const nlohmann::json& meta) {
    auto likes = meta.find("likes");
    auto dislikes = meta.find("dislikes");
    if (likes == meta.end() || dislikes == meta.end() ||
        !likes->is_number() || !dislikes->is_number()) {
        return "None";
    }

    double up = likes->get<double>();
    double total = up + dislikes->get<double>();
    if (total == 0) return "0%";
    return std::to_string(static_cast<long long>(std::lround(100.0 * up / total))) + "%";
}

} // namespace

UpdatePrinter::UpdatePrinter(std::ostream& out) : m_out(out) {}

std::string UpdatePrinter::FormatStory(domain::Story story) {
    static const nlohmann::json kEmpty = nlohmann::json::object();
    const nlohmann::json& meta = story.hasMeta() ? story.meta() : kEmpty;

    std::string author = "None";
    auto it = meta.find("author");
    if (it != meta.end() && it->is_object()) author = Show(*it, "name");

    std::string chapters = "None";
    auto ch = meta.find("chapters");
    if (ch != meta.end() && ch->is_array()) chapters = std::to_string(ch->size());

    std::string action = "None";
    if (auto status = story.flavors().get<domain::UpdateStatus>()) {
        action = domain::UpdateStatusToString(*status);
    }

    std::ostringstream out;
    out << "Title: " << Show(meta, "title") << "\n"
        << "Author: " << author << "\n"
        << "Status: " << Show(meta, "status") << "\n"
        << "Words: " << Show(meta, "words") << "\n"
        << "Likes: " << Show(meta, "likes") << "\n"
        << "Dislikes: " << Show(meta, "dislikes") << "\n"
        << "Approval: " << Approval(meta) << "\n"
        << "Chapters: " << chapters << "\n"
        << "Action: " << action;
    return out.str();
}

void UpdatePrinter::onAttempt(std::int64_t key, int skipped, int retried) {
    m_out << "\nStory: " << key << "\n";
    if (retried) {
        m_out << "Retries: " << retried << std::endl;
    } else {
        m_out << "Skips: " << skipped << std::endl;
    }
}

void UpdatePrinter::onSuccess(std::int64_t, const domain::Story& story) {
    m_out << FormatStory(story) << std::endl;
}

void UpdatePrinter::onSkipped(std::int64_t) {
    m_out << "Status: Missing" << std::endl;
}

void UpdatePrinter::onFailure(std::int64_t, const std::exception& error) {
    m_out << "Error: " << error.what() << std::endl;
}

} // namespace storykeep::app
