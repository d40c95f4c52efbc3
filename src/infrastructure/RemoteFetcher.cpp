/**
 * @file RemoteFetcher.cpp
 * @brief Implementation of RemoteFetcher.
 */

#include "infrastructure/RemoteFetcher.hpp"
#include "domain/Errors.hpp"
#include <httplib.h>
#include <iostream>
#include <utility>

namespace storykeep::infrastructure {

using json = nlohmann::json;
using domain::InvalidStoryError;
using domain::StorySourceError;

namespace {
const char* const kChapterMarker = "<h1><a name='1'></a>";
const char* const kDocumentEnd = "</html>";
}

RemoteFetcher::RemoteFetcher(std::string baseUrl, int timeoutSeconds)
    : m_baseUrl(std::move(baseUrl)), m_timeoutSeconds(timeoutSeconds) {}

domain::FlavorSet RemoteFetcher::flavors() const {
    return {domain::StorySource::Remote, domain::DataFormat::Html,
            domain::MetaFormat::Alpha, domain::MetaPurity::Dirty};
}

std::string RemoteFetcher::MetaPath(std::int64_t key) {
    return "/api/story.php?story=" + std::to_string(key);
}

std::string RemoteFetcher::DataPath(std::int64_t key) {
    return "/story/download/" + std::to_string(key) + "/html";
}

std::string RemoteFetcher::get(const std::string& path) const {
    httplib::Client cli(m_baseUrl);
    cli.set_connection_timeout(m_timeoutSeconds);
    cli.set_read_timeout(m_timeoutSeconds);
    cli.set_follow_location(true);

    auto res = cli.Get(path.c_str());
    if (!res) {
        std::cerr << "[RemoteFetcher] Connection failed: " << static_cast<int>(res.error()) << std::endl;
        throw StorySourceError("Could not read from server.");
    }

    if (res->status == 403) {
        throw InvalidStoryError("Access to resource was denied.");
    }

    if (res->status < 200 || res->status >= 300) {
        throw StorySourceError("Server responded with HTTP " + std::to_string(res->status) + " " +
                               httplib::status_message(res->status) + ".");
    }

    return res->body;
}

json RemoteFetcher::fetchMeta(std::int64_t key) {
    std::string body = get(MetaPath(key));

    json meta;
    try {
        meta = json::parse(body);
    } catch (const json::parse_error& e) {
        std::cerr << "[RemoteFetcher] JSON Parse Error: " << e.what() << std::endl;
        throw StorySourceError("Server did not return valid JSON.");
    }

    if (!meta.is_object()) {
        throw StorySourceError("Server did not return a JSON object.");
    }

    if (meta.contains("error")) {
        const auto& error = meta["error"];
        std::string message = error.is_string() ? error.get<std::string>() : error.dump();
        if (message == "Invalid story id") {
            throw InvalidStoryError("Story does not exist.");
        }
        throw StorySourceError(message);
    }

    if (!meta.contains("story") || !meta["story"].is_object()) {
        throw StorySourceError("Server did not return a story object.");
    }

    return meta["story"];
}

std::string RemoteFetcher::fetchData(std::int64_t key) {
    std::string data = get(DataPath(key));

    if (data.empty()) {
        throw InvalidStoryError("Server returned empty response body.");
    }

    if (data.find(kChapterMarker) == std::string::npos) {
        throw InvalidStoryError("Server did not return any chapters.");
    }

    const std::string end = kDocumentEnd;
    if (data.size() < end.size() || data.compare(data.size() - end.size(), end.size(), end) != 0) {
        throw StorySourceError("Server returned incomplete response.");
    }

    return data;
}

} // namespace storykeep::infrastructure
