/**
 * @file Fetcher.cpp
 * @brief Default fetch implementation for Fetcher.
 */

#include "domain/Fetcher.hpp"
#include <utility>

namespace storykeep::domain {

Story Fetcher::fetch(std::int64_t key, std::optional<bool> prefetchMeta, std::optional<bool> prefetchData) {
    std::optional<nlohmann::json> meta;
    std::optional<std::string> data;

    if (prefetchMeta.value_or(this->prefetchMeta())) {
        meta = fetchMeta(key);
    }

    if (prefetchData.value_or(this->prefetchData())) {
        data = fetchData(key);
    }

    return Story(key, this, std::move(meta), std::move(data), flavors());
}

} // namespace storykeep::domain
