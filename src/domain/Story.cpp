/**
 * @file Story.cpp
 * @brief Implementation of Story.
 */

#include "domain/Story.hpp"
#include "domain/Fetcher.hpp"
#include <stdexcept>
#include <utility>

namespace storykeep::domain {

Story::Story(std::int64_t key,
             Fetcher* fetcher,
             std::optional<nlohmann::json> meta,
             std::optional<std::string> data,
             FlavorSet flavors)
    : m_key(key), m_fetcher(fetcher), m_flavors(std::move(flavors)) {
    if (fetcher == nullptr && (!meta || !data)) {
        throw std::invalid_argument("Story must contain fetcher if lazy.");
    }
    if (meta) m_meta = std::make_shared<const nlohmann::json>(std::move(*meta));
    if (data) m_data = std::make_shared<const std::string>(std::move(*data));
}

Story::Story(std::int64_t key,
             Fetcher* fetcher,
             std::shared_ptr<const nlohmann::json> meta,
             std::shared_ptr<const std::string> data,
             FlavorSet flavors)
    : m_key(key),
      m_fetcher(fetcher),
      m_meta(std::move(meta)),
      m_data(std::move(data)),
      m_flavors(std::move(flavors)) {
    if (m_fetcher == nullptr && (!m_meta || !m_data)) {
        throw std::invalid_argument("Story must contain fetcher if lazy.");
    }
}

const nlohmann::json& Story::meta() {
    if (!m_meta) {
        m_meta = std::make_shared<const nlohmann::json>(m_fetcher->fetchMeta(m_key));
    }
    return *m_meta;
}

const std::string& Story::data() {
    if (!m_data) {
        m_data = std::make_shared<const std::string>(m_fetcher->fetchData(m_key));
    }
    return *m_data;
}

Story Story::merge(const StoryOverrides& overrides) const {
    auto meta = m_meta;
    auto data = m_data;

    if (overrides.meta) meta = std::make_shared<const nlohmann::json>(*overrides.meta);
    if (overrides.data) data = std::make_shared<const std::string>(*overrides.data);

    return Story(m_key, m_fetcher, std::move(meta), std::move(data),
                 overrides.flavors ? *overrides.flavors : m_flavors);
}

Story Story::withMeta(nlohmann::json meta) const {
    StoryOverrides overrides;
    overrides.meta = std::move(meta);
    return merge(overrides);
}

Story Story::withData(std::string data) const {
    StoryOverrides overrides;
    overrides.data = std::move(data);
    return merge(overrides);
}

} // namespace storykeep::domain
