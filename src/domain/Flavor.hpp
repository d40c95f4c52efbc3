/**
 * @file Flavor.hpp
 * @brief Closed classification markers attached to stories.
 */

#pragma once

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <set>
#include <string>
#include <variant>

namespace storykeep::domain {

/** @brief Where a story was fetched from. */
enum class StorySource {
    Remote,
    Archive
};

/** @brief File format of the story data. */
enum class DataFormat {
    Epub,
    Fpub,
    Html,
    Json
};

/** @brief General structure of the story meta. */
enum class MetaFormat {
    Alpha,
    Beta
};

/** @brief Whether the story meta has been sanitized. */
enum class MetaPurity {
    Clean,
    Dirty
};

/** @brief If and how a story changed between two snapshots. */
enum class UpdateStatus {
    Created,
    Revived,
    Updated,
    Deleted
};

using Flavor = std::variant<StorySource, DataFormat, MetaFormat, MetaPurity, UpdateStatus>;

inline std::string DataFormatToString(DataFormat format) {
    switch (format) {
        case DataFormat::Epub: return "epub";
        case DataFormat::Fpub: return "fpub";
        case DataFormat::Html: return "html";
        case DataFormat::Json: return "json";
    }
    return "epub";
}

inline std::string UpdateStatusToString(UpdateStatus status) {
    switch (status) {
        case UpdateStatus::Created: return "Created";
        case UpdateStatus::Revived: return "Revived";
        case UpdateStatus::Updated: return "Updated";
        case UpdateStatus::Deleted: return "Deleted";
    }
    return "Unknown";
}

/**
 * @class FlavorSet
 * @brief Set of flavors holding at most one value per category.
 *
 * Adding a flavor replaces any other flavor of the same enum type.
 */
class FlavorSet {
public:
    FlavorSet() = default;
    FlavorSet(std::initializer_list<Flavor> flavors) {
        for (const auto& flavor : flavors) add(flavor);
    }

    void add(const Flavor& flavor) {
        for (auto it = m_flavors.begin(); it != m_flavors.end(); ++it) {
            if (it->index() == flavor.index()) {
                m_flavors.erase(it);
                break;
            }
        }
        m_flavors.insert(flavor);
    }

    void update(const FlavorSet& other) {
        for (const auto& flavor : other.m_flavors) add(flavor);
    }

    bool contains(const Flavor& flavor) const { return m_flavors.count(flavor) > 0; }

    /** @brief Returns the value held for the category @p T, if any. */
    template <typename T>
    std::optional<T> get() const {
        for (const auto& flavor : m_flavors) {
            if (const T* value = std::get_if<T>(&flavor)) return *value;
        }
        return std::nullopt;
    }

    std::size_t size() const { return m_flavors.size(); }
    bool empty() const { return m_flavors.empty(); }

    std::set<Flavor>::const_iterator begin() const { return m_flavors.begin(); }
    std::set<Flavor>::const_iterator end() const { return m_flavors.end(); }

    bool operator==(const FlavorSet& other) const { return m_flavors == other.m_flavors; }

private:
    std::set<Flavor> m_flavors;
};

} // namespace storykeep::domain
