/**
 * @file PersistedState.hpp
 * @brief Small JSON document persisted with atomic writes.
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace storykeep::infrastructure {

/**
 * @class PersistedState
 * @brief JSON object stored in a single file, written via temp file and rename.
 *
 * A missing file is not an error; the defaults are used instead. Keys in the
 * defaults that the file lacks are filled in on load.
 */
class PersistedState {
public:
    /**
     * @param path Location of the state file.
     * @param defaults Initial values for missing entries.
     * @throws StorySourceError If an existing file cannot be parsed.
     */
    explicit PersistedState(std::string path, nlohmann::json defaults = nlohmann::json::object());

    /** @brief Reloads the file from disk. @throws StorySourceError */
    void load();

    /** @brief Writes the current values atomically. @throws StorySourceError */
    void save() const;

    nlohmann::json& operator[](const std::string& name) { return m_data[name]; }
    const nlohmann::json& data() const { return m_data; }
    const std::string& path() const { return m_path; }

private:
    /**
     * @brief Performs the actual atomic write (temp -> rename).
     */
    void performAtomicWrite(const std::string& content) const;

    std::string m_path;
    nlohmann::json m_defaults;
    nlohmann::json m_data;
};

} // namespace storykeep::infrastructure
