/**
 * @file StorykeepApp.hpp
 * @brief Command-line front end: update, build, count and check.
 */

#pragma once

#include <map>
#include <string>
#include <vector>
#include "infrastructure/ArchiveFetcher.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace storykeep::app {

/**
 * @class StorykeepApp
 * @brief Parses arguments, loads settings and runs the requested task.
 */
class StorykeepApp {
public:
    /**
     * @brief Runs a command.
     * @return Exit code (0 for success, 1 for failures, 2 for usage errors).
     */
    int Run(int argc, char** argv);

    /** @brief Parses `--flag value` pairs. Returns false on a dangling or unknown flag. */
    static bool ParseOptions(const std::vector<std::string>& args,
                             const std::vector<std::string>& known,
                             std::map<std::string, std::string>& options);

    static void PrintUsage();

private:
    int RunUpdate(const std::map<std::string, std::string>& options);
    int RunBuild(const std::map<std::string, std::string>& options);
    int RunCount(const std::map<std::string, std::string>& options);
    int RunCheck(const std::map<std::string, std::string>& options);

    void loadConfig(const std::map<std::string, std::string>& options);
    infrastructure::ArchiveFetcherOptions indexOptions() const;

    infrastructure::AppConfig m_config;
};

} // namespace storykeep::app
