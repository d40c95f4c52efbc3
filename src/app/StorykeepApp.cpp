/**
 * @file StorykeepApp.cpp
 * @brief Implementation of StorykeepApp.
 */

#include "app/StorykeepApp.hpp"
#include "app/UpdatePrinter.hpp"
#include "application/BuildTask.hpp"
#include "application/CheckTask.hpp"
#include "application/CountTask.hpp"
#include "application/UpdateTask.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/DirectoryFetcher.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/RemoteFetcher.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <optional>

namespace storykeep::app {

namespace {

std::string Option(const std::map<std::string, std::string>& options,
                   const std::string& name,
                   const std::string& fallback = {}) {
    auto it = options.find(name);
    return it == options.end() ? fallback : it->second;
}

std::chrono::milliseconds Seconds(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

application::Blacklist ToBlacklist(const infrastructure::BlacklistConfig& config) {
    return application::Blacklist{config.authors, config.stories};
}

} // namespace

void StorykeepApp::PrintUsage() {
    std::cerr << "Usage:\n"
              << "  storykeep update --archive PATH [--workdir DIR] [--config FILE]\n"
              << "  storykeep build --archive PATH [--output DIR] [--meta DIR] [--data DIR] [--extras DIR] [--config FILE]\n"
              << "  storykeep count --archive PATH [--meta DIR] [--data DIR] [--config FILE]\n"
              << "  storykeep check --archive PATH [--config FILE]\n";
}

bool StorykeepApp::ParseOptions(const std::vector<std::string>& args,
                                const std::vector<std::string>& known,
                                std::map<std::string, std::string>& options) {
    for (std::size_t i = 0; i < args.size(); i += 2) {
        const std::string& flag = args[i];
        if (std::find(known.begin(), known.end(), flag) == known.end()) {
            std::cerr << "[storykeep] Unknown option: " << flag << std::endl;
            return false;
        }
        if (i + 1 >= args.size()) {
            std::cerr << "[storykeep] Missing value for " << flag << std::endl;
            return false;
        }
        options[flag] = args[i + 1];
    }
    return true;
}

void StorykeepApp::loadConfig(const std::map<std::string, std::string>& options) {
    std::string path = Option(options, "--config", infrastructure::PathUtils::GetDefaultConfigFile().string());
    m_config = infrastructure::ConfigLoader::Load(path);
}

infrastructure::ArchiveFetcherOptions StorykeepApp::indexOptions() const {
    infrastructure::ArchiveFetcherOptions options;
    if (auto kind = infrastructure::ParseIndexBackendKind(m_config.index.backend)) {
        options.backend = *kind;
    } else {
        std::cerr << "[storykeep] Unknown index backend '" << m_config.index.backend << "', using auto" << std::endl;
    }
    options.workers = m_config.index.workers;
    options.sqliteThresholdBytes = m_config.index.sqliteThresholdBytes;
    options.verifyPayloads = m_config.index.verifyPayloads;
    return options;
}

int StorykeepApp::Run(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 2;
    }

    const std::string command = argv[1];
    std::vector<std::string> args(argv + 2, argv + argc);
    std::map<std::string, std::string> options;

    try {
        if (command == "update") {
            if (!ParseOptions(args, {"--archive", "--workdir", "--config"}, options)) return 2;
            return RunUpdate(options);
        }
        if (command == "build") {
            if (!ParseOptions(args, {"--archive", "--output", "--meta", "--data", "--extras", "--config"}, options)) return 2;
            return RunBuild(options);
        }
        if (command == "count") {
            if (!ParseOptions(args, {"--archive", "--meta", "--data", "--config"}, options)) return 2;
            return RunCount(options);
        }
        if (command == "check") {
            if (!ParseOptions(args, {"--archive", "--config"}, options)) return 2;
            return RunCheck(options);
        }
    } catch (const domain::StorykeepError& e) {
        std::cerr << "[storykeep] " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[storykeep] Unexpected error: " << e.what() << std::endl;
        return 1;
    }

    PrintUsage();
    return 2;
}

int StorykeepApp::RunUpdate(const std::map<std::string, std::string>& options) {
    if (!options.count("--archive")) {
        PrintUsage();
        return 2;
    }
    loadConfig(options);

    infrastructure::ArchiveFetcher archive(Option(options, "--archive"), indexOptions());
    infrastructure::RemoteFetcher remote(m_config.remote.baseUrl, m_config.remote.timeoutSeconds);

    application::UpdatePolicy policy;
    policy.successDelay = Seconds(m_config.update.successDelay);
    policy.skippedDelay = Seconds(m_config.update.skippedDelay);
    policy.failureDelay = Seconds(m_config.update.failureDelay);
    policy.maxRetries = m_config.update.maxRetries;
    policy.maxSkips = m_config.update.maxSkips;

    application::UpdateTask task(archive, remote, Option(options, "--workdir", m_config.workdir), policy);
    UpdatePrinter printer(std::cout);
    task.setObserver(&printer);
    task.run();

    archive.close();
    return 0;
}

int StorykeepApp::RunBuild(const std::map<std::string, std::string>& options) {
    if (!options.count("--archive")) {
        PrintUsage();
        return 2;
    }
    loadConfig(options);

    infrastructure::ArchiveFetcher previous(Option(options, "--archive"), indexOptions());
    infrastructure::DirectoryFetcher upcoming(Option(options, "--meta", "worktree/update/meta"),
                                              Option(options, "--data", "worktree/render/epub"),
                                              {domain::DataFormat::Epub});

    application::BuildTask task(
        Option(options, "--output", "worktree/build"),
        [&upcoming](const application::StoryVisitor& visit) { upcoming.forEach(visit); },
        &previous,
        Option(options, "--extras"),
        ToBlacklist(m_config.blacklist));

    std::size_t count = task.run();
    std::cout << "Wrote " << count << " stories to " << task.archivePath() << std::endl;

    previous.close();
    return 0;
}

int StorykeepApp::RunCount(const std::map<std::string, std::string>& options) {
    if (!options.count("--archive")) {
        PrintUsage();
        return 2;
    }
    loadConfig(options);

    infrastructure::ArchiveFetcher previous(Option(options, "--archive"), indexOptions());
    infrastructure::DirectoryFetcher upcoming(Option(options, "--meta", "worktree/update/meta"),
                                              Option(options, "--data", "worktree/render/epub"));

    application::CountTask task(previous, upcoming, ToBlacklist(m_config.blacklist));
    std::cout << task.run().toString() << std::endl;

    previous.close();
    return 0;
}

int StorykeepApp::RunCheck(const std::map<std::string, std::string>& options) {
    if (!options.count("--archive")) {
        PrintUsage();
        return 2;
    }
    loadConfig(options);

    // CheckTask tests the packages itself.
    infrastructure::ArchiveFetcherOptions fetcherOptions = indexOptions();
    fetcherOptions.verifyPayloads = false;
    infrastructure::ArchiveFetcher archive(Option(options, "--archive"), fetcherOptions);

    application::CheckTask task(archive);
    std::optional<application::CheckFailure> failure = task.run();
    archive.close();

    if (failure) {
        std::cerr << failure->toString() << " (" << failure->reason << ")" << std::endl;
        return 1;
    }
    std::cout << "Checked " << task.checked() << " stories" << std::endl;
    return 0;
}

} // namespace storykeep::app
