#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <vector>

#include "application/BuildTask.hpp"
#include "application/CountTask.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/ArchiveFetcher.hpp"
#include "infrastructure/ArchiveWriter.hpp"
#include "infrastructure/DirectoryFetcher.hpp"
#include "infrastructure/DirectoryWriter.hpp"
#include "test/TestSupport.hpp"

using namespace storykeep::domain;
using namespace storykeep::application;
using namespace storykeep::infrastructure;
using storykeep::test::MakeMeta;
using storykeep::test::MakePackage;
using storykeep::test::TempDir;

namespace fs = std::filesystem;

namespace {

const Timestamp kReleaseDate = Timestamp(std::chrono::seconds(1434747931)); // 2015-06-19

/**
 * Previous release: 1, 2, 3 and 7.
 * Upcoming tree: 1 unchanged, 2 without data, 3 changed, 4 new, 5 blacklisted.
 */
struct Release {
    explicit Release(const TempDir& dir)
        : meta(dir / "upcoming-meta"),
          data(dir / "upcoming-data"),
          previousPath(dir / "previous.zip"),
          one(MakePackage(dir.path().string(), "one")),
          two(MakePackage(dir.path().string(), "two")),
          three(MakePackage(dir.path().string(), "three")),
          threeChanged(MakePackage(dir.path().string(), "three, revised")),
          four(MakePackage(dir.path().string(), "four")) {
        ArchiveWriter previous(previousPath, dir / "previous.json");
        const std::vector<std::pair<std::int64_t, std::string>> stories = {
            {1, one}, {2, two}, {3, three}, {7, three}};
        for (const auto& entry : stories) {
            Story story(entry.first, nullptr, MakeMeta(entry.first, 0), entry.second, FlavorSet{DataFormat::Epub});
            previous.write(story);
        }
        previous.close();

        DirectoryWriter upcoming = DirectoryWriter::ForDirectories(meta, data);
        const std::vector<std::pair<std::int64_t, std::string>> fresh = {
            {1, one}, {3, threeChanged}, {4, four}, {5, four}};
        for (const auto& entry : fresh) {
            Story story(entry.first, nullptr, MakeMeta(entry.first, 1), entry.second);
            upcoming.write(story);
        }
        DirectoryWriter metaOnly = DirectoryWriter::ForDirectories(meta, "");
        Story revived(2, nullptr, MakeMeta(2, 1), std::string());
        metaOnly.write(revived);
    }

    std::string meta;
    std::string data;
    std::string previousPath;
    std::string one;
    std::string two;
    std::string three;
    std::string threeChanged;
    std::string four;
};

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
    try {
        fn();
    } catch (const Error&) {
        return true;
    }
    return false;
}

StorySequence Sequence(DirectoryFetcher& fetcher) {
    return [&fetcher](const StoryVisitor& visit) { fetcher.forEach(visit); };
}

} // namespace

static void TestArchiveName() {
    assert(BuildTask::ArchiveName(kReleaseDate) == "fimfarchive-20150619.zip");
    std::cout << "[PASS] Archive name." << std::endl;
}

static void TestBuild(const TempDir& dir, const Release& release) {
    const fs::path output = dir.path() / "output";
    const fs::path extras = dir.path() / "extras";
    fs::create_directories(output);
    fs::create_directories(extras);
    {
        std::ofstream readme(extras / "readme.txt");
        readme << "Read me.";
        std::ofstream about(extras / "about.txt");
        about << "About.";
    }

    ArchiveFetcher previous(release.previousPath);
    DirectoryFetcher upcoming(release.meta, release.data, FlavorSet{DataFormat::Epub});
    Blacklist blacklist;
    blacklist.stories.insert(5);

    BuildTask task(output.string(), Sequence(upcoming), &previous, extras.string(), blacklist, kReleaseDate);
    assert(fs::path(task.archivePath()).filename() == "fimfarchive-20150619.zip");
    assert(fs::path(task.indexPath()).filename() == "fimfarchive-20150619.json");

    assert(task.run() == 4);
    assert(fs::exists(task.indexPath()));

    ArchiveFetcher built(task.archivePath());
    assert((built.keys() == std::vector<std::int64_t>{1, 2, 3, 4}));
    assert(built.fetchData(2) == release.two && "Missing payloads are revived from the previous release.");
    assert(built.fetchData(3) == release.threeChanged);

    ZipReader zip = ZipReader::openFile(task.archivePath());
    assert(zip.read("readme.txt") == "Read me.");
    assert(zip.read("about.txt") == "About.");
    const auto& entries = zip.entries();
    assert(entries[entries.size() - 3].name == "about.txt" && "Extras are sorted by name.");
    assert(entries.back().name == "index.json");

    assert(Throws<InvariantViolation>([&] { task.run(); }) && "Releases are never overwritten.");
    std::cout << "[PASS] Build writes a complete release." << std::endl;
}

static void TestReviveFailures(const TempDir& dir, const Release& release) {
    const fs::path output = dir.path() / "orphans";
    fs::create_directories(output);

    DirectoryFetcher upcoming(release.meta, release.data, FlavorSet{DataFormat::Epub});
    BuildTask orphan(output.string(), Sequence(upcoming));
    Story revived = upcoming.fetch(2);
    assert(Throws<StorySourceError>([&] { orphan.revive(revived); }));

    Story complete = upcoming.fetch(1);
    assert(orphan.resolve(complete).data() == release.one);

    ArchiveFetcher previous(release.previousPath);
    BuildTask task(output.string(), Sequence(upcoming), &previous);
    Story unknown = upcoming.fetch(4);
    assert(Throws<StorySourceError>([&] { task.revive(unknown); }));

    assert(Throws<StorySourceError>([&] { BuildTask((dir.path() / "absent").string(), Sequence(upcoming)); }));
    std::cout << "[PASS] Revive failures." << std::endl;
}

static void TestFailedBuildLeavesNothing(const TempDir& dir, const Release& release) {
    const fs::path output = dir.path() / "aborted";
    fs::create_directories(output);

    // Story 2 has no data and there is no previous release to revive it from.
    DirectoryFetcher upcoming(release.meta, release.data, FlavorSet{DataFormat::Epub});
    BuildTask task(output.string(), Sequence(upcoming), nullptr, "", Blacklist(), kReleaseDate);
    assert(Throws<StorySourceError>([&] { task.run(); }));

    assert(!fs::exists(task.archivePath()) && "Unfinished releases are discarded.");
    assert(!fs::exists(task.indexPath()));
    assert(fs::is_empty(output));
    std::cout << "[PASS] Failed build leaves no release behind." << std::endl;
}

static void TestBlacklist() {
    Blacklist blacklist;
    blacklist.authors.insert(104);
    Story byAuthor(4, nullptr, MakeMeta(4, 0), std::string("x"));
    Story other(3, nullptr, MakeMeta(3, 0), std::string("x"));
    assert(blacklist.contains(byAuthor));
    assert(!blacklist.contains(other));

    blacklist.stories.insert(3);
    assert(blacklist.contains(other));
    std::cout << "[PASS] Blacklist." << std::endl;
}

static void TestCount(const Release& release) {
    ArchiveFetcher previous(release.previousPath);
    DirectoryFetcher upcoming(release.meta, release.data, FlavorSet{DataFormat::Epub});
    Blacklist blacklist;
    blacklist.stories.insert(5);

    CountReport report = CountTask(previous, upcoming, blacklist).run();
    assert(report.previous == 4);
    assert(report.upcoming == 4);
    assert(report.created == 1);
    assert(report.revived == 1);
    assert(report.updated == 1);
    assert(report.deleted == 1);
    assert(report.blocked == 1);
    assert(report.uniform == 1);
    assert(report.toString().find("Uniform: 1") != std::string::npos);
    std::cout << "[PASS] Count." << std::endl;
}

int main() {
    std::cout << "[Test] Starting Build Task Test..." << std::endl;
    TempDir dir("storykeep_build_test");
    Release release(dir);
    TestArchiveName();
    TestBuild(dir, release);
    TestReviveFailures(dir, release);
    TestFailedBuildLeavesNothing(dir, release);
    TestBlacklist();
    TestCount(release);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
