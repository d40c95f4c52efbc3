#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <vector>

#include "domain/Errors.hpp"
#include "infrastructure/DirectoryFetcher.hpp"
#include "infrastructure/DirectoryWriter.hpp"
#include "test/TestSupport.hpp"

using namespace storykeep::domain;
using namespace storykeep::infrastructure;
using storykeep::test::MakeMeta;
using storykeep::test::TempDir;

namespace fs = std::filesystem;

static void TestWriteThenFetch(const TempDir& dir) {
    const std::string meta = dir / "meta";
    const std::string data = dir / "data";

    DirectoryWriter writer = DirectoryWriter::ForDirectories(meta, data);
    for (std::int64_t key : {12, 3, 7}) {
        Story story(key, nullptr, MakeMeta(key, 0), "payload " + std::to_string(key));
        writer.write(story);
    }
    assert(fs::exists(fs::path(meta) / "12"));
    assert(fs::exists(fs::path(data) / "3"));

    DirectoryFetcher fetcher(meta, data, FlavorSet{DataFormat::Epub});
    assert((fetcher.listKeys() == std::set<std::int64_t>{3, 7, 12}));
    assert(fetcher.size() == 3);

    std::vector<std::int64_t> visited;
    fetcher.forEach([&](Story& story) {
        visited.push_back(story.key());
        assert(story.flavors().contains(DataFormat::Epub));
    });
    assert((visited == std::vector<std::int64_t>{3, 7, 12}));

    Story story = fetcher.fetch(7);
    assert(story.meta()["title"] == "Story 7");
    assert(story.data() == "payload 7");

    Story missing = fetcher.fetch(8);
    bool threw = false;
    try {
        missing.meta();
    } catch (const InvalidStoryError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Write then fetch." << std::endl;
}

static void TestOverwrite(const TempDir& dir) {
    const std::string meta = dir / "overwrite";
    Story story(1, nullptr, MakeMeta(1, 0), std::string("x"));

    DirectoryWriter strict = DirectoryWriter::ForDirectories(meta, "");
    strict.write(story);
    bool threw = false;
    try {
        strict.write(story);
    } catch (const InvariantViolation&) {
        threw = true;
    }
    assert(threw && "Existing files are never replaced by default.");

    nlohmann::json changed = MakeMeta(1, 0);
    changed["title"] = "Changed";
    Story updated = story.withMeta(changed);
    DirectoryWriter relaxed = DirectoryWriter::ForDirectories(meta, "", true);
    relaxed.write(updated);

    DirectoryFetcher fetcher(meta, "");
    assert(fetcher.fetchMeta(1)["title"] == "Changed");

    threw = false;
    try {
        fetcher.fetchData(1);
    } catch (const StorySourceError&) {
        threw = true;
    }
    assert(threw && "Undefined data path.");

    DirectoryWriter noDirs = DirectoryWriter::ForDirectories(dir / "absent", "", false, false);
    threw = false;
    try {
        noDirs.write(story);
    } catch (const StorySourceError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Overwrite handling." << std::endl;
}

static void TestBadDirectories(const TempDir& dir) {
    const std::string messy = dir / "messy";
    fs::create_directories(messy);
    {
        std::ofstream note(fs::path(messy) / "notes.txt");
        note << "hello";
    }

    DirectoryFetcher fetcher(messy, "");
    bool threw = false;
    try {
        fetcher.listKeys();
    } catch (const StorySourceError&) {
        threw = true;
    }
    assert(threw && "Non-numeric file names are rejected.");

    DirectoryFetcher nowhere(dir / "nowhere", "");
    threw = false;
    try {
        nowhere.listKeys();
    } catch (const StorySourceError&) {
        threw = true;
    }
    assert(threw);

    const std::string broken = dir / "broken";
    fs::create_directories(broken);
    {
        std::ofstream file(fs::path(broken) / "5");
        file << "{ not json";
    }
    DirectoryFetcher garbled(broken, "");
    threw = false;
    try {
        garbled.fetchMeta(5);
    } catch (const StorySourceError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Bad directories." << std::endl;
}

int main() {
    std::cout << "[Test] Starting Directory Test..." << std::endl;
    TempDir dir("storykeep_directory_test");
    TestWriteThenFetch(dir);
    TestOverwrite(dir);
    TestBadDirectories(dir);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
