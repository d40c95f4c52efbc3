#include <cassert>
#include <iostream>
#include <stdexcept>

#include "domain/Errors.hpp"
#include "domain/Story.hpp"
#include "test/TestSupport.hpp"

using namespace storykeep::domain;
using storykeep::test::MakeMeta;
using storykeep::test::MemoryFetcher;

static void TestConstruction() {
    bool threw = false;
    try {
        Story story(1, nullptr);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw && "A lazy story needs a fetcher.");

    Story loaded(1, nullptr, MakeMeta(1, 0), std::string("payload"));
    assert(loaded.isFetched());
    assert(loaded.data() == "payload");
    std::cout << "[PASS] Construction." << std::endl;
}

static void TestLazyFetchCachesOnce() {
    MemoryFetcher fetcher;
    fetcher.put(1, MakeMeta(1, 10), std::string("bytes"));

    Story story = fetcher.fetch(1);
    assert(!story.hasMeta() && !story.hasData());
    assert(fetcher.metaCalls == 0 && fetcher.dataCalls == 0);

    assert(story.meta()["id"] == 1);
    assert(story.meta()["id"] == 1);
    assert(story.data() == "bytes");
    assert(story.data() == "bytes");
    assert(fetcher.metaCalls == 1);
    assert(fetcher.dataCalls == 1);
    assert(story.isFetched());

    Story missing = fetcher.fetch(2);
    bool threw = false;
    try {
        missing.meta();
    } catch (const InvalidStoryError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Lazy fetch caches once." << std::endl;
}

static void TestMergeSharesPayload() {
    MemoryFetcher fetcher;
    fetcher.put(3, MakeMeta(3, 10), std::string("original"));

    Story story = fetcher.fetch(3);
    story.meta();

    Story withData = story.withData("replaced");
    assert(withData.data() == "replaced");
    assert(withData.meta()["id"] == 3);
    assert(fetcher.metaCalls == 1 && "Merged copies reuse the cached meta.");
    assert(fetcher.dataCalls == 0);

    nlohmann::json meta = story.meta();
    meta["title"] = "Renamed";
    Story renamed = story.withMeta(meta);
    assert(renamed.meta()["title"] == "Renamed");
    assert(story.meta()["title"] == "Story 3");

    StoryOverrides overrides;
    overrides.flavors = FlavorSet{UpdateStatus::Deleted};
    Story flavored = story.merge(overrides);
    assert(flavored.flavors().contains(UpdateStatus::Deleted));
    assert(!story.flavors().contains(UpdateStatus::Deleted));
    std::cout << "[PASS] Merge shares payload." << std::endl;
}

static void TestFlavorsAreCopied() {
    FlavorSet shared{StorySource::Archive, DataFormat::Epub};
    MemoryFetcher fetcher(shared);
    fetcher.put(4, MakeMeta(4, 0), std::string("x"));

    Story story = fetcher.fetch(4);
    story.flavors().add(UpdateStatus::Created);
    assert(story.flavors().contains(UpdateStatus::Created));
    assert(!fetcher.flavors().contains(UpdateStatus::Created));
    assert(shared.size() == 2);

    Story other = fetcher.fetch(4);
    assert(!other.flavors().contains(UpdateStatus::Created));

    // One value per category.
    story.flavors().add(UpdateStatus::Updated);
    assert(!story.flavors().contains(UpdateStatus::Created));
    assert(story.flavors().get<UpdateStatus>() == UpdateStatus::Updated);
    assert(story.flavors().get<MetaFormat>() == std::nullopt);
    std::cout << "[PASS] Flavors are copied per story." << std::endl;
}

static void TestPrefetchOverrides() {
    MemoryFetcher eager(FlavorSet{}, true, true);
    eager.put(5, MakeMeta(5, 0), std::string("x"));

    Story story = eager.fetch(5);
    assert(story.isFetched());
    assert(eager.metaCalls == 1 && eager.dataCalls == 1);

    Story lazy = eager.fetch(5, false, false);
    assert(!lazy.hasMeta() && !lazy.hasData());
    assert(eager.metaCalls == 1 && eager.dataCalls == 1);

    MemoryFetcher relaxed;
    relaxed.put(5, MakeMeta(5, 0), std::string("x"));
    Story forced = relaxed.fetch(5, true);
    assert(forced.hasMeta() && !forced.hasData());
    std::cout << "[PASS] Prefetch overrides." << std::endl;
}

int main() {
    std::cout << "[Test] Starting Story Test..." << std::endl;
    TestConstruction();
    TestLazyFetchCachesOnce();
    TestMergeSharesPayload();
    TestFlavorsAreCopied();
    TestPrefetchOverrides();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
