#include <cassert>
#include <iostream>

#include "domain/Stamper.hpp"
#include "domain/StoryMappers.hpp"
#include "domain/Timestamp.hpp"
#include "test/TestSupport.hpp"

using namespace storykeep::domain;
using storykeep::test::MakeMeta;
using storykeep::test::MemoryFetcher;

static Story Loaded(std::int64_t key, nlohmann::json meta, FlavorSet flavors = {}) {
    return Story(key, nullptr, std::move(meta), std::string(), std::move(flavors));
}

static void TestTimestamps() {
    auto epoch = ParseTimestamp(nlohmann::json(0));
    assert(epoch && FormatTimestamp(*epoch) == "1970-01-01T00:00:00+00:00");

    auto iso = ParseIsoTimestamp("2015-06-19T21:05:31+02:00");
    assert(iso && FormatTimestamp(*iso) == "2015-06-19T19:05:31+00:00");

    auto zulu = ParseIsoTimestamp("2015-06-19T19:05:31.250Z");
    assert(zulu && *zulu > *iso);
    assert(FormatTimestamp(*zulu) == "2015-06-19T19:05:31+00:00");
    assert(FormatDateStamp(*zulu) == "20150619");

    assert(!ParseTimestamp(nlohmann::json(nullptr)));
    assert(!ParseIsoTimestamp("yesterday"));
    std::cout << "[PASS] Timestamps." << std::endl;
}

static void TestDateMapper() {
    StoryDateMapper mapper;

    nlohmann::json meta = MakeMeta(1, 10, 2);
    meta["chapters"][1]["date_modified"] = 30;
    Story story = Loaded(1, meta);
    auto date = mapper(story);
    assert(date && *date == Timestamp(std::chrono::seconds(30)));

    meta = MakeMeta(1, 50);
    meta["chapters"][0]["date_modified"] = nullptr;
    story = Loaded(1, meta);
    date = mapper(story);
    assert(date && *date == Timestamp(std::chrono::seconds(50)));

    MemoryFetcher empty;
    Story missing = empty.fetch(9);
    assert(!mapper(missing));

    std::optional<Story> none;
    assert(!mapper(none));
    std::cout << "[PASS] Date mapper." << std::endl;
}

static void TestPathMapper() {
    StoryPathMapper mapper("/tmp/meta");
    Story story = Loaded(42, MakeMeta(42, 0));
    assert(mapper(story) == "/tmp/meta/42");
    assert(mapper.directory() == "/tmp/meta");
    std::cout << "[PASS] Path mapper." << std::endl;
}

static void TestMetaFormatMapper() {
    MetaFormatMapper mapper;

    nlohmann::json alpha = MakeMeta(1, 0);
    alpha["likes"] = 3;
    Story a = Loaded(1, alpha);
    assert(mapper(a) == MetaFormat::Alpha);

    nlohmann::json beta = MakeMeta(1, 0);
    beta["num_likes"] = 3;
    Story b = Loaded(1, beta);
    assert(mapper(b) == MetaFormat::Beta);

    nlohmann::json both = alpha;
    both["num_words"] = 100;
    Story c = Loaded(1, both);
    assert(!mapper(c));

    Story flavored = Loaded(1, beta, FlavorSet{MetaFormat::Alpha});
    assert(mapper(flavored) == MetaFormat::Alpha);
    std::cout << "[PASS] Meta format mapper." << std::endl;
}

static void TestUpdateStamper() {
    const Timestamp now = Timestamp(std::chrono::seconds(1434747931));
    const std::string stamp = FormatTimestamp(now);
    UpdateStamper stamper([now] { return now; });

    Story created = Loaded(2, MakeMeta(2, 5), FlavorSet{UpdateStatus::Created});
    stamper.stamp(created);
    const auto& a = created.meta()["archive"];
    assert(a["date_checked"] == stamp);
    assert(a["date_created"] == stamp);
    assert(a["date_fetched"] == stamp);
    assert(a["date_updated"] == stamp);

    Story updated = Loaded(1, MakeMeta(1, 5), FlavorSet{UpdateStatus::Updated});
    stamper.stamp(updated);
    const auto& u = updated.meta()["archive"];
    assert(u["date_created"].is_null());
    assert(u["date_fetched"] == stamp);
    assert(u["date_updated"] == stamp);

    nlohmann::json old = MakeMeta(1, 5);
    old["archive"] = {{"date_created", "2001-01-01T00:00:00+00:00"}, {"path", "epub/a/b.epub"}};
    Story revived = Loaded(1, old, FlavorSet{UpdateStatus::Revived});
    stamper.stamp(revived);
    const auto& r = revived.meta()["archive"];
    assert(r["date_created"] == "2001-01-01T00:00:00+00:00");
    assert(r["date_fetched"] == stamp);
    assert(r["date_updated"].is_null());
    assert(r["path"] == "epub/a/b.epub");

    Story deleted = Loaded(1, MakeMeta(1, 5), FlavorSet{UpdateStatus::Deleted});
    stamper.stamp(deleted);
    const auto& d = deleted.meta()["archive"];
    assert(d["date_checked"] == stamp);
    assert(d["date_fetched"].is_null());
    assert(d["date_updated"].is_null());
    std::cout << "[PASS] Update stamper." << std::endl;
}

int main() {
    std::cout << "[Test] Starting Mappers Test..." << std::endl;
    TestTimestamps();
    TestDateMapper();
    TestPathMapper();
    TestMetaFormatMapper();
    TestUpdateStamper();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
