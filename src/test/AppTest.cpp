#include <cassert>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "app/StorykeepApp.hpp"
#include "app/UpdatePrinter.hpp"
#include "application/CheckTask.hpp"
#include "infrastructure/ArchiveFetcher.hpp"
#include "infrastructure/ArchiveWriter.hpp"
#include "infrastructure/ZipArchive.hpp"
#include "test/TestSupport.hpp"

using namespace storykeep;
using storykeep::test::MakeMeta;
using storykeep::test::MakePackage;
using storykeep::test::TempDir;

static int RunArgs(std::vector<std::string> args) {
    std::vector<char*> argv;
    for (auto& arg : args) argv.push_back(arg.data());
    app::StorykeepApp application;
    return application.Run(static_cast<int>(argv.size()), argv.data());
}

static void TestParseOptions() {
    std::map<std::string, std::string> options;
    assert(app::StorykeepApp::ParseOptions({"--archive", "a.zip", "--workdir", "w"}, {"--archive", "--workdir"}, options));
    assert(options["--archive"] == "a.zip");
    assert(options["--workdir"] == "w");

    options.clear();
    assert(!app::StorykeepApp::ParseOptions({"--archive"}, {"--archive"}, options));
    assert(!app::StorykeepApp::ParseOptions({"--bogus", "1"}, {"--archive"}, options));
    std::cout << "[PASS] Option parsing." << std::endl;
}

static void TestExitCodes(const TempDir& dir) {
    const std::string config = dir / "settings.json";
    assert(RunArgs({"storykeep"}) == 2);
    assert(RunArgs({"storykeep", "dance"}) == 2);
    assert(RunArgs({"storykeep", "update", "--workdir", "w"}) == 2);
    assert(RunArgs({"storykeep", "count", "--archive", dir / "absent.zip", "--config", config}) == 1);
    std::cout << "[PASS] Exit codes." << std::endl;
}

static std::string ReadFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static void WriteFile(const std::string& path, const std::string& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << bytes;
}

static void TestCheck(const TempDir& dir) {
    const std::string config = dir / "settings.json";
    const std::string package = MakePackage(dir.path().string(), "checked text");

    const std::string good = dir / "good.zip";
    {
        infrastructure::ArchiveWriter writer(good, dir / "good.json");
        for (std::int64_t key : {1, 2}) {
            domain::Story story(key, nullptr, MakeMeta(key, 0), package, domain::FlavorSet{domain::DataFormat::Epub});
            writer.write(story);
        }
        writer.close();
    }
    assert(RunArgs({"storykeep", "check", "--archive", good, "--config", config}) == 0);
    assert(RunArgs({"storykeep", "check", "--config", config}) == 2);

    // Story 2 holds something that is not a package.
    const std::string badStory = dir / "badstory.zip";
    {
        infrastructure::ZipWriter zip(badStory);
        zip.add("one.epub", package);
        zip.add("two.epub", "not a package");
        zip.add("index.json",
                "{\n"
                "\"1\": {\"id\": 1, \"archive\": {\"path\": \"one.epub\"}},\n"
                "\"2\": {\"id\": 2, \"archive\": {\"path\": \"two.epub\"}}\n"
                "}\n",
                infrastructure::ZipMethod::Deflated);
        zip.close();
    }
    assert(RunArgs({"storykeep", "check", "--archive", badStory, "--config", config}) == 1);
    {
        infrastructure::ArchiveFetcherOptions options;
        options.verifyPayloads = false;
        infrastructure::ArchiveFetcher archive(badStory, options);
        application::CheckTask task(archive);
        auto failure = task.run();
        assert(failure && failure->key == std::int64_t{2});
        assert(failure->toString() == "Invalid CRC: 2");
        assert(task.checked() == 1);
    }

    // A flipped byte in a stored payload breaks the container CRC.
    std::string bytes = ReadFile(good);
    const auto pos = bytes.find("application/epub+zip");
    assert(pos != std::string::npos);
    bytes[pos] = 'A';
    const std::string badArchive = dir / "badarchive.zip";
    WriteFile(badArchive, bytes);
    assert(RunArgs({"storykeep", "check", "--archive", badArchive, "--config", config}) == 1);
    {
        infrastructure::ArchiveFetcher archive(badArchive);
        application::CheckTask task(archive);
        auto failure = task.run();
        assert(failure && !failure->key);
        assert(failure->toString() == "Invalid CRC: Archive");
    }
    std::cout << "[PASS] Check command." << std::endl;
}

static void TestPrinter() {
    nlohmann::json meta = MakeMeta(1, 0, 3);
    meta["status"] = "Complete";
    meta["likes"] = 3;
    meta["dislikes"] = 1;
    domain::Story story(1, nullptr, meta, std::string(), domain::FlavorSet{domain::UpdateStatus::Updated});

    const std::string text = app::UpdatePrinter::FormatStory(story);
    assert(text.find("Title: Story 1") != std::string::npos);
    assert(text.find("Author: Author 1") != std::string::npos);
    assert(text.find("Words: None") != std::string::npos);
    assert(text.find("Approval: 75%") != std::string::npos);
    assert(text.find("Chapters: 3") != std::string::npos);
    assert(text.find("Action: Updated") != std::string::npos);

    std::ostringstream out;
    app::UpdatePrinter printer(out);
    printer.onAttempt(7, 2, 0);
    printer.onSkipped(7);
    printer.onAttempt(8, 0, 1);
    printer.onFailure(8, std::runtime_error("Server down."));
    const std::string log = out.str();
    assert(log.find("Story: 7\nSkips: 2") != std::string::npos);
    assert(log.find("Status: Missing") != std::string::npos);
    assert(log.find("Retries: 1") != std::string::npos);
    assert(log.find("Error: Server down.") != std::string::npos);
    std::cout << "[PASS] Update printer." << std::endl;
}

int main() {
    std::cout << "[Test] Starting App Test..." << std::endl;
    TempDir dir("storykeep_app_test");
    TestParseOptions();
    TestExitCodes(dir);
    TestCheck(dir);
    TestPrinter();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
