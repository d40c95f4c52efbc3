#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>

#include "infrastructure/ZipArchive.hpp"
#include "test/TestSupport.hpp"

using namespace storykeep::infrastructure;
using storykeep::test::TempDir;

static std::string ReadBytes(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static void TestRoundTrip(const TempDir& dir) {
    const std::string path = dir / "round.zip";
    std::string large;
    for (int i = 0; i < 20000; ++i) large += "line " + std::to_string(i) + "\n";

    {
        ZipWriter zip(path);
        zip.add("stored.txt", "hello world");
        zip.add("nested/deflated.txt", large, ZipMethod::Deflated);
        zip.add("empty", "", ZipMethod::Deflated);
        zip.close();
        assert(!zip.isOpen());
    }

    ZipReader reader = ZipReader::openFile(path);
    assert(reader.entries().size() == 3);
    assert(reader.find("stored.txt")->method == static_cast<std::uint16_t>(ZipMethod::Stored));
    assert(reader.find("nested/deflated.txt")->compressedSize < large.size());
    assert(reader.find("missing") == nullptr);

    assert(reader.read("stored.txt") == "hello world");
    assert(reader.read("nested/deflated.txt") == large);
    assert(reader.read("empty").empty());
    assert(reader.test().empty());
    std::cout << "[PASS] Stored and deflated round trip." << std::endl;
}

static void TestReadLine(const TempDir& dir) {
    const std::string path = dir / "lines.zip";
    {
        ZipWriter zip(path);
        zip.add("lines.txt", "{\r\n\"1\": {}\n}", ZipMethod::Deflated);
        zip.close();
    }

    ZipReader reader = ZipReader::openFile(path);
    auto stream = reader.open("lines.txt");
    std::string line;
    assert(stream->readLine(line) && line == "{");
    assert(stream->readLine(line) && line == "\"1\": {}");
    assert(stream->readLine(line) && line == "}");
    assert(!stream->readLine(line));
    std::cout << "[PASS] Line reader." << std::endl;
}

static void TestCorruption(const TempDir& dir) {
    const std::string path = dir / "corrupt.zip";
    {
        ZipWriter zip(path);
        zip.add("good.txt", "intact");
        zip.add("bad.txt", "hello world");
        zip.close();
    }

    std::string bytes = ReadBytes(path);
    auto pos = bytes.find("hello world");
    assert(pos != std::string::npos);
    bytes[pos] = 'j';

    ZipReader reader = ZipReader::openMemory(bytes);
    assert(reader.read("good.txt") == "intact");
    assert(reader.test() == "bad.txt");

    bool threw = false;
    try {
        reader.read("bad.txt");
    } catch (const ZipError&) {
        threw = true;
    }
    assert(threw && "CRC mismatch must be reported.");

    ZipReader view = ZipReader::openView(bytes);
    assert(view.entries().size() == reader.entries().size());
    assert(view.read("good.txt") == "intact");
    assert(view.test() == "bad.txt");
    std::cout << "[PASS] Corruption is detected." << std::endl;
}

static void TestUnfinishedWriter(const TempDir& dir) {
    const std::string path = dir / "unfinished.zip";
    {
        ZipWriter zip(path);
        zip.add("part.txt", "half a release");
    }
    assert(!std::filesystem::exists(path) && "Writers destroyed before close discard their file.");

    ZipWriter aborted(path);
    aborted.add("part.txt", "again");
    aborted.abort();
    assert(!aborted.isOpen());
    assert(!std::filesystem::exists(path));
    aborted.abort();
    std::cout << "[PASS] Unfinished writers leave nothing behind." << std::endl;
}

static void TestErrors(const TempDir& dir) {
    bool threw = false;
    try {
        ZipReader::openMemory("this is not a zip file");
    } catch (const ZipError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        ZipReader::openFile(dir / "absent.zip");
    } catch (const ZipError&) {
        threw = true;
    }
    assert(threw);

    const std::string path = dir / "dupes.zip";
    ZipWriter zip(path);
    zip.add("a", "1");
    threw = false;
    try {
        zip.add("a", "2");
    } catch (const ZipError&) {
        threw = true;
    }
    assert(threw && "Duplicate names are rejected.");
    zip.close();

    threw = false;
    try {
        zip.add("b", "3");
    } catch (const ZipError&) {
        threw = true;
    }
    assert(threw && "Closed writers reject entries.");

    ZipReader reader = ZipReader::openFile(path);
    threw = false;
    try {
        reader.open("b");
    } catch (const ZipError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Errors." << std::endl;
}

int main() {
    std::cout << "[Test] Starting Zip Archive Test..." << std::endl;
    TempDir dir("storykeep_zip_test");
    TestRoundTrip(dir);
    TestReadLine(dir);
    TestCorruption(dir);
    TestErrors(dir);
    TestUnfinishedWriter(dir);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
