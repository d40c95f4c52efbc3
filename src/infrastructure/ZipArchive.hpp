/**
 * @file ZipArchive.hpp
 * @brief Minimal zip container reader and writer on top of zlib.
 *
 * Supports stored and deflated entries, CRC verification and zip64
 * sizes/offsets, which is enough for archives of tens of gigabytes.
 * Encryption, multi-disk archives and data descriptors on write are not
 * supported.
 */

#pragma once

#include <cstdint>
#include <fstream>
#include <istream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace storykeep::infrastructure {

/** @brief Raised for unreadable, corrupt or unsupported containers. */
class ZipError : public std::runtime_error {
public:
    explicit ZipError(const std::string& message) : std::runtime_error(message) {}
};

enum class ZipMethod : std::uint16_t {
    Stored = 0,
    Deflated = 8
};

struct ZipEntryInfo {
    std::string name;
    std::uint16_t method = 0;
    std::uint16_t flags = 0;
    std::uint32_t crc32 = 0;
    std::uint64_t compressedSize = 0;
    std::uint64_t uncompressedSize = 0;
    std::uint64_t localHeaderOffset = 0;
};

/**
 * @class ZipEntryStream
 * @brief Sequential, inflating reader for one entry.
 *
 * The CRC and size are checked once the entry has been fully consumed.
 * Shares the underlying stream with its ZipReader, which must outlive it.
 */
class ZipEntryStream {
public:
    ZipEntryStream(std::istream& input, const ZipEntryInfo& info, std::uint64_t dataOffset);
    ~ZipEntryStream();

    ZipEntryStream(const ZipEntryStream&) = delete;
    ZipEntryStream& operator=(const ZipEntryStream&) = delete;

    /** @brief Reads up to @p size bytes, returning 0 at the end of the entry. */
    std::size_t read(char* buffer, std::size_t size);

    /** @brief Reads the next line without its terminator. Returns false at the end. */
    bool readLine(std::string& line);

    const ZipEntryInfo& info() const { return m_info; }

private:
    std::size_t readRaw(char* buffer, std::size_t size);
    void finish();

    std::istream& m_input;
    ZipEntryInfo m_info;
    std::uint64_t m_inputOffset;
    std::uint64_t m_inputRemaining;
    std::uint64_t m_produced = 0;
    std::uint32_t m_crc;
    bool m_finished = false;

    struct Inflater;
    std::unique_ptr<Inflater> m_inflater;

    std::vector<char> m_lineBuffer;
    std::size_t m_linePos = 0;
    std::size_t m_lineEnd = 0;
};

/**
 * @class ZipReader
 * @brief Random-access reader for a zip container held in a file or in memory.
 */
class ZipReader {
public:
    /** @throws ZipError If the file cannot be opened or is not a zip. */
    static ZipReader openFile(const std::string& path);

    /** @throws ZipError If the bytes are not a zip. */
    static ZipReader openMemory(std::string bytes);

    /**
     * @brief Reads bytes owned by the caller without copying them.
     * @param bytes Must outlive the reader.
     * @throws ZipError If the bytes are not a zip.
     */
    static ZipReader openView(const std::string& bytes);

    explicit ZipReader(std::unique_ptr<std::istream> input);

    ZipReader(ZipReader&&) = default;
    ZipReader& operator=(ZipReader&&) = default;

    const std::vector<ZipEntryInfo>& entries() const { return m_entries; }

    /** @brief Returns the entry with this name, or nullptr. */
    const ZipEntryInfo* find(const std::string& name) const;

    /** @brief Reads and verifies a whole entry. @throws ZipError */
    std::string read(const std::string& name);

    /** @brief Opens a streaming reader for an entry. @throws ZipError */
    std::unique_ptr<ZipEntryStream> open(const std::string& name);

    /**
     * @brief Reads every entry and checks its CRC.
     * @return The name of the first bad entry, or an empty string.
     */
    std::string test();

private:
    void readCentralDirectory();
    std::uint64_t dataOffset(const ZipEntryInfo& info);

    std::unique_ptr<std::istream> m_input;
    std::vector<ZipEntryInfo> m_entries;
    std::unordered_map<std::string, std::size_t> m_byName;
};

/**
 * @class ZipWriter
 * @brief Appends entries to a new zip file and writes the central directory on close.
 */
class ZipWriter {
public:
    /** @throws ZipError If the file cannot be created. */
    explicit ZipWriter(const std::string& path);
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    /** @throws ZipError On duplicate names, I/O failure or after close. */
    void add(const std::string& name, const std::string& data, ZipMethod method = ZipMethod::Stored);

    /** @brief Writes the central directory and closes the file. */
    void close();

    /**
     * @brief Closes without a central directory and deletes the file.
     *
     * Destroying a writer that was never closed aborts it.
     */
    void abort();

    bool isOpen() const { return m_open; }

private:
    void writeBytes(const std::string& bytes);

    std::ofstream m_out;
    std::string m_path;
    bool m_open = false;
    std::uint64_t m_offset = 0;
    std::uint16_t m_dosTime = 0;
    std::uint16_t m_dosDate = 0;
    std::vector<ZipEntryInfo> m_entries;
    std::set<std::string> m_names;
};

} // namespace storykeep::infrastructure
