/**
 * @file ZipArchive.cpp
 * @brief Implementation of ZipReader, ZipEntryStream and ZipWriter.
 */

#include "infrastructure/ZipArchive.hpp"
#include <algorithm>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <streambuf>
#include <utility>
#include <zlib.h>

namespace storykeep::infrastructure {

namespace fs = std::filesystem;

namespace {

constexpr std::uint32_t kLocalSig = 0x04034b50;
constexpr std::uint32_t kCentralSig = 0x02014b50;
constexpr std::uint32_t kEndSig = 0x06054b50;
constexpr std::uint32_t kZip64EndSig = 0x06064b50;
constexpr std::uint32_t kZip64LocatorSig = 0x07064b50;
constexpr std::uint16_t kZip64ExtraId = 0x0001;
constexpr std::uint16_t kUtf8Flag = 0x0800;
constexpr std::uint32_t kMax32 = 0xFFFFFFFFu;
constexpr std::uint16_t kMax16 = 0xFFFFu;
constexpr std::size_t kEndRecordSize = 22;
constexpr std::size_t kCentralHeaderSize = 46;
constexpr std::size_t kLocalHeaderSize = 30;
constexpr std::size_t kChunkSize = 64 * 1024;
constexpr std::size_t kMaxZlibInput = 1u << 30;

const unsigned char* Bytes(const std::string& s, std::size_t pos = 0) {
    return reinterpret_cast<const unsigned char*>(s.data()) + pos;
}

std::uint16_t Get16(const unsigned char* p) {
    return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

std::uint32_t Get32(const unsigned char* p) {
    return static_cast<std::uint32_t>(p[0]) |
           (static_cast<std::uint32_t>(p[1]) << 8) |
           (static_cast<std::uint32_t>(p[2]) << 16) |
           (static_cast<std::uint32_t>(p[3]) << 24);
}

std::uint64_t Get64(const unsigned char* p) {
    return static_cast<std::uint64_t>(Get32(p)) | (static_cast<std::uint64_t>(Get32(p + 4)) << 32);
}

void Put16(std::string& out, std::uint16_t v) {
    out.push_back(static_cast<char>(v & 0xFF));
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
}

void Put32(std::string& out, std::uint32_t v) {
    Put16(out, static_cast<std::uint16_t>(v & 0xFFFF));
    Put16(out, static_cast<std::uint16_t>(v >> 16));
}

void Put64(std::string& out, std::uint64_t v) {
    Put32(out, static_cast<std::uint32_t>(v & 0xFFFFFFFFu));
    Put32(out, static_cast<std::uint32_t>(v >> 32));
}

std::uint32_t Clamp32(std::uint64_t v) {
    return v >= kMax32 ? kMax32 : static_cast<std::uint32_t>(v);
}

std::string ReadAt(std::istream& in, std::uint64_t offset, std::size_t size) {
    in.clear();
    in.seekg(static_cast<std::streamoff>(offset));
    std::string buf(size, '\0');
    if (size > 0) in.read(&buf[0], static_cast<std::streamsize>(size));
    if (!in || static_cast<std::size_t>(in.gcount()) != size) {
        throw ZipError("Unexpected end of archive.");
    }
    return buf;
}

std::uint32_t Crc32(std::uint32_t crc, const char* data, std::size_t size) {
    while (size > 0) {
        std::size_t n = std::min(size, kMaxZlibInput);
        crc = static_cast<std::uint32_t>(crc32(crc, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(n)));
        data += n;
        size -= n;
    }
    return crc;
}

std::string Deflate(const std::string& data) {
    z_stream zs{};
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw ZipError("Could not initialize deflater.");
    }

    std::string out;
    std::vector<char> buf(kChunkSize);
    std::size_t inPos = 0;
    int flush = Z_NO_FLUSH;

    do {
        std::size_t n = std::min(data.size() - inPos, kMaxZlibInput);
        zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data() + inPos));
        zs.avail_in = static_cast<uInt>(n);
        inPos += n;
        flush = inPos == data.size() ? Z_FINISH : Z_NO_FLUSH;

        do {
            zs.next_out = reinterpret_cast<Bytef*>(buf.data());
            zs.avail_out = static_cast<uInt>(buf.size());
            if (deflate(&zs, flush) == Z_STREAM_ERROR) {
                deflateEnd(&zs);
                throw ZipError("Deflate failed.");
            }
            out.append(buf.data(), buf.size() - zs.avail_out);
        } while (zs.avail_out == 0);
    } while (flush != Z_FINISH);

    deflateEnd(&zs);
    return out;
}

/** @brief Seekable read-only streambuf over bytes it does not own. */
class ViewBuffer : public std::streambuf {
public:
    ViewBuffer(const char* data, std::size_t size) {
        char* begin = const_cast<char*>(data);
        setg(begin, begin, begin + size);
    }

protected:
    pos_type seekoff(off_type off, std::ios_base::seekdir dir, std::ios_base::openmode which) override {
        if (!(which & std::ios_base::in)) return pos_type(off_type(-1));

        off_type target = off;
        if (dir == std::ios_base::cur) {
            target += gptr() - eback();
        } else if (dir == std::ios_base::end) {
            target += egptr() - eback();
        }
        if (target < 0 || target > egptr() - eback()) return pos_type(off_type(-1));

        setg(eback(), eback() + target, egptr());
        return pos_type(target);
    }

    pos_type seekpos(pos_type pos, std::ios_base::openmode which) override {
        return seekoff(off_type(pos), std::ios_base::beg, which);
    }
};

class ViewStream : public std::istream {
public:
    explicit ViewStream(const std::string& bytes)
        : std::istream(nullptr), m_buffer(bytes.data(), bytes.size()) {
        rdbuf(&m_buffer);
    }

private:
    ViewBuffer m_buffer;
};

/** @brief Like ViewStream, but owns its bytes. */
class MemoryStream : public std::istream {
public:
    explicit MemoryStream(std::string bytes)
        : std::istream(nullptr), m_bytes(std::move(bytes)), m_buffer(m_bytes.data(), m_bytes.size()) {
        rdbuf(&m_buffer);
    }

private:
    std::string m_bytes;
    ViewBuffer m_buffer;
};

} // namespace

// ---------------------------------------------------------------------------
// ZipEntryStream
// ---------------------------------------------------------------------------

struct ZipEntryStream::Inflater {
    z_stream zs{};
    std::vector<char> input;
    bool done = false;
};

ZipEntryStream::ZipEntryStream(std::istream& input, const ZipEntryInfo& info, std::uint64_t dataOffset)
    : m_input(input),
      m_info(info),
      m_inputOffset(dataOffset),
      m_inputRemaining(info.compressedSize),
      m_crc(static_cast<std::uint32_t>(crc32(0L, Z_NULL, 0))) {
    if (info.method == static_cast<std::uint16_t>(ZipMethod::Deflated)) {
        auto inflater = std::make_unique<Inflater>();
        inflater->input.resize(kChunkSize);
        if (inflateInit2(&inflater->zs, -MAX_WBITS) != Z_OK) {
            throw ZipError("Could not initialize inflater.");
        }
        m_inflater = std::move(inflater);
    } else if (info.method != static_cast<std::uint16_t>(ZipMethod::Stored)) {
        throw ZipError("Unsupported compression method for entry: " + info.name);
    }
}

ZipEntryStream::~ZipEntryStream() {
    if (m_inflater) inflateEnd(&m_inflater->zs);
}

std::size_t ZipEntryStream::readRaw(char* buffer, std::size_t size) {
    if (m_finished || size == 0) return 0;

    std::size_t produced = 0;

    if (!m_inflater) {
        std::size_t n = static_cast<std::size_t>(std::min<std::uint64_t>(size, m_inputRemaining));
        if (n > 0) {
            std::string chunk = ReadAt(m_input, m_inputOffset, n);
            std::copy(chunk.begin(), chunk.end(), buffer);
            m_inputOffset += n;
            m_inputRemaining -= n;
            produced = n;
        }
    } else {
        z_stream& zs = m_inflater->zs;
        std::size_t want = std::min(size, kMaxZlibInput);
        zs.next_out = reinterpret_cast<Bytef*>(buffer);
        zs.avail_out = static_cast<uInt>(want);

        while (zs.avail_out > 0 && !m_inflater->done) {
            if (zs.avail_in == 0) {
                if (m_inputRemaining == 0) {
                    throw ZipError("Truncated deflate stream in entry: " + m_info.name);
                }
                std::size_t n = static_cast<std::size_t>(std::min<std::uint64_t>(kChunkSize, m_inputRemaining));
                m_input.clear();
                m_input.seekg(static_cast<std::streamoff>(m_inputOffset));
                m_input.read(m_inflater->input.data(), static_cast<std::streamsize>(n));
                if (static_cast<std::size_t>(m_input.gcount()) != n) {
                    throw ZipError("Unexpected end of archive in entry: " + m_info.name);
                }
                m_inputOffset += n;
                m_inputRemaining -= n;
                zs.next_in = reinterpret_cast<Bytef*>(m_inflater->input.data());
                zs.avail_in = static_cast<uInt>(n);
            }

            int rc = inflate(&zs, Z_NO_FLUSH);
            if (rc == Z_STREAM_END) {
                m_inflater->done = true;
            } else if (rc != Z_OK) {
                throw ZipError("Corrupt deflate stream in entry: " + m_info.name);
            }
        }
        produced = want - zs.avail_out;
    }

    m_crc = Crc32(m_crc, buffer, produced);
    m_produced += produced;

    bool exhausted = m_inflater ? m_inflater->done : m_inputRemaining == 0;
    if (exhausted) finish();

    return produced;
}

void ZipEntryStream::finish() {
    m_finished = true;
    if (m_produced != m_info.uncompressedSize) {
        throw ZipError("Size mismatch in entry: " + m_info.name);
    }
    if (m_crc != m_info.crc32) {
        throw ZipError("CRC mismatch in entry: " + m_info.name);
    }
}

std::size_t ZipEntryStream::read(char* buffer, std::size_t size) {
    if (m_linePos < m_lineEnd) {
        std::size_t n = std::min(size, m_lineEnd - m_linePos);
        std::copy(m_lineBuffer.data() + m_linePos, m_lineBuffer.data() + m_linePos + n, buffer);
        m_linePos += n;
        return n;
    }
    return readRaw(buffer, size);
}

bool ZipEntryStream::readLine(std::string& line) {
    line.clear();
    bool any = false;

    while (true) {
        if (m_linePos == m_lineEnd) {
            if (m_lineBuffer.empty()) m_lineBuffer.resize(kChunkSize);
            m_lineEnd = readRaw(m_lineBuffer.data(), m_lineBuffer.size());
            m_linePos = 0;
            if (m_lineEnd == 0) {
                if (!line.empty() && line.back() == '\r') line.pop_back();
                return any;
            }
        }

        const char* begin = m_lineBuffer.data() + m_linePos;
        const char* end = m_lineBuffer.data() + m_lineEnd;
        const char* newline = std::find(begin, end, '\n');

        line.append(begin, newline);
        any = true;
        m_linePos = static_cast<std::size_t>(newline - m_lineBuffer.data());

        if (newline != end) {
            ++m_linePos;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
    }
}

// ---------------------------------------------------------------------------
// ZipReader
// ---------------------------------------------------------------------------

ZipReader ZipReader::openFile(const std::string& path) {
    auto input = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!input->is_open()) {
        throw ZipError("Could not read from file: " + path);
    }
    return ZipReader(std::move(input));
}

ZipReader ZipReader::openMemory(std::string bytes) {
    return ZipReader(std::make_unique<MemoryStream>(std::move(bytes)));
}

ZipReader ZipReader::openView(const std::string& bytes) {
    return ZipReader(std::make_unique<ViewStream>(bytes));
}

ZipReader::ZipReader(std::unique_ptr<std::istream> input) : m_input(std::move(input)) {
    readCentralDirectory();
}

void ZipReader::readCentralDirectory() {
    std::istream& in = *m_input;
    in.clear();
    in.seekg(0, std::ios::end);
    std::streamoff endPos = in.tellg();
    if (endPos < static_cast<std::streamoff>(kEndRecordSize)) {
        throw ZipError("Archive is not a valid zip file.");
    }

    const std::uint64_t size = static_cast<std::uint64_t>(endPos);
    const std::size_t tailSize = static_cast<std::size_t>(std::min<std::uint64_t>(size, kEndRecordSize + kMax16));
    const std::uint64_t tailStart = size - tailSize;
    const std::string tail = ReadAt(in, tailStart, tailSize);

    std::size_t eocd = std::string::npos;
    for (std::size_t i = tailSize - kEndRecordSize + 1; i > 0; --i) {
        if (Get32(Bytes(tail, i - 1)) == kEndSig) {
            eocd = i - 1;
            break;
        }
    }
    if (eocd == std::string::npos) {
        throw ZipError("Archive is not a valid zip file.");
    }

    const unsigned char* end = Bytes(tail, eocd);
    std::uint64_t count = Get16(end + 10);
    std::uint64_t cdSize = Get32(end + 12);
    std::uint64_t cdOffset = Get32(end + 16);
    const std::uint64_t eocdOffset = tailStart + eocd;

    if ((count == kMax16 || cdSize == kMax32 || cdOffset == kMax32) && eocdOffset >= 20) {
        const std::string locator = ReadAt(in, eocdOffset - 20, 20);
        if (Get32(Bytes(locator)) == kZip64LocatorSig) {
            const std::string record = ReadAt(in, Get64(Bytes(locator, 8)), 56);
            if (Get32(Bytes(record)) != kZip64EndSig) {
                throw ZipError("Corrupt zip64 end of central directory.");
            }
            count = Get64(Bytes(record, 32));
            cdSize = Get64(Bytes(record, 40));
            cdOffset = Get64(Bytes(record, 48));
        }
    }

    if (cdOffset > size || cdSize > size - cdOffset) {
        throw ZipError("Central directory is out of bounds.");
    }

    const std::string cd = ReadAt(in, cdOffset, static_cast<std::size_t>(cdSize));
    std::size_t pos = 0;

    for (std::uint64_t i = 0; i < count; ++i) {
        if (pos + kCentralHeaderSize > cd.size() || Get32(Bytes(cd, pos)) != kCentralSig) {
            throw ZipError("Corrupt central directory.");
        }

        const unsigned char* h = Bytes(cd, pos);
        ZipEntryInfo info;
        info.flags = Get16(h + 8);
        info.method = Get16(h + 10);
        info.crc32 = Get32(h + 16);
        info.compressedSize = Get32(h + 20);
        info.uncompressedSize = Get32(h + 24);
        const std::size_t nameLen = Get16(h + 28);
        const std::size_t extraLen = Get16(h + 30);
        const std::size_t commentLen = Get16(h + 32);
        info.localHeaderOffset = Get32(h + 42);

        if (pos + kCentralHeaderSize + nameLen + extraLen + commentLen > cd.size()) {
            throw ZipError("Corrupt central directory.");
        }
        info.name = cd.substr(pos + kCentralHeaderSize, nameLen);

        std::size_t extra = pos + kCentralHeaderSize + nameLen;
        const std::size_t extraEnd = extra + extraLen;
        while (extra + 4 <= extraEnd) {
            const std::uint16_t id = Get16(Bytes(cd, extra));
            const std::size_t len = Get16(Bytes(cd, extra + 2));
            if (extra + 4 + len > extraEnd) break;

            if (id == kZip64ExtraId) {
                std::size_t field = extra + 4;
                const std::size_t fieldEnd = field + len;
                auto widen = [&](std::uint64_t& value) {
                    if (value != kMax32) return;
                    if (field + 8 > fieldEnd) throw ZipError("Corrupt zip64 extra field.");
                    value = Get64(Bytes(cd, field));
                    field += 8;
                };
                widen(info.uncompressedSize);
                widen(info.compressedSize);
                widen(info.localHeaderOffset);
            }
            extra += 4 + len;
        }

        pos += kCentralHeaderSize + nameLen + extraLen + commentLen;
        m_byName[info.name] = m_entries.size();
        m_entries.push_back(std::move(info));
    }
}

const ZipEntryInfo* ZipReader::find(const std::string& name) const {
    auto it = m_byName.find(name);
    if (it == m_byName.end()) return nullptr;
    return &m_entries[it->second];
}

std::uint64_t ZipReader::dataOffset(const ZipEntryInfo& info) {
    const std::string header = ReadAt(*m_input, info.localHeaderOffset, kLocalHeaderSize);
    if (Get32(Bytes(header)) != kLocalSig) {
        throw ZipError("Corrupt local header for entry: " + info.name);
    }
    const std::uint64_t nameLen = Get16(Bytes(header, 26));
    const std::uint64_t extraLen = Get16(Bytes(header, 28));
    return info.localHeaderOffset + kLocalHeaderSize + nameLen + extraLen;
}

std::unique_ptr<ZipEntryStream> ZipReader::open(const std::string& name) {
    const ZipEntryInfo* info = find(name);
    if (!info) {
        throw ZipError("Missing entry: " + name);
    }
    if (info->flags & 0x0001) {
        throw ZipError("Encrypted entries are not supported: " + name);
    }
    return std::make_unique<ZipEntryStream>(*m_input, *info, dataOffset(*info));
}

std::string ZipReader::read(const std::string& name) {
    auto stream = open(name);
    std::string out;
    out.reserve(static_cast<std::size_t>(std::min<std::uint64_t>(stream->info().uncompressedSize, 1u << 28)));

    std::vector<char> buf(kChunkSize);
    std::size_t n = 0;
    while ((n = stream->read(buf.data(), buf.size())) > 0) {
        out.append(buf.data(), n);
    }
    return out;
}

std::string ZipReader::test() {
    std::vector<char> buf(kChunkSize);
    for (const auto& info : m_entries) {
        try {
            auto stream = open(info.name);
            while (stream->read(buf.data(), buf.size()) > 0) {
            }
        } catch (const ZipError&) {
            return info.name;
        }
    }
    return {};
}

// ---------------------------------------------------------------------------
// ZipWriter
// ---------------------------------------------------------------------------

ZipWriter::ZipWriter(const std::string& path) : m_path(path) {
    m_out.open(path, std::ios::binary | std::ios::trunc);
    if (!m_out.is_open()) {
        throw ZipError("Could not create zip file: " + path);
    }
    m_open = true;

    std::time_t tt = std::time(nullptr);
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    m_dosTime = static_cast<std::uint16_t>((tm.tm_hour << 11) | (tm.tm_min << 5) | (tm.tm_sec / 2));
    m_dosDate = static_cast<std::uint16_t>(((tm.tm_year - 80) << 9) | ((tm.tm_mon + 1) << 5) | tm.tm_mday);
}

ZipWriter::~ZipWriter() {
    abort();
}

void ZipWriter::abort() {
    if (!m_open) return;
    m_open = false;
    m_out.close();

    std::error_code ec;
    fs::remove(m_path, ec);
    if (ec) {
        std::cerr << "[ZipWriter] Could not remove unfinished " << m_path << ": " << ec.message() << std::endl;
    }
}

void ZipWriter::writeBytes(const std::string& bytes) {
    m_out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!m_out) {
        throw ZipError("Write failed: " + m_path);
    }
    m_offset += bytes.size();
}

void ZipWriter::add(const std::string& name, const std::string& data, ZipMethod method) {
    if (!m_open) {
        throw ZipError("Zip file is closed: " + m_path);
    }
    if (!m_names.insert(name).second) {
        throw ZipError("Duplicate entry: " + name);
    }

    ZipEntryInfo info;
    info.name = name;
    info.method = static_cast<std::uint16_t>(method);
    info.flags = kUtf8Flag;
    info.crc32 = Crc32(static_cast<std::uint32_t>(crc32(0L, Z_NULL, 0)), data.data(), data.size());
    info.uncompressedSize = data.size();
    info.localHeaderOffset = m_offset;

    std::string deflated;
    const std::string* payload = &data;
    if (method == ZipMethod::Deflated) {
        deflated = Deflate(data);
        payload = &deflated;
    }
    info.compressedSize = payload->size();

    const bool zip64 = info.uncompressedSize >= kMax32 || info.compressedSize >= kMax32;

    std::string header;
    Put32(header, kLocalSig);
    Put16(header, zip64 ? 45 : 20);
    Put16(header, info.flags);
    Put16(header, info.method);
    Put16(header, m_dosTime);
    Put16(header, m_dosDate);
    Put32(header, info.crc32);
    Put32(header, zip64 ? kMax32 : static_cast<std::uint32_t>(info.compressedSize));
    Put32(header, zip64 ? kMax32 : static_cast<std::uint32_t>(info.uncompressedSize));
    Put16(header, static_cast<std::uint16_t>(name.size()));
    Put16(header, zip64 ? 20 : 0);
    header += name;
    if (zip64) {
        Put16(header, kZip64ExtraId);
        Put16(header, 16);
        Put64(header, info.uncompressedSize);
        Put64(header, info.compressedSize);
    }

    writeBytes(header);
    writeBytes(*payload);
    m_entries.push_back(std::move(info));
}

void ZipWriter::close() {
    if (!m_open) return;
    m_open = false;

    const std::uint64_t cdOffset = m_offset;
    std::string cd;

    for (const auto& info : m_entries) {
        const bool zip64 = info.uncompressedSize >= kMax32 || info.compressedSize >= kMax32 ||
                           info.localHeaderOffset >= kMax32;
        std::string extra;
        if (zip64) {
            Put16(extra, kZip64ExtraId);
            Put16(extra, 24);
            Put64(extra, info.uncompressedSize);
            Put64(extra, info.compressedSize);
            Put64(extra, info.localHeaderOffset);
        }

        Put32(cd, kCentralSig);
        Put16(cd, zip64 ? 45 : 20);
        Put16(cd, zip64 ? 45 : 20);
        Put16(cd, info.flags);
        Put16(cd, info.method);
        Put16(cd, m_dosTime);
        Put16(cd, m_dosDate);
        Put32(cd, info.crc32);
        Put32(cd, zip64 ? kMax32 : static_cast<std::uint32_t>(info.compressedSize));
        Put32(cd, zip64 ? kMax32 : static_cast<std::uint32_t>(info.uncompressedSize));
        Put16(cd, static_cast<std::uint16_t>(info.name.size()));
        Put16(cd, static_cast<std::uint16_t>(extra.size()));
        Put16(cd, 0);
        Put16(cd, 0);
        Put16(cd, 0);
        Put32(cd, 0);
        Put32(cd, zip64 ? kMax32 : static_cast<std::uint32_t>(info.localHeaderOffset));
        cd += info.name;
        cd += extra;
    }

    writeBytes(cd);

    const std::uint64_t count = m_entries.size();
    const std::uint64_t cdSize = cd.size();

    if (count >= kMax16 || cdOffset >= kMax32 || cdSize >= kMax32) {
        const std::uint64_t recordOffset = m_offset;
        std::string record;
        Put32(record, kZip64EndSig);
        Put64(record, 44);
        Put16(record, 45);
        Put16(record, 45);
        Put32(record, 0);
        Put32(record, 0);
        Put64(record, count);
        Put64(record, count);
        Put64(record, cdSize);
        Put64(record, cdOffset);

        Put32(record, kZip64LocatorSig);
        Put32(record, 0);
        Put64(record, recordOffset);
        Put32(record, 1);
        writeBytes(record);
    }

    std::string end;
    Put32(end, kEndSig);
    Put16(end, 0);
    Put16(end, 0);
    Put16(end, count >= kMax16 ? kMax16 : static_cast<std::uint16_t>(count));
    Put16(end, count >= kMax16 ? kMax16 : static_cast<std::uint16_t>(count));
    Put32(end, Clamp32(cdSize));
    Put32(end, Clamp32(cdOffset));
    Put16(end, 0);
    writeBytes(end);

    m_out.close();
    if (m_out.fail()) {
        throw ZipError("Could not close zip file: " + m_path);
    }
}

} // namespace storykeep::infrastructure
