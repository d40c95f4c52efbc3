/**
 * @file MemoryIndexBackend.cpp
 * @brief Implementation of MemoryIndexBackend.
 */

#include "infrastructure/IndexBackend.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <vector>
#include <zlib.h>

namespace storykeep::infrastructure {

namespace {

// Compressed blobs carry the uncompressed size as a 4-byte little-endian prefix.
constexpr std::size_t kSizePrefix = 4;

std::string Compress(const std::vector<std::uint8_t>& raw) {
    uLongf bound = compressBound(static_cast<uLong>(raw.size()));
    std::string out(kSizePrefix + bound, '\0');

    const std::uint32_t size = static_cast<std::uint32_t>(raw.size());
    for (std::size_t i = 0; i < kSizePrefix; ++i) {
        out[i] = static_cast<char>((size >> (8 * i)) & 0xFF);
    }

    int rc = compress2(reinterpret_cast<Bytef*>(&out[kSizePrefix]), &bound,
                       raw.data(), static_cast<uLong>(raw.size()), Z_BEST_SPEED);
    if (rc != Z_OK) {
        throw domain::StorySourceError("Could not compress index entry.");
    }
    out.resize(kSizePrefix + bound);
    return out;
}

std::vector<std::uint8_t> Decompress(const std::string& blob) {
    if (blob.size() < kSizePrefix) {
        throw domain::StorySourceError("Index entry is corrupt.");
    }

    std::uint32_t size = 0;
    for (std::size_t i = 0; i < kSizePrefix; ++i) {
        size |= static_cast<std::uint32_t>(static_cast<unsigned char>(blob[i])) << (8 * i);
    }

    std::vector<std::uint8_t> raw(size);
    uLongf rawSize = size;
    int rc = uncompress(raw.data(), &rawSize,
                        reinterpret_cast<const Bytef*>(blob.data() + kSizePrefix),
                        static_cast<uLong>(blob.size() - kSizePrefix));
    if (rc != Z_OK || rawSize != size) {
        throw domain::StorySourceError("Index entry is corrupt.");
    }
    return raw;
}

} // namespace

MemoryIndexBackend::MemoryIndexBackend(bool compress) : m_compress(compress) {}

std::string MemoryIndexBackend::encode(const nlohmann::json& meta) const {
    std::vector<std::uint8_t> raw = nlohmann::json::to_msgpack(meta);
    if (m_compress) {
        return Compress(raw);
    }
    return std::string(raw.begin(), raw.end());
}

nlohmann::json MemoryIndexBackend::decode(const std::string& blob) const {
    try {
        if (m_compress) {
            return nlohmann::json::from_msgpack(Decompress(blob));
        }
        return nlohmann::json::from_msgpack(blob);
    } catch (const nlohmann::json::exception& e) {
        throw domain::StorySourceError(std::string("Index entry is corrupt: ") + e.what());
    }
}

void MemoryIndexBackend::insert(const std::vector<EncodedEntry>& batch) {
    for (const auto& entry : batch) {
        m_entries[entry.first] = entry.second;
    }
}

std::optional<nlohmann::json> MemoryIndexBackend::find(std::int64_t key) {
    auto it = m_entries.find(key);
    if (it == m_entries.end()) return std::nullopt;
    return decode(it->second);
}

bool MemoryIndexBackend::contains(std::int64_t key) {
    return m_entries.count(key) > 0;
}

std::vector<std::int64_t> MemoryIndexBackend::keys() {
    std::vector<std::int64_t> result;
    result.reserve(m_entries.size());
    for (const auto& entry : m_entries) {
        result.push_back(entry.first);
    }
    std::sort(result.begin(), result.end());
    return result;
}

void MemoryIndexBackend::close() {
    std::unordered_map<std::int64_t, std::string>().swap(m_entries);
}

} // namespace storykeep::infrastructure
