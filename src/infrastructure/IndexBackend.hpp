/**
 * @file IndexBackend.hpp
 * @brief Storage strategies for a loaded archive index (key -> meta).
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

struct sqlite3;
struct sqlite3_stmt;

namespace storykeep::infrastructure {

/** @brief One encoded index entry, ready to be stored. */
using EncodedEntry = std::pair<std::int64_t, std::string>;

/**
 * @class IndexBackend
 * @brief Read-only key -> meta store filled once while an index is loaded.
 *
 * encode() must be safe to call from worker threads; every other method is
 * only called from the thread owning the backend.
 */
class IndexBackend {
public:
    virtual ~IndexBackend() = default;

    /** @brief Converts meta to the stored representation. */
    virtual std::string encode(const nlohmann::json& meta) const = 0;

    /** @brief Stores a batch of encoded entries. Later keys replace earlier ones. */
    virtual void insert(const std::vector<EncodedEntry>& batch) = 0;

    /** @brief Decodes the meta for a key, or nullopt if absent. */
    virtual std::optional<nlohmann::json> find(std::int64_t key) = 0;

    virtual bool contains(std::int64_t key) = 0;

    /** @brief All stored keys in ascending order. */
    virtual std::vector<std::int64_t> keys() = 0;

    virtual std::size_t size() = 0;

    /** @brief Frees all stored entries. */
    virtual void close() = 0;

    /** @brief Short name used in diagnostics. */
    virtual std::string name() const = 0;
};

/**
 * @class MemoryIndexBackend
 * @brief Keeps entries in memory as msgpack, optionally zlib-compressed.
 */
class MemoryIndexBackend : public IndexBackend {
public:
    explicit MemoryIndexBackend(bool compress = false);

    std::string encode(const nlohmann::json& meta) const override;
    void insert(const std::vector<EncodedEntry>& batch) override;
    std::optional<nlohmann::json> find(std::int64_t key) override;
    bool contains(std::int64_t key) override;
    std::vector<std::int64_t> keys() override;
    std::size_t size() override { return m_entries.size(); }
    void close() override;
    std::string name() const override { return m_compress ? "compressed" : "memory"; }

private:
    nlohmann::json decode(const std::string& blob) const;

    bool m_compress;
    std::unordered_map<std::int64_t, std::string> m_entries;
};

/**
 * @class SqliteIndexBackend
 * @brief Persists entries as msgpack blobs in a temporary SQLite database.
 *
 * The database file is created under the given directory and removed on close.
 */
class SqliteIndexBackend : public IndexBackend {
public:
    /** @throws StorySourceError If the database cannot be created. */
    explicit SqliteIndexBackend(const std::string& directory);
    ~SqliteIndexBackend() override;

    SqliteIndexBackend(const SqliteIndexBackend&) = delete;
    SqliteIndexBackend& operator=(const SqliteIndexBackend&) = delete;

    std::string encode(const nlohmann::json& meta) const override;
    void insert(const std::vector<EncodedEntry>& batch) override;
    std::optional<nlohmann::json> find(std::int64_t key) override;
    bool contains(std::int64_t key) override;
    std::vector<std::int64_t> keys() override;
    std::size_t size() override;
    void close() override;
    std::string name() const override { return "sqlite"; }

    const std::string& path() const { return m_path; }

private:
    void exec(const char* sql);
    sqlite3_stmt* prepare(const char* sql);
    [[noreturn]] void fail(const std::string& what);

    std::string m_path;
    sqlite3* m_db = nullptr;
    sqlite3_stmt* m_insert = nullptr;
    sqlite3_stmt* m_select = nullptr;
};

} // namespace storykeep::infrastructure
