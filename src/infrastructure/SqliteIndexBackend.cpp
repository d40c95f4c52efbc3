/**
 * @file SqliteIndexBackend.cpp
 * @brief Implementation of SqliteIndexBackend.
 */

#include "infrastructure/IndexBackend.hpp"
#include "domain/Errors.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <sqlite3.h>

namespace storykeep::infrastructure {

namespace fs = std::filesystem;

namespace {

std::atomic<unsigned> g_databaseCounter{0};

} // namespace

SqliteIndexBackend::SqliteIndexBackend(const std::string& directory) {
    try {
        fs::create_directories(directory);
    } catch (const fs::filesystem_error& e) {
        throw domain::StorySourceError(std::string("Could not create index cache directory: ") + e.what());
    }

    // Unique per process and instance: index.<timestamp>.<n>.sqlite3
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path dbPath = fs::path(directory) /
        ("index." + std::to_string(timestamp) + "." + std::to_string(g_databaseCounter++) + ".sqlite3");
    m_path = dbPath.string();

    int rc = sqlite3_open(m_path.c_str(), &m_db);
    if (rc != SQLITE_OK) {
        std::string message = m_db ? sqlite3_errmsg(m_db) : "out of memory";
        sqlite3_close(m_db);
        m_db = nullptr;
        throw domain::StorySourceError("Failed to open index database: " + message);
    }

    try {
        exec("PRAGMA journal_mode=OFF");
        exec("PRAGMA synchronous=OFF");
        exec("CREATE TABLE story (key INTEGER PRIMARY KEY, meta BLOB NOT NULL)");
        m_insert = prepare("INSERT OR REPLACE INTO story (key, meta) VALUES (?, ?)");
        m_select = prepare("SELECT meta FROM story WHERE key = ?");
    } catch (...) {
        close();
        throw;
    }
}

SqliteIndexBackend::~SqliteIndexBackend() {
    close();
}

void SqliteIndexBackend::fail(const std::string& what) {
    std::string message = m_db ? sqlite3_errmsg(m_db) : "database is closed";
    throw domain::StorySourceError(what + ": " + message);
}

void SqliteIndexBackend::exec(const char* sql) {
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string error = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        throw domain::StorySourceError("SQL execution failed: " + error);
    }
}

sqlite3_stmt* SqliteIndexBackend::prepare(const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        fail("Failed to prepare statement");
    }
    return stmt;
}

std::string SqliteIndexBackend::encode(const nlohmann::json& meta) const {
    std::vector<std::uint8_t> raw = nlohmann::json::to_msgpack(meta);
    return std::string(raw.begin(), raw.end());
}

void SqliteIndexBackend::insert(const std::vector<EncodedEntry>& batch) {
    if (!m_db) fail("Failed to insert index batch");

    exec("BEGIN");
    for (const auto& entry : batch) {
        sqlite3_reset(m_insert);
        sqlite3_bind_int64(m_insert, 1, entry.first);
        sqlite3_bind_blob(m_insert, 2, entry.second.data(), static_cast<int>(entry.second.size()), SQLITE_STATIC);

        if (sqlite3_step(m_insert) != SQLITE_DONE) {
            std::string message = sqlite3_errmsg(m_db);
            sqlite3_exec(m_db, "ROLLBACK", nullptr, nullptr, nullptr);
            throw domain::StorySourceError("Failed to insert story " + std::to_string(entry.first) + ": " + message);
        }
    }
    sqlite3_reset(m_insert);
    sqlite3_clear_bindings(m_insert);
    exec("COMMIT");
}

std::optional<nlohmann::json> SqliteIndexBackend::find(std::int64_t key) {
    if (!m_db) fail("Failed to query index");

    sqlite3_reset(m_select);
    sqlite3_bind_int64(m_select, 1, key);

    int rc = sqlite3_step(m_select);
    if (rc == SQLITE_DONE) {
        sqlite3_reset(m_select);
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        fail("Failed to query story " + std::to_string(key));
    }

    const auto* blob = static_cast<const std::uint8_t*>(sqlite3_column_blob(m_select, 0));
    int size = sqlite3_column_bytes(m_select, 0);
    std::vector<std::uint8_t> raw(blob, blob + size);
    sqlite3_reset(m_select);

    try {
        return nlohmann::json::from_msgpack(raw);
    } catch (const nlohmann::json::exception& e) {
        throw domain::StorySourceError(std::string("Index entry is corrupt: ") + e.what());
    }
}

bool SqliteIndexBackend::contains(std::int64_t key) {
    if (!m_db) fail("Failed to query index");

    sqlite3_stmt* stmt = prepare("SELECT 1 FROM story WHERE key = ?");
    sqlite3_bind_int64(stmt, 1, key);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        fail("Failed to query story " + std::to_string(key));
    }
    return rc == SQLITE_ROW;
}

std::vector<std::int64_t> SqliteIndexBackend::keys() {
    if (!m_db) fail("Failed to list index");

    std::vector<std::int64_t> result;
    sqlite3_stmt* stmt = prepare("SELECT key FROM story ORDER BY key");

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        result.push_back(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        fail("Failed to list index");
    }
    return result;
}

std::size_t SqliteIndexBackend::size() {
    if (!m_db) return 0;

    sqlite3_stmt* stmt = prepare("SELECT COUNT(*) FROM story");
    std::size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return count;
}

void SqliteIndexBackend::close() {
    if (m_insert) {
        sqlite3_finalize(m_insert);
        m_insert = nullptr;
    }
    if (m_select) {
        sqlite3_finalize(m_select);
        m_select = nullptr;
    }
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
    if (!m_path.empty()) {
        std::error_code ec;
        fs::remove(m_path, ec);
        if (ec) {
            std::cerr << "[SqliteIndexBackend] Could not remove " << m_path << ": " << ec.message() << std::endl;
        }
        m_path.clear();
    }
}

} // namespace storykeep::infrastructure
