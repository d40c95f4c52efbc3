/**
 * @file IndexLoader.cpp
 * @brief Implementation of IndexLoader.
 */

#include "infrastructure/IndexLoader.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <exception>
#include <thread>

namespace storykeep::infrastructure {

namespace {

std::string Strip(const std::string& text, const char* chars) {
    std::size_t start = text.find_first_not_of(chars);
    if (start == std::string::npos) return {};
    std::size_t end = text.find_last_not_of(chars);
    return text.substr(start, end - start + 1);
}

std::string Preview(const std::string& line) {
    constexpr std::size_t kMax = 40;
    return line.size() <= kMax ? line : line.substr(0, kMax) + "...";
}

} // namespace

IndexLoader::IndexLoader(IndexBackend& backend, std::size_t workers, std::size_t batchSize)
    : m_backend(backend), m_workers(workers), m_batchSize(std::max<std::size_t>(batchSize, 1)) {
    if (m_workers == 0) {
        m_workers = std::max(1u, std::thread::hardware_concurrency());
    }
}

bool IndexLoader::SplitLine(const std::string& line, std::string& key, std::string& fragment) {
    bool quoted = false;
    bool escaped = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (escaped) {
            escaped = false;
        } else if (c == '\\' && quoted) {
            escaped = true;
        } else if (c == '"') {
            quoted = !quoted;
        } else if (c == ':' && !quoted) {
            key = Strip(line.substr(0, i), " \t\r\n\"");
            fragment = Strip(Strip(line.substr(i + 1), " \t\r\n"), ", \t\r\n");
            return true;
        }
    }
    return false;
}

std::pair<std::int64_t, nlohmann::json> IndexLoader::ParseLine(const std::string& line) {
    std::string key;
    std::string fragment;

    if (!SplitLine(line, key, fragment)) {
        throw domain::StorySourceError("Index line is malformed: " + Preview(line));
    }

    if (key.empty() || key.size() > 18 ||
        !std::all_of(key.begin(), key.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw domain::StorySourceError("Index contains an invalid key: " + Preview(key));
    }
    const std::int64_t parsedKey = std::stoll(key);

    if (fragment.empty() || fragment.front() != '{' || fragment.back() != '}') {
        throw domain::StorySourceError("Index entry for story " + key + " is not an object.");
    }

    try {
        return {parsedKey, nlohmann::json::parse(fragment)};
    } catch (const nlohmann::json::parse_error& e) {
        throw domain::StorySourceError("Index entry for story " + key + " is not valid JSON: " + e.what());
    }
}

std::size_t IndexLoader::load(ZipEntryStream& stream) {
    std::vector<std::vector<std::string>> batches;
    std::vector<std::string> current;
    std::string line;
    std::size_t count = 0;
    bool opened = false;
    bool closed = false;

    while (stream.readLine(line)) {
        std::string trimmed = Strip(line, " \t\r\n");
        if (trimmed.empty()) continue;

        if (closed) {
            throw domain::StorySourceError("Index has content after its closing brace.");
        }
        if (!opened) {
            if (trimmed == "{}") {
                opened = closed = true;
            } else if (trimmed == "{") {
                opened = true;
            } else {
                throw domain::StorySourceError("Index is not valid JSON.");
            }
            continue;
        }
        if (trimmed == "}") {
            closed = true;
            continue;
        }

        current.push_back(std::move(trimmed));
        ++count;

        if (current.size() >= m_batchSize) {
            batches.push_back(std::move(current));
            current.clear();
            if (batches.size() >= m_workers) {
                flush(batches);
            }
        }
    }

    if (!current.empty()) {
        batches.push_back(std::move(current));
    }
    flush(batches);

    if (!closed) {
        throw domain::StorySourceError("Index is not valid JSON.");
    }
    return count;
}

void IndexLoader::flush(std::vector<std::vector<std::string>>& batches) {
    if (batches.empty()) return;

    std::vector<std::vector<EncodedEntry>> results(batches.size());
    std::vector<std::exception_ptr> errors(batches.size());
    std::vector<std::thread> threads;
    threads.reserve(batches.size());

    for (std::size_t i = 0; i < batches.size(); ++i) {
        threads.emplace_back([this, &batches, &results, &errors, i]() {
            try {
                auto& out = results[i];
                out.reserve(batches[i].size());
                for (const auto& line : batches[i]) {
                    auto parsed = ParseLine(line);
                    out.emplace_back(parsed.first, m_backend.encode(parsed.second));
                }
            } catch (...) {
                errors[i] = std::current_exception();
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }
    batches.clear();

    // First failing batch in input order wins.
    for (const auto& error : errors) {
        if (error) std::rethrow_exception(error);
    }
    for (const auto& result : results) {
        m_backend.insert(result);
    }
}

} // namespace storykeep::infrastructure
