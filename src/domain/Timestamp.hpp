/**
 * @file Timestamp.hpp
 * @brief UTC timestamp parsing and formatting for story meta.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace storykeep::domain {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Reads a timestamp from a meta value.
 *
 * Numbers are Unix seconds; strings are ISO-8601 with an optional
 * fractional part and a `Z` or `+HH:MM` offset.
 * @return The timestamp, or nullopt if the value is null or unparseable.
 */
std::optional<Timestamp> ParseTimestamp(const nlohmann::json& value);

/** @brief Parses an ISO-8601 string. */
std::optional<Timestamp> ParseIsoTimestamp(const std::string& text);

/** @brief Formats as `YYYY-MM-DDTHH:MM:SS+00:00`, truncated to whole seconds. */
std::string FormatTimestamp(Timestamp timestamp);

/** @brief Formats as `YYYYMMDD`. */
std::string FormatDateStamp(Timestamp timestamp);

} // namespace storykeep::domain
