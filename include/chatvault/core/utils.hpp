#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "chatvault/core/types.hpp"

namespace chatvault::utils {

auto generate_id(std::size_t length = 16) -> std::string;
auto generate_uuid() -> std::string;

/// Current time floored to microseconds, the precision kept on disk.
auto now() -> Timestamp;
auto timestamp_ms() -> int64_t;

/// Formats as "2026-01-31T12:34:56.123456Z".
auto format_iso8601(Timestamp ts) -> std::string;

/// Accepts "YYYY-MM-DDTHH:MM:SS[.ffffff][Z|+00:00]". Returns nullopt on
/// malformed input.
auto parse_iso8601(std::string_view text) -> std::optional<Timestamp>;

auto trim(std::string_view s) -> std::string;
auto split(std::string_view s, char delim) -> std::vector<std::string>;
auto to_lower(std::string_view s) -> std::string;
auto contains_icase(std::string_view haystack, std::string_view needle) -> bool;
auto sha256(std::string_view data) -> std::string;

} // namespace chatvault::utils
