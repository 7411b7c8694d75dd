#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "types.hpp"

namespace mcp_remote::clock {

Timestamp now();

int64_t to_unix_seconds(const Timestamp& ts);

Timestamp from_unix_seconds(int64_t seconds);

// RFC 3339 / ISO-8601 in UTC, e.g. "2025-03-01T12:00:00.250Z"
std::string format_iso8601(const Timestamp& ts);

// Accepts "YYYY-MM-DDTHH:MM:SS[.fraction](Z|+HH:MM|-HH:MM)"
std::optional<Timestamp> parse_iso8601(const std::string& text);

}  // namespace mcp_remote::clock
