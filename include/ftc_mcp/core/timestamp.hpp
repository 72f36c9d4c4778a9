#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace ftc_mcp {

// UTC timestamp with millisecond precision, e.g. "2024-05-01T12:00:00.123Z".
std::string Iso8601(std::chrono::system_clock::time_point tp);
std::string Iso8601Now();

// Source of "now" timestamps; injectable so tests can pin the clock.
using TimestampFn = std::function<std::string()>;

} // namespace ftc_mcp
