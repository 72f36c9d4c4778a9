#pragma once

#include <string>
#include <string_view>

namespace ftc_mcp {

// Percent-encode a string per RFC 3986.
// Unreserved characters (alphanumeric, '-', '_', '.', '~') pass through;
// everything else is replaced with %XX (uppercase hex).
std::string UrlEncode(std::string_view value);

// Join a path template's segments with encoded values, e.g.
// EventPath("abc", "applications") -> "/events/abc/applications".
std::string EventPath(std::string_view event_id, std::string_view resource);

} // namespace ftc_mcp
