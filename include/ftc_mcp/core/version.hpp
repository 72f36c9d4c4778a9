#pragma once

namespace ftc_mcp {

constexpr const char* kVersion = "1.0.0";
constexpr const char* kServerName = "ftc-platform-mcp";

} // namespace ftc_mcp
