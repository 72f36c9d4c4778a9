#pragma once

#include <ftc_mcp/core/result.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ftc_mcp {

using DotEnvEntries = std::vector<std::pair<std::string, std::string>>;

// Parse .env content: KEY=VALUE lines, '#' comments, optional "export "
// prefix, single or double quoted values. Malformed lines are skipped.
DotEnvEntries ParseDotEnv(std::string_view content);

// Load a .env file into the process environment without overwriting
// variables that are already set. A missing file is not an error.
// Returns the number of variables set.
Result<size_t, Error> LoadDotEnv(std::string_view path);

} // namespace ftc_mcp
