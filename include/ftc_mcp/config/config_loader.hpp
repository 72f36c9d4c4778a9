#pragma once

#include <ftc_mcp/config/app_config.hpp>
#include <ftc_mcp/core/result.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace ftc_mcp {

// Environment lookup; injectable so tests do not touch the process env.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads the process environment. Empty values count as unset.
std::optional<std::string> GetEnv(const std::string& name);

// Read VERCEL_API_BASE_URL, MCP_HOST, MCP_PORT and NODE_ENV.
Result<ConfigOverrides, Error> LoadFromEnv(const EnvLookup& env = GetEnv);

// Parse a YAML config file.
Result<ConfigOverrides, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments. "-v" enables info logging, "-vv" debug logging.
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv);

// Apply every set field of `overrides` on top of `config`.
void ApplyOverrides(AppConfig& config, const ConfigOverrides& overrides);

// If api_key is empty, read it from the variable named by api_key_env.
AppConfig ResolveApiKeyEnv(AppConfig config, const EnvLookup& env = GetEnv);

// Validate that required fields are present and values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

// Defaults < environment < YAML (--config) < CLI, then resolve and validate.
Result<AppConfig, Error> LoadConfig(int argc, const char* const* argv,
                                    const EnvLookup& env = GetEnv);

// API key for log output: first two characters, the rest masked.
std::string MaskSecret(std::string_view secret);

} // namespace ftc_mcp
