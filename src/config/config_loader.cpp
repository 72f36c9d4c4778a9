#include <ftc_mcp/config/config_loader.hpp>

#include <ftc_mcp/core/log.hpp>
#include <ftc_mcp/core/types.hpp>
#include <ftc_mcp/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <charconv>
#include <cstdlib>
#include <exception>
#include <vector>

namespace ftc_mcp {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Configuration};
}

Result<int, Error> ParseIntValue(const std::string& name, const std::string& text) {
    int value = 0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return Result<int, Error>::Err(
            MakeConfigError("Invalid " + name + ": '" + text + "' is not an integer"));
    }
    return Result<int, Error>::Ok(value);
}

template <typename T>
void ReadScalar(const YAML::Node& node, const char* key, std::optional<T>& out) {
    if (node[key]) {
        out = node[key].template as<T>();
    }
}

} // anonymous namespace

std::optional<std::string> GetEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

// ---------------------------------------------------------------------------
// LoadFromEnv
// ---------------------------------------------------------------------------
Result<ConfigOverrides, Error> LoadFromEnv(const EnvLookup& env) {
    ConfigOverrides overrides;
    overrides.base_url = env("VERCEL_API_BASE_URL");
    overrides.host = env("MCP_HOST");
    overrides.environment = env("NODE_ENV");
    if (auto port = env("MCP_PORT")) {
        auto parsed = ParseIntValue("MCP_PORT", *port);
        if (parsed.IsErr()) {
            return Result<ConfigOverrides, Error>::Err(parsed.Error());
        }
        overrides.port = parsed.Value();
    }
    return Result<ConfigOverrides, Error>::Ok(std::move(overrides));
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<ConfigOverrides, Error> LoadFromYaml(std::string_view file_path) {
    ConfigOverrides overrides;
    try {
        const YAML::Node root = YAML::LoadFile(std::string(file_path));

        // -- Upstream --
        if (const auto upstream = root["upstream"]) {
            ReadScalar(upstream, "base_url", overrides.base_url);
            ReadScalar(upstream, "api_key", overrides.api_key);
            ReadScalar(upstream, "api_key_env", overrides.api_key_env);
            ReadScalar(upstream, "connect_timeout", overrides.connect_timeout_seconds);
            ReadScalar(upstream, "read_timeout", overrides.read_timeout_seconds);
        }

        // -- Server --
        if (const auto server = root["server"]) {
            ReadScalar(server, "host", overrides.host);
            ReadScalar(server, "port", overrides.port);
            ReadScalar(server, "threads", overrides.thread_count);
            ReadScalar(server, "session_idle_timeout", overrides.session_idle_timeout_seconds);
        }

        // -- Options --
        ReadScalar(root, "environment", overrides.environment);
        ReadScalar(root, "log_format", overrides.log_format);
        ReadScalar(root, "verbose", overrides.verbose);
        ReadScalar(root, "debug", overrides.debug);
    } catch (const YAML::Exception& e) {
        return Result<ConfigOverrides, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }
    return Result<ConfigOverrides, Error>::Ok(std::move(overrides));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv) {
    CliOptions options;

    // "-vv" is not a flag argparse can express next to "-v"; strip it first.
    std::vector<std::string> args;
    for (int i = 0; i < argc; ++i) {
        const std::string arg = argv[i];
        if (i > 0 && arg == "-vv") {
            options.overrides.debug = true;
            continue;
        }
        args.push_back(arg);
    }

    // --version is answered by main before configuration is loaded; "-v"
    // stays free for verbosity.
    argparse::ArgumentParser program("ftc-mcp", kVersion,
                                     argparse::default_arguments::help);

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");

    // Upstream flags
    program.add_argument("--base-url")
        .help("FTC Platform API base URL");
    program.add_argument("--api-key")
        .help("API key for the FTC Platform API");
    program.add_argument("--api-key-env")
        .help("Environment variable containing the API key");
    program.add_argument("--timeout")
        .help("Upstream read timeout in seconds")
        .scan<'i', int>();

    // Server flags
    program.add_argument("--host")
        .help("Listen address");
    program.add_argument("--port")
        .help("Listen port")
        .scan<'i', int>();
    program.add_argument("--threads")
        .help("HTTP worker threads")
        .scan<'i', int>();
    program.add_argument("--session-idle-timeout")
        .help("Seconds before an idle session is dropped (0 = never)")
        .scan<'i', int>();

    // Options
    program.add_argument("--log-format")
        .help("Log format: color or json");
    program.add_argument("-v", "--verbose")
        .help("Verbose logging (-vv for debug)")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(args);
    } catch (const std::exception& e) {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    options.config_path = program.present("--config");

    auto& o = options.overrides;
    o.base_url = program.present("--base-url");
    o.api_key = program.present("--api-key");
    o.api_key_env = program.present("--api-key-env");
    o.read_timeout_seconds = program.present<int>("--timeout");
    o.host = program.present("--host");
    o.port = program.present<int>("--port");
    o.thread_count = program.present<int>("--threads");
    o.session_idle_timeout_seconds = program.present<int>("--session-idle-timeout");
    o.log_format = program.present("--log-format");
    if (program.get<bool>("--verbose")) {
        o.verbose = true;
    }

    return Result<CliOptions, Error>::Ok(std::move(options));
}

// ---------------------------------------------------------------------------
// ApplyOverrides
// ---------------------------------------------------------------------------
void ApplyOverrides(AppConfig& config, const ConfigOverrides& overrides) {
    if (overrides.base_url) config.upstream.base_url = *overrides.base_url;
    if (overrides.api_key) config.upstream.api_key = *overrides.api_key;
    if (overrides.api_key_env) config.upstream.api_key_env = *overrides.api_key_env;
    if (overrides.connect_timeout_seconds) {
        config.upstream.connect_timeout_seconds = *overrides.connect_timeout_seconds;
    }
    if (overrides.read_timeout_seconds) {
        config.upstream.read_timeout_seconds = *overrides.read_timeout_seconds;
    }
    if (overrides.host) config.server.host = *overrides.host;
    if (overrides.port) config.server.port = *overrides.port;
    if (overrides.thread_count) config.server.thread_count = *overrides.thread_count;
    if (overrides.session_idle_timeout_seconds) {
        config.server.session_idle_timeout_seconds = *overrides.session_idle_timeout_seconds;
    }
    if (overrides.environment) config.environment = *overrides.environment;
    if (overrides.log_format) config.log_format = *overrides.log_format;
    if (overrides.verbose) config.verbose = *overrides.verbose;
    if (overrides.debug) config.debug = *overrides.debug;
}

// ---------------------------------------------------------------------------
// ResolveApiKeyEnv
// ---------------------------------------------------------------------------
AppConfig ResolveApiKeyEnv(AppConfig config, const EnvLookup& env) {
    if (config.upstream.api_key.empty() && !config.upstream.api_key_env.empty()) {
        if (auto key = env(config.upstream.api_key_env)) {
            config.upstream.api_key = *key;
        }
    }
    return config;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.upstream.base_url.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: base_url"));
    }
    auto url = BaseUrl::Create(config.upstream.base_url);
    if (url.IsErr()) {
        return Result<void, Error>::Err(
            MakeConfigError("Invalid base_url: " + url.Error()));
    }
    if (config.upstream.api_key.empty()) {
        return Result<void, Error>::Err(MakeConfigError(
            config.upstream.api_key_env + " environment variable is required"));
    }
    if (config.upstream.connect_timeout_seconds <= 0 ||
        config.upstream.read_timeout_seconds <= 0) {
        return Result<void, Error>::Err(MakeConfigError("Timeouts must be positive"));
    }
    if (config.server.port <= 0 || config.server.port > 65535) {
        return Result<void, Error>::Err(
            MakeConfigError("Invalid port: " + std::to_string(config.server.port)));
    }
    if (config.server.thread_count <= 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "Thread count must be positive, got " +
            std::to_string(config.server.thread_count)));
    }
    if (config.server.session_idle_timeout_seconds < 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "Session idle timeout must not be negative, got " +
            std::to_string(config.server.session_idle_timeout_seconds)));
    }
    if (!ParseLogFormat(config.log_format).has_value()) {
        return Result<void, Error>::Err(
            MakeConfigError("Unknown log format: " + config.log_format));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// LoadConfig
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadConfig(int argc, const char* const* argv,
                                    const EnvLookup& env) {
    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        return Result<AppConfig, Error>::Err(cli.Error());
    }

    AppConfig config;

    auto from_env = LoadFromEnv(env);
    if (from_env.IsErr()) {
        return Result<AppConfig, Error>::Err(from_env.Error());
    }
    ApplyOverrides(config, from_env.Value());

    if (const auto& path = cli.Value().config_path) {
        auto from_yaml = LoadFromYaml(*path);
        if (from_yaml.IsErr()) {
            return Result<AppConfig, Error>::Err(from_yaml.Error());
        }
        ApplyOverrides(config, from_yaml.Value());
    }

    ApplyOverrides(config, cli.Value().overrides);
    config = ResolveApiKeyEnv(std::move(config), env);

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        return Result<AppConfig, Error>::Err(valid.Error());
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

std::string MaskSecret(std::string_view secret) {
    if (secret.size() <= 4) {
        return std::string(8, '*');
    }
    return std::string(secret.substr(0, 2)) + std::string(8, '*');
}

} // namespace ftc_mcp
