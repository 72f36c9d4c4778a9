#pragma once

#include <optional>
#include <string>

namespace ftc_mcp {

struct UpstreamConfig {
    std::string base_url = "http://localhost:3000/api/mastra";
    std::string api_key;
    std::string api_key_env = "MASTRA_API_KEY"; // env var name to read the key from
    int connect_timeout_seconds = 10;
    int read_timeout_seconds = 60;
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 3001;
    int thread_count = 8;
    int session_idle_timeout_seconds = 3600;  // 0 keeps idle sessions forever
};

struct AppConfig {
    UpstreamConfig upstream;
    ServerConfig server;
    std::string environment = "development";
    std::string log_format = "color";
    bool verbose = false;
    bool debug = false;
};

// Partial configuration from one source. Unset fields leave the value from
// lower-precedence sources untouched.
struct ConfigOverrides {
    std::optional<std::string> base_url;
    std::optional<std::string> api_key;
    std::optional<std::string> api_key_env;
    std::optional<int> connect_timeout_seconds;
    std::optional<int> read_timeout_seconds;
    std::optional<std::string> host;
    std::optional<int> port;
    std::optional<int> thread_count;
    std::optional<int> session_idle_timeout_seconds;
    std::optional<std::string> environment;
    std::optional<std::string> log_format;
    std::optional<bool> verbose;
    std::optional<bool> debug;
};

struct CliOptions {
    std::optional<std::string> config_path;
    ConfigOverrides overrides;
};

} // namespace ftc_mcp
