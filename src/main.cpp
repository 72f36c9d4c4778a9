#include <ftc_mcp/config/config_loader.hpp>
#include <ftc_mcp/config/dotenv.hpp>
#include <ftc_mcp/core/log.hpp>
#include <ftc_mcp/core/terminal.hpp>
#include <ftc_mcp/core/types.hpp>
#include <ftc_mcp/core/version.hpp>
#include <ftc_mcp/http/gateway_server.hpp>
#include <ftc_mcp/http/request_router.hpp>
#include <ftc_mcp/mcp/mcp_session.hpp>
#include <ftc_mcp/mcp/tool_dispatcher.hpp>
#include <ftc_mcp/mcp/tool_registry.hpp>
#include <ftc_mcp/session/session_store.hpp>
#include <ftc_mcp/upstream/api_client.hpp>
#include <ftc_mcp/upstream/http_session.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <thread>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitConfiguration = 2;
constexpr int kExitInternal = 99;

std::atomic<bool> g_shutdown_requested{false};
std::atomic<int> g_shutdown_signal{0};

void HandleShutdownSignal(int sig) {
    g_shutdown_signal.store(sig);
    g_shutdown_requested.store(true);
}

void InitLogging(const ftc_mcp::AppConfig& config) {
    using namespace ftc_mcp;
    auto level = LogLevel::Warn;
    if (config.debug) {
        level = LogLevel::Debug;
    } else if (config.verbose) {
        level = LogLevel::Info;
    }
    const auto format = ParseLogFormat(config.log_format).value_or(LogFormat::Color);
    InitGlobalLogger(MakeLogSink(format, ResolveLogColor(std::nullopt)), level);
}

void LogConfigurationSummary(const ftc_mcp::AppConfig& config) {
    using namespace ftc_mcp;
    LogInfo("main", std::string(kServerName) + " " + kVersion + " starting");
    LogInfo("main", "API Base URL: " + config.upstream.base_url);
    LogInfo("main", "API Key: " + MaskSecret(config.upstream.api_key) + " (configured)");
    LogInfo("main", "Environment: " + config.environment);
    LogInfo("main", "Session idle timeout: " +
                        std::to_string(config.server.session_idle_timeout_seconds) + "s");
    LogInfo("main", "Listen: " + config.server.host + ":" +
                        std::to_string(config.server.port));
}

int Run(const ftc_mcp::AppConfig& config) {
    using namespace ftc_mcp;

    auto base_url = BaseUrl::Create(config.upstream.base_url);
    if (base_url.IsErr()) {
        LogError("main", "Invalid base URL: " + base_url.Error());
        return kExitConfiguration;
    }

    HttpSessionOptions http_options;
    http_options.connect_timeout =
        std::chrono::seconds{config.upstream.connect_timeout_seconds};
    http_options.read_timeout = std::chrono::seconds{config.upstream.read_timeout_seconds};
    HttpSession http(base_url.Value(), config.upstream.api_key, http_options);

    ApiClient upstream(http, config.upstream.base_url, !config.upstream.api_key.empty());
    const auto registry = ToolRegistry::Builtin();
    const ToolDispatcher dispatcher(registry, upstream);

    SessionStore store([&dispatcher](const std::string& id, SessionEventChannel& events) {
        return std::make_unique<McpSession>(id, dispatcher, events);
    });
    store.SetIdleTimeout(std::chrono::seconds{config.server.session_idle_timeout_seconds});
    store.Start();

    RequestRouter router(store);

    GatewayServerOptions server_options;
    server_options.host = config.server.host;
    server_options.port = config.server.port;
    server_options.thread_count = static_cast<size_t>(config.server.thread_count);
    GatewayServer server(router, store, upstream, server_options);

    auto bound = server.Bind();
    if (bound.IsErr()) {
        LogError("main", bound.Error().ToString());
        store.Stop();
        return kExitConfiguration;
    }

    std::signal(SIGINT, HandleShutdownSignal);
    std::signal(SIGTERM, HandleShutdownSignal);

    std::atomic<bool> listening_done{false};
    std::thread shutdown_watcher([&] {
        while (!listening_done.load()) {
            if (g_shutdown_requested.load()) {
                LogInfo("main", "Received signal " +
                                    std::to_string(g_shutdown_signal.load()) +
                                    ", shutting down gracefully");
                server.Stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    std::cout << kServerName << " " << kVersion << " listening on "
              << config.server.host << ":" << server.Port()
              << " (POST /mcp, GET /health)" << std::endl;
    const bool clean = server.Listen();

    listening_done.store(true);
    shutdown_watcher.join();

    store.CloseAll();
    store.Stop();
    LogInfo("main", "Shutdown complete");
    return clean ? kExitSuccess : kExitInternal;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace ftc_mcp;

    // Startup logging until the configured format and level are known.
    InitGlobalLogger(MakeLogSink(LogFormat::Color, ResolveLogColor(std::nullopt)),
                     LogLevel::Warn);

    for (int i = 1; i < argc; ++i) {
        if (std::string_view{argv[i]} == "--version") {
            std::cout << kServerName << " " << kVersion << std::endl;
            return kExitSuccess;
        }
    }

    try {
        auto dotenv = LoadDotEnv(".env");
        if (dotenv.IsErr()) {
            LogError("config", dotenv.Error().ToString());
            return kExitConfiguration;
        }

        auto config = LoadConfig(argc, argv);
        if (config.IsErr()) {
            LogError("config", "MCP Server configuration invalid: " +
                                   config.Error().message);
            return kExitConfiguration;
        }

        InitLogging(config.Value());
        LogConfigurationSummary(config.Value());
        return Run(config.Value());
    } catch (const std::exception& e) {
        LogError("main", std::string("Fatal: ") + e.what());
        return kExitInternal;
    }
}
