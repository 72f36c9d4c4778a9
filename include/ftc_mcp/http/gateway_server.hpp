#pragma once

#include <ftc_mcp/core/result.hpp>
#include <ftc_mcp/core/timestamp.hpp>
#include <ftc_mcp/http/request_router.hpp>
#include <ftc_mcp/session/session_store.hpp>
#include <ftc_mcp/upstream/i_upstream_client.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

namespace ftc_mcp {

struct GatewayServerOptions {
    std::string host = "0.0.0.0";
    int port = 3001;            // 0 binds any free port
    size_t thread_count = 8;
    std::chrono::seconds read_timeout{60};
    std::chrono::seconds write_timeout{60};
};

// ---------------------------------------------------------------------------
// GatewayServer — HTTP front end (cpp-httplib).
//
//   POST/GET/DELETE /mcp  -> RequestRouter
//   GET /health           -> liveness and configuration summary
//   OPTIONS *             -> CORS preflight
//
// Every response carries the CORS headers. Requests are served by a worker
// pool of `thread_count` threads.
// ---------------------------------------------------------------------------
class GatewayServer {
public:
    GatewayServer(RequestRouter& router,
                  const SessionStore& store,
                  const IUpstreamClient& upstream,
                  GatewayServerOptions options = {},
                  TimestampFn now = Iso8601Now);
    ~GatewayServer();

    GatewayServer(const GatewayServer&) = delete;
    GatewayServer& operator=(const GatewayServer&) = delete;

    /// Bind the listening socket. Port 0 picks a free port.
    [[nodiscard]] Result<void, Error> Bind();

    /// Serve until Stop() is called. Requires a successful Bind().
    bool Listen();

    void Stop();

    /// Block until the server accepts connections.
    void WaitUntilReady() const;

    /// Bound port (0 before Bind()).
    [[nodiscard]] int Port() const noexcept;

    /// Body of GET /health.
    [[nodiscard]] nlohmann::json HealthJson() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ftc_mcp
