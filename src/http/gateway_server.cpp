#include <ftc_mcp/http/gateway_server.hpp>

#include <ftc_mcp/core/log.hpp>
#include <ftc_mcp/core/version.hpp>

#include <httplib.h>

#include <exception>

namespace ftc_mcp {

namespace {

constexpr const char* kJsonContentType = "application/json";

void ApplyCorsHeaders(httplib::Response& res) {
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Expose-Headers", kSessionIdHeader);
}

void WriteJson(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                    kJsonContentType);
}

RouterRequest ToRouterRequest(const httplib::Request& req) {
    RouterRequest request;
    request.method = req.method;
    if (req.has_header(kSessionIdHeader)) {
        auto value = req.get_header_value(kSessionIdHeader);
        if (!value.empty()) {
            request.session_id = std::move(value);
        }
    }
    request.body = req.body;
    return request;
}

void ApplyRouterResponse(const RouterResponse& response, httplib::Response& res) {
    for (const auto& [key, value] : response.headers) {
        res.set_header(key, value);
    }
    if (response.session_id.has_value()) {
        res.set_header(kSessionIdHeader, *response.session_id);
    }
    if (response.body.has_value()) {
        WriteJson(res, response.status, *response.body);
    } else {
        res.status = response.status;
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl — owns the httplib server and its route table.
// ---------------------------------------------------------------------------
struct GatewayServer::Impl {
    RequestRouter& router;
    const SessionStore& store;
    const IUpstreamClient& upstream;
    GatewayServerOptions options;
    TimestampFn now;
    httplib::Server server;
    int bound_port = 0;

    Impl(RequestRouter& r, const SessionStore& s, const IUpstreamClient& u,
         GatewayServerOptions opts, TimestampFn clock)
        : router(r), store(s), upstream(u),
          options(std::move(opts)), now(std::move(clock)) {
        const size_t threads = options.thread_count > 0 ? options.thread_count : 1;
        server.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
        server.set_read_timeout(options.read_timeout);
        server.set_write_timeout(options.write_timeout);
        RegisterRoutes();
    }

    nlohmann::json Health() const {
        return {
            {"status", "ok"},
            {"timestamp", now()},
            {"server", kServerName},
            {"version", kVersion},
            {"apiClient", upstream.Status().ToJson()},
            {"activeSessions", store.Size()}
        };
    }

    void HandleMcp(const httplib::Request& req, httplib::Response& res) {
        ApplyRouterResponse(router.Route(ToRouterRequest(req)), res);
    }

    void RegisterRoutes() {
        server.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            WriteJson(res, 200, Health());
        });

        const auto mcp = [this](const httplib::Request& req, httplib::Response& res) {
            HandleMcp(req, res);
        };
        server.Post("/mcp", mcp);
        server.Get("/mcp", mcp);
        server.Delete("/mcp", mcp);

        server.Options(R"(/.*)", [](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Methods", "GET, POST, DELETE, OPTIONS");
            res.set_header("Access-Control-Allow-Headers",
                           "Content-Type, mcp-session-id, Authorization");
            res.status = 204;
        });

        server.set_post_routing_handler(
            [](const httplib::Request&, httplib::Response& res) {
                ApplyCorsHeaders(res);
            });

        server.set_exception_handler(
            [](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
                std::string message;
                try {
                    std::rethrow_exception(ep);
                } catch (const std::exception& e) {
                    message = e.what();
                } catch (...) {
                    message = "unknown exception";
                }
                LogError("http", "Unhandled exception on " + req.method + " " +
                                     req.path + ": " + message);
                const auto error = RequestRouter::ErrorResponse(
                    500, kJsonRpcInternalError, "Internal error", message);
                ApplyCorsHeaders(res);
                WriteJson(res, error.status, *error.body);
            });

        server.set_logger([](const httplib::Request& req, const httplib::Response& res) {
            LogDebug("http", req.method + " " + req.path + " -> " +
                                 std::to_string(res.status));
        });
    }
};

// ---------------------------------------------------------------------------
// GatewayServer
// ---------------------------------------------------------------------------
GatewayServer::GatewayServer(RequestRouter& router,
                             const SessionStore& store,
                             const IUpstreamClient& upstream,
                             GatewayServerOptions options,
                             TimestampFn now)
    : impl_(std::make_unique<Impl>(router, store, upstream,
                                   std::move(options), std::move(now))) {}

GatewayServer::~GatewayServer() {
    Stop();
}

Result<void, Error> GatewayServer::Bind() {
    const auto& host = impl_->options.host;
    const int requested = impl_->options.port;

    int port = requested;
    if (requested == 0) {
        port = impl_->server.bind_to_any_port(host);
    } else if (!impl_->server.bind_to_port(host, requested)) {
        port = -1;
    }

    if (port < 0) {
        return Result<void, Error>::Err(Error{
            "GatewayServer.Bind", host + ":" + std::to_string(requested),
            std::nullopt, "Could not bind the HTTP listener", std::nullopt,
            ErrorCategory::Configuration});
    }
    impl_->bound_port = port;
    LogInfo("http", "Listening on " + host + ":" + std::to_string(port) +
                        " (" + std::to_string(impl_->options.thread_count) +
                        " worker threads)");
    return Result<void, Error>::Ok();
}

bool GatewayServer::Listen() {
    return impl_->server.listen_after_bind();
}

void GatewayServer::Stop() {
    if (impl_->server.is_running()) {
        LogInfo("http", "Stopping HTTP listener");
    }
    impl_->server.stop();
}

void GatewayServer::WaitUntilReady() const {
    impl_->server.wait_until_ready();
}

int GatewayServer::Port() const noexcept {
    return impl_->bound_port;
}

nlohmann::json GatewayServer::HealthJson() const {
    return impl_->Health();
}

} // namespace ftc_mcp
