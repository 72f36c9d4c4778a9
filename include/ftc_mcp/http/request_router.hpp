#pragma once

#include <ftc_mcp/core/result.hpp>
#include <ftc_mcp/session/session_store.hpp>
#include <ftc_mcp/upstream/i_http_session.hpp>

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace ftc_mcp {

/// Header carrying the session id in both directions.
constexpr const char* kSessionIdHeader = "Mcp-Session-Id";

// ---------------------------------------------------------------------------
// RouterRequest / RouterResponse — transport-neutral view of one request on
// the MCP endpoint.
// ---------------------------------------------------------------------------
struct RouterRequest {
    std::string method;                     // "POST", "GET", "DELETE"
    std::optional<std::string> session_id;  // Mcp-Session-Id; empty = absent
    std::string body;
};

struct RouterResponse {
    int status = 200;
    std::optional<nlohmann::json> body;     // absent for 202/204
    std::optional<std::string> session_id;  // bound into Mcp-Session-Id
    HttpHeaders headers;
};

/// True for a JSON-RPC 2.0 request (not a notification) whose method is
/// "initialize".
[[nodiscard]] bool IsInitializeRequest(const nlohmann::json& message);

// ---------------------------------------------------------------------------
// RequestRouter — binds each request to a session.
//
// A request carrying a session id goes to that session; one without must be
// an initialize handshake, which creates a new session. Everything else is
// answered with a JSON-RPC error (id null) and an HTTP error status.
// Thread-safe; holds no state besides the store reference.
// ---------------------------------------------------------------------------
class RequestRouter {
public:
    explicit RequestRouter(SessionStore& store);

    [[nodiscard]] RouterResponse Route(const RouterRequest& request);

    /// Error response for a failure that surfaces at the protocol level.
    [[nodiscard]] static RouterResponse ErrorResponse(
        int http_status, int code, const std::string& message,
        const std::optional<std::string>& data = std::nullopt);

private:
    RouterResponse RoutePost(const RouterRequest& request);
    RouterResponse RouteDelete(const RouterRequest& request);
    RouterResponse Forward(Session& session, const nlohmann::json& message);

    SessionStore& store_;
};

} // namespace ftc_mcp
