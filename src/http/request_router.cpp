#include <ftc_mcp/http/request_router.hpp>

#include <ftc_mcp/core/log.hpp>

#include <exception>

namespace ftc_mcp {

namespace {

constexpr const char* kSessionMissingMessage =
    "No session ID provided. Initialize first.";

RouterResponse SessionErrorResponse(const Error& error) {
    if (error.category == ErrorCategory::SessionMissing) {
        return RequestRouter::ErrorResponse(400, kJsonRpcServerError,
                                            kSessionMissingMessage);
    }
    return RequestRouter::ErrorResponse(400, kJsonRpcServerError,
                                        "Invalid session ID or session expired");
}

// An empty Mcp-Session-Id header counts as no header.
std::optional<std::string> SessionIdOf(const RouterRequest& request) {
    if (!request.session_id.has_value() || request.session_id->empty()) {
        return std::nullopt;
    }
    return request.session_id;
}

Error MakeSessionMissing(const std::string& method) {
    return Error{"RequestRouter.Route", method, std::nullopt,
                 kSessionMissingMessage, std::nullopt,
                 ErrorCategory::SessionMissing};
}

} // anonymous namespace

bool IsInitializeRequest(const nlohmann::json& message) {
    if (!message.is_object()) {
        return false;
    }
    const auto version = message.find("jsonrpc");
    const auto method = message.find("method");
    return version != message.end() && *version == "2.0" &&
           method != message.end() && *method == "initialize" &&
           message.contains("id");
}

RequestRouter::RequestRouter(SessionStore& store) : store_(store) {}

RouterResponse RequestRouter::ErrorResponse(int http_status, int code,
                                            const std::string& message,
                                            const std::optional<std::string>& data) {
    nlohmann::json error = {{"code", code}, {"message", message}};
    if (data.has_value()) {
        error["data"] = *data;
    }
    RouterResponse response;
    response.status = http_status;
    response.body = nlohmann::json{
        {"jsonrpc", "2.0"},
        {"error", error},
        {"id", nullptr}
    };
    return response;
}

RouterResponse RequestRouter::Route(const RouterRequest& request) {
    try {
        if (request.method == "POST") {
            return RoutePost(request);
        }
        if (request.method == "DELETE") {
            return RouteDelete(request);
        }
        auto response = ErrorResponse(405, kJsonRpcServerError, "Method not allowed.");
        response.headers["Allow"] = "POST, DELETE";
        return response;
    } catch (const std::exception& e) {
        LogError("router", std::string("Error handling MCP request: ") + e.what());
        return ErrorResponse(500, kJsonRpcInternalError, "Internal error", e.what());
    }
}

RouterResponse RequestRouter::RoutePost(const RouterRequest& request) {
    nlohmann::json message;
    try {
        message = nlohmann::json::parse(request.body);
    } catch (const nlohmann::json::parse_error& e) {
        LogDebug("router", std::string("Unparseable request body: ") + e.what());
        return ErrorResponse(400, kJsonRpcParseError, "Parse error");
    }
    if (message.is_array()) {
        return ErrorResponse(400, kJsonRpcInvalidRequest,
                             "Batch requests are not supported");
    }

    if (const auto session_id = SessionIdOf(request)) {
        auto session = store_.Lookup(*session_id);
        if (session.IsErr()) {
            LogDebug("router", session.Error().ToString());
            return SessionErrorResponse(session.Error());
        }
        return Forward(*session.Value(), message);
    }

    if (!IsInitializeRequest(message)) {
        const auto error = MakeSessionMissing(request.method);
        LogDebug("router", error.ToString());
        return SessionErrorResponse(error);
    }

    auto session = store_.Create();
    return Forward(*session, message);
}

RouterResponse RequestRouter::RouteDelete(const RouterRequest& request) {
    const auto session_id = SessionIdOf(request);
    if (!session_id.has_value()) {
        return SessionErrorResponse(MakeSessionMissing(request.method));
    }
    auto session = store_.Lookup(*session_id);
    if (session.IsErr()) {
        return SessionErrorResponse(session.Error());
    }
    // Closing emits the close event; removing right away keeps the id from
    // being accepted again before the reaper gets to it.
    session.Value()->Close();
    store_.Remove(*session_id);

    RouterResponse response;
    response.status = 204;
    return response;
}

RouterResponse RequestRouter::Forward(Session& session,
                                      const nlohmann::json& message) {
    auto handled = session.Handle(message);
    if (handled.IsErr()) {
        LogDebug("router", handled.Error().ToString());
        return SessionErrorResponse(handled.Error());
    }

    RouterResponse response;
    response.session_id = session.Id();
    if (!handled.Value().has_value()) {
        response.status = 202;
        return response;
    }
    response.status = 200;
    response.body = std::move(handled).Value();
    return response;
}

} // namespace ftc_mcp
