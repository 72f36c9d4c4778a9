#include <ftc_mcp/mcp/mcp_session.hpp>

#include <ftc_mcp/core/log.hpp>
#include <ftc_mcp/core/result.hpp>
#include <ftc_mcp/core/version.hpp>

#include <algorithm>

namespace ftc_mcp {

const std::vector<std::string>& SupportedProtocolVersions() {
    static const std::vector<std::string> versions = {"2025-03-26", "2024-11-05"};
    return versions;
}

McpSession::McpSession(std::string session_id,
                       const ToolDispatcher& dispatcher,
                       SessionEventChannel& events)
    : session_id_(std::move(session_id)), dispatcher_(dispatcher), events_(events) {}

std::optional<nlohmann::json> McpSession::HandleMessage(
    const nlohmann::json& message) {
    if (!message.is_object()) {
        return MakeError(nullptr, kJsonRpcInvalidRequest, "Invalid Request");
    }

    // Check for JSON-RPC 2.0.
    const auto version = message.find("jsonrpc");
    if (version == message.end() || *version != "2.0") {
        if (message.contains("id")) {
            return MakeError(message["id"], kJsonRpcInvalidRequest,
                             "Invalid JSON-RPC version");
        }
        return std::nullopt;
    }

    const auto method_it = message.find("method");
    const std::string method =
        (method_it != message.end() && method_it->is_string())
            ? method_it->get<std::string>() : std::string{};

    // Notifications have no "id" and never get a response.
    if (!message.contains("id")) {
        if (method == "notifications/initialized") {
            LogDebug("session", "Client initialized: " + session_id_);
        } else {
            LogDebug("session", "Ignoring notification: " + method);
        }
        return std::nullopt;
    }

    const auto& id = message["id"];
    if (method.empty()) {
        return MakeError(id, kJsonRpcInvalidRequest, "Missing 'method'");
    }

    const auto params_it = message.find("params");
    const nlohmann::json params =
        (params_it != message.end() && params_it->is_object())
            ? *params_it : nlohmann::json::object();

    if (method == "initialize") {
        return HandleInitialize(params, id);
    }
    if (method == "ping") {
        return MakeResult(id, nlohmann::json::object());
    }
    if (!initialized_) {
        return MakeError(id, kJsonRpcInvalidRequest, "Session not initialized");
    }
    if (method == "tools/list") {
        return HandleToolsList(id);
    }
    if (method == "tools/call") {
        return HandleToolsCall(params, id);
    }
    return MakeError(id, kJsonRpcMethodNotFound, "Method not found: " + method);
}

void McpSession::Close() {
    if (closed_.exchange(true)) {
        return;
    }
    if (!events_.Push(SessionEvent{SessionEventKind::Closed, session_id_})) {
        LogDebug("session", "Event channel shut down; close of " + session_id_ +
                                " not reported");
    }
}

bool McpSession::IsClosed() const {
    return closed_.load();
}

nlohmann::json McpSession::HandleInitialize(
    const nlohmann::json& params, const nlohmann::json& id) {
    if (initialized_) {
        return MakeError(id, kJsonRpcInvalidRequest, "Session already initialized");
    }
    initialized_ = true;

    const auto& supported = SupportedProtocolVersions();
    std::string negotiated = supported.front();
    const auto requested = params.find("protocolVersion");
    if (requested != params.end() && requested->is_string()) {
        const auto& text = requested->get_ref<const std::string&>();
        if (std::find(supported.begin(), supported.end(), text) != supported.end()) {
            negotiated = text;
        }
    }

    nlohmann::json result;
    result["protocolVersion"] = negotiated;
    result["capabilities"] = {
        {"tools", nlohmann::json::object()}
    };
    result["serverInfo"] = {
        {"name", kServerName},
        {"version", kVersion}
    };
    result["sessionId"] = session_id_;

    return MakeResult(id, result);
}

nlohmann::json McpSession::HandleToolsList(const nlohmann::json& id) {
    return MakeResult(id, {{"tools", dispatcher_.Registry().ListJson()}});
}

nlohmann::json McpSession::HandleToolsCall(
    const nlohmann::json& params, const nlohmann::json& id) {
    const auto name = params.find("name");
    if (name == params.end() || !name->is_string()) {
        return MakeError(id, kJsonRpcInvalidParams, "Missing 'name' parameter");
    }

    const auto arguments_it = params.find("arguments");
    const nlohmann::json arguments =
        arguments_it != params.end() ? *arguments_it : nlohmann::json::object();

    auto result = dispatcher_.Invoke(name->get<std::string>(), arguments);
    return MakeResult(id, result.ToJson());
}

nlohmann::json McpSession::MakeError(
    const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

nlohmann::json McpSession::MakeResult(
    const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

} // namespace ftc_mcp
