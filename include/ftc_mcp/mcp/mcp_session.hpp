#pragma once

#include <ftc_mcp/mcp/tool_dispatcher.hpp>
#include <ftc_mcp/session/i_session_context.hpp>
#include <ftc_mcp/session/session_events.hpp>

#include <atomic>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ftc_mcp {

/// Protocol versions this server can speak, newest first.
const std::vector<std::string>& SupportedProtocolVersions();

// ---------------------------------------------------------------------------
// McpSession — MCP protocol state for one client session.
//
// Implements JSON-RPC 2.0 with the MCP methods:
//   - initialize                 (exactly once per session)
//   - notifications/initialized  (notification, no response)
//   - ping
//   - tools/list
//   - tools/call
// Any other request is answered with -32601. Requests other than initialize
// and ping are rejected until the handshake completed.
// ---------------------------------------------------------------------------
class McpSession : public ISessionContext {
public:
    McpSession(std::string session_id,
               const ToolDispatcher& dispatcher,
               SessionEventChannel& events);

    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message) override;

    void Close() override;

    [[nodiscard]] bool IsClosed() const override;

    [[nodiscard]] bool IsInitialized() const noexcept { return initialized_.load(); }

private:
    nlohmann::json HandleInitialize(const nlohmann::json& params,
                                    const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& id);
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id);
    static nlohmann::json MakeError(const nlohmann::json& id,
                                    int code, const std::string& message);
    static nlohmann::json MakeResult(const nlohmann::json& id,
                                     const nlohmann::json& result);

    std::string session_id_;
    const ToolDispatcher& dispatcher_;
    SessionEventChannel& events_;
    std::atomic<bool> initialized_{false};
    std::atomic<bool> closed_{false};
};

} // namespace ftc_mcp
