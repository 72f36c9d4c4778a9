#pragma once

#include <ftc_mcp/core/result.hpp>
#include <ftc_mcp/core/timestamp.hpp>
#include <ftc_mcp/mcp/tool_registry.hpp>
#include <ftc_mcp/upstream/i_upstream_client.hpp>

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace ftc_mcp {

// ---------------------------------------------------------------------------
// ToolResult — outcome of one tool invocation, already shaped as MCP content.
//
// `content` is an array with a single text block. On failure `is_error` is
// set and `error_category` records why.
// ---------------------------------------------------------------------------
struct ToolResult {
    bool is_error = false;
    nlohmann::json content;  // array of content blocks
    std::optional<ErrorCategory> error_category;

    /// tools/call result object: {"content": [...], "isError": true?}
    [[nodiscard]] nlohmann::json ToJson() const;

    /// Text of the first content block ("" if none).
    [[nodiscard]] std::string Text() const;
};

// ---------------------------------------------------------------------------
// ToolDispatcher — validates and executes tool invocations.
//
// Every invocation yields exactly one ToolResult; failures of any kind
// (unknown tool, bad arguments, upstream error, exception thrown by the
// upstream client) become error results and are never rethrown. Nothing is
// retried. Stateless apart from its references, so one dispatcher serves all
// sessions concurrently.
// ---------------------------------------------------------------------------
class ToolDispatcher {
public:
    ToolDispatcher(const ToolRegistry& registry,
                   IUpstreamClient& upstream,
                   TimestampFn now = Iso8601Now);

    [[nodiscard]] ToolResult Invoke(const std::string& name,
                                    const nlohmann::json& arguments) const;

    [[nodiscard]] const ToolRegistry& Registry() const noexcept {
        return registry_;
    }

private:
    Result<nlohmann::json, Error> Execute(const ToolCall& call) const;
    ToolResult MakeFailure(const std::string& name, const Error& error) const;

    const ToolRegistry& registry_;
    IUpstreamClient& upstream_;
    TimestampFn now_;
};

} // namespace ftc_mcp
