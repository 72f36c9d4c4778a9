#include <ftc_mcp/mcp/tool_dispatcher.hpp>

#include <ftc_mcp/core/log.hpp>
#include <ftc_mcp/core/version.hpp>

#include <exception>
#include <variant>

namespace ftc_mcp {

namespace {

nlohmann::json TextContent(const std::string& text) {
    return nlohmann::json::array({{{"type", "text"}, {"text", text}}});
}

// Stable rendering for tool output: two-space indent, invalid UTF-8 from the
// upstream replaced instead of throwing.
std::string Render(const nlohmann::json& payload) {
    return payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

// Maps each typed call onto its upstream operation.
struct CallVisitor {
    IUpstreamClient& upstream;

    Result<nlohmann::json, Error> operator()(const ConnectionCheckCall&) const {
        auto result = upstream.TestConnection();
        if (result.IsErr()) {
            return result;
        }
        // The connection check also reports the gateway's own view of the upstream
        // configuration next to whatever the upstream answered.
        nlohmann::json payload = std::move(result).Value();
        if (!payload.is_object()) {
            payload = {{"data", payload}};
        }
        payload["mcpServer"] = kServerName;
        payload["version"] = kVersion;
        payload["apiClient"] = upstream.Status().ToJson();
        return Result<nlohmann::json, Error>::Ok(std::move(payload));
    }

    Result<nlohmann::json, Error> operator()(const ListApplicationsCall& call) const {
        return upstream.GetEventApplications(call.event_id);
    }

    Result<nlohmann::json, Error> operator()(const ListEvaluationsCall& call) const {
        return upstream.GetEventEvaluations(call.event_id);
    }

    Result<nlohmann::json, Error> operator()(const ListCriteriaCall& call) const {
        return upstream.GetEvaluationCriteria(call.event_id);
    }

    Result<nlohmann::json, Error> operator()(const ListQuestionsCall& call) const {
        return upstream.GetApplicationQuestions(call.event_id);
    }
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// ToolResult
// ---------------------------------------------------------------------------
nlohmann::json ToolResult::ToJson() const {
    nlohmann::json j;
    j["content"] = content;
    if (is_error) {
        j["isError"] = true;
    }
    return j;
}

std::string ToolResult::Text() const {
    if (!content.is_array() || content.empty()) {
        return "";
    }
    return content[0].value("text", "");
}

// ---------------------------------------------------------------------------
// ToolDispatcher
// ---------------------------------------------------------------------------
ToolDispatcher::ToolDispatcher(const ToolRegistry& registry,
                               IUpstreamClient& upstream,
                               TimestampFn now)
    : registry_(registry), upstream_(upstream), now_(std::move(now)) {}

ToolResult ToolDispatcher::Invoke(const std::string& name,
                                  const nlohmann::json& arguments) const {
    LogInfo("dispatch", "Executing tool: " + name);

    auto call = registry_.Resolve(name, arguments);
    if (call.IsErr()) {
        return MakeFailure(name, call.Error());
    }

    auto outcome = Execute(call.Value());
    if (outcome.IsErr()) {
        return MakeFailure(name, outcome.Error());
    }

    LogDebug("dispatch", "Tool succeeded: " + name);
    return ToolResult{false, TextContent(Render(outcome.Value())), std::nullopt};
}

Result<nlohmann::json, Error> ToolDispatcher::Execute(const ToolCall& call) const {
    try {
        return std::visit(CallVisitor{upstream_}, call);
    } catch (const std::exception& e) {
        return Result<nlohmann::json, Error>::Err(Error::Make(
            ErrorCategory::Upstream, "ToolDispatcher.Execute", e.what()));
    }
}

ToolResult ToolDispatcher::MakeFailure(const std::string& name,
                                       const Error& error) const {
    LogError("dispatch", "Tool execution failed: " + name + ": " + error.ToString());

    std::string message = error.message;
    if (error.detail.has_value() && !error.detail->empty()) {
        message += "\nDetails: " + *error.detail;
    }

    nlohmann::json payload = {
        {"success", false},
        {"error", message},
        {"tool", name},
        {"category", error.CategoryName()},
        {"timestamp", now_()},
        {"details", "Failed to execute MCP tool: " + name},
    };
    if (error.http_status.has_value()) {
        payload["httpStatus"] = *error.http_status;
    }
    return ToolResult{true, TextContent(Render(payload)), error.category};
}

} // namespace ftc_mcp
