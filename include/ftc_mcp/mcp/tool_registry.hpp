#pragma once

#include <ftc_mcp/core/result.hpp>
#include <ftc_mcp/core/types.hpp>

#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace ftc_mcp {

// ---------------------------------------------------------------------------
// ToolParam — one declared input parameter of a tool.
// ---------------------------------------------------------------------------
struct ToolParam {
    std::string name;
    std::string type;  // JSON Schema type, e.g. "string"
    bool required = false;
    std::string description;
};

// ---------------------------------------------------------------------------
// ToolKind — the closed set of operations a tool can map to.
// ---------------------------------------------------------------------------
enum class ToolKind {
    ConnectionCheck,
    ListApplications,
    ListEvaluations,
    ListCriteria,
    ListQuestions,
};

// ---------------------------------------------------------------------------
// ToolDescriptor — name, description and parameter schema of a tool.
// ---------------------------------------------------------------------------
struct ToolDescriptor {
    std::string name;
    std::string description;
    std::vector<ToolParam> params;
    ToolKind kind = ToolKind::ConnectionCheck;

    /// JSON Schema object advertised as "inputSchema" in tools/list.
    [[nodiscard]] nlohmann::json InputSchema() const;
};

// ---------------------------------------------------------------------------
// Typed tool calls. A ToolCall only exists once its arguments were validated
// against the descriptor, so the dispatcher never inspects raw JSON.
// ---------------------------------------------------------------------------
struct ConnectionCheckCall {};

struct ListApplicationsCall {
    EventId event_id;
};

struct ListEvaluationsCall {
    EventId event_id;
};

struct ListCriteriaCall {
    EventId event_id;
};

struct ListQuestionsCall {
    EventId event_id;
};

using ToolCall = std::variant<ConnectionCheckCall,
                              ListApplicationsCall,
                              ListEvaluationsCall,
                              ListCriteriaCall,
                              ListQuestionsCall>;

// ---------------------------------------------------------------------------
// ToolRegistry — ordered, immutable catalog of tools.
//
// The single source of truth for which tool names are accepted. Safe to read
// from any thread once constructed.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    /// Throws std::invalid_argument on duplicate tool names.
    explicit ToolRegistry(std::vector<ToolDescriptor> tools);

    /// The five FTC Platform tools, in the order clients see them.
    static ToolRegistry Builtin();

    [[nodiscard]] const std::vector<ToolDescriptor>& Tools() const noexcept {
        return tools_;
    }

    [[nodiscard]] const ToolDescriptor* Find(std::string_view name) const;

    [[nodiscard]] bool HasTool(std::string_view name) const {
        return Find(name) != nullptr;
    }

    /// tools/list payload: [{name, description, inputSchema}, ...].
    [[nodiscard]] nlohmann::json ListJson() const;

    /// Validate `arguments` for tool `name` and build the typed call.
    ///   - unregistered name           -> ErrorCategory::UnknownTool
    ///   - missing/empty required param -> ErrorCategory::InvalidArguments
    ///   - param of the wrong type     -> ErrorCategory::InvalidArguments
    /// Parameters the tool does not declare are ignored.
    [[nodiscard]] Result<ToolCall, Error> Resolve(
        const std::string& name, const nlohmann::json& arguments) const;

private:
    std::vector<ToolDescriptor> tools_;
};

} // namespace ftc_mcp
