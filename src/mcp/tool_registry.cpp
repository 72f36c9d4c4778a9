#include <ftc_mcp/mcp/tool_registry.hpp>

#include <set>
#include <stdexcept>

namespace ftc_mcp {

namespace {

Error MakeArgumentError(const std::string& tool, const std::string& message) {
    return Error{"ToolRegistry.Resolve", tool, std::nullopt, message,
                 std::nullopt, ErrorCategory::InvalidArguments};
}

ToolParam EventIdParam(const std::string& desc) {
    return ToolParam{"eventId", "string", true, desc};
}

bool MatchesType(const nlohmann::json& value, const std::string& type) {
    if (type == "string") return value.is_string();
    if (type == "integer") return value.is_number_integer();
    if (type == "number") return value.is_number();
    if (type == "boolean") return value.is_boolean();
    if (type == "object") return value.is_object();
    if (type == "array") return value.is_array();
    return true;
}

bool IsEmptyValue(const nlohmann::json& value) {
    if (value.is_null()) return true;
    if (value.is_string()) return value.get_ref<const std::string&>().empty();
    return false;
}

template <typename Call>
Result<ToolCall, Error> MakeEventCall(const std::string& tool,
                                      const nlohmann::json& args) {
    const auto it = args.find("eventId");
    const std::string raw =
        (it != args.end() && it->is_string()) ? it->get<std::string>() : std::string{};
    auto id = EventId::Create(raw);
    if (id.IsErr()) {
        return Result<ToolCall, Error>::Err(
            MakeArgumentError(tool, "Invalid parameter eventId: " + id.Error()));
    }
    return Result<ToolCall, Error>::Ok(ToolCall{Call{std::move(id).Value()}});
}

} // anonymous namespace

nlohmann::json ToolDescriptor::InputSchema() const {
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json required = nlohmann::json::array();
    for (const auto& p : params) {
        properties[p.name] = {{"type", p.type}, {"description", p.description}};
        if (p.required) {
            required.push_back(p.name);
        }
    }
    return {{"type", "object"},
            {"properties", properties},
            {"required", required}};
}

ToolRegistry::ToolRegistry(std::vector<ToolDescriptor> tools)
    : tools_(std::move(tools)) {
    std::set<std::string> seen;
    for (const auto& tool : tools_) {
        if (!seen.insert(tool.name).second) {
            throw std::invalid_argument("Duplicate tool name: " + tool.name);
        }
    }
}

ToolRegistry ToolRegistry::Builtin() {
    std::vector<ToolDescriptor> tools;

    tools.push_back({
        "test_connection",
        "Test connection to the FTC Platform API and verify the MCP server is "
        "working properly",
        {},
        ToolKind::ConnectionCheck});

    tools.push_back({
        "get_event_applications",
        "Get all applications for a specific event with complete data for AI "
        "analysis and ranking. Returns applicant information, responses to all "
        "questions, and metadata for evaluation.",
        {EventIdParam("The unique ID of the event to fetch applications for")},
        ToolKind::ListApplications});

    tools.push_back({
        "get_event_evaluations",
        "Get completed evaluations for applications in a specific event. "
        "Includes reviewer scores, comments, recommendations, and statistics "
        "for AI analysis of human evaluation patterns.",
        {EventIdParam("The unique ID of the event to fetch evaluations for")},
        ToolKind::ListEvaluations});

    tools.push_back({
        "get_evaluation_criteria",
        "Get evaluation criteria categorized for AI understanding. Provides "
        "scoring rubrics, weights, and guidelines used by human reviewers for "
        "consistent AI application scoring.",
        {EventIdParam("The unique ID of the event to get evaluation criteria "
                      "for (provides context)")},
        ToolKind::ListCriteria});

    tools.push_back({
        "get_application_questions",
        "Get application questions structure and metadata. Provides the "
        "complete question set, types, and requirements for understanding "
        "application data format and content.",
        {EventIdParam("The unique ID of the event to fetch application "
                      "questions for")},
        ToolKind::ListQuestions});

    return ToolRegistry(std::move(tools));
}

const ToolDescriptor* ToolRegistry::Find(std::string_view name) const {
    for (const auto& tool : tools_) {
        if (tool.name == name) {
            return &tool;
        }
    }
    return nullptr;
}

nlohmann::json ToolRegistry::ListJson() const {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& tool : tools_) {
        tools.push_back({
            {"name", tool.name},
            {"description", tool.description},
            {"inputSchema", tool.InputSchema()}
        });
    }
    return tools;
}

Result<ToolCall, Error> ToolRegistry::Resolve(
    const std::string& name, const nlohmann::json& arguments) const {
    const auto* tool = Find(name);
    if (tool == nullptr) {
        return Result<ToolCall, Error>::Err(Error{
            "ToolRegistry.Resolve", name, std::nullopt,
            "Unknown tool: " + name, std::nullopt, ErrorCategory::UnknownTool});
    }

    // A missing "arguments" member arrives as null; treat it as no arguments.
    const nlohmann::json args =
        arguments.is_null() ? nlohmann::json::object() : arguments;
    if (!args.is_object()) {
        return Result<ToolCall, Error>::Err(
            MakeArgumentError(name, "Tool arguments must be an object"));
    }

    for (const auto& param : tool->params) {
        const auto it = args.find(param.name);
        const bool present = it != args.end() && !IsEmptyValue(*it);
        if (!present) {
            if (param.required) {
                return Result<ToolCall, Error>::Err(MakeArgumentError(
                    name, "Missing required parameter: " + param.name));
            }
            continue;
        }
        if (!MatchesType(*it, param.type)) {
            return Result<ToolCall, Error>::Err(MakeArgumentError(
                name, "Invalid parameter " + param.name + ": expected " + param.type));
        }
    }

    switch (tool->kind) {
        case ToolKind::ConnectionCheck:
            return Result<ToolCall, Error>::Ok(ToolCall{ConnectionCheckCall{}});
        case ToolKind::ListApplications:
            return MakeEventCall<ListApplicationsCall>(name, args);
        case ToolKind::ListEvaluations:
            return MakeEventCall<ListEvaluationsCall>(name, args);
        case ToolKind::ListCriteria:
            return MakeEventCall<ListCriteriaCall>(name, args);
        case ToolKind::ListQuestions:
            return MakeEventCall<ListQuestionsCall>(name, args);
    }
    return Result<ToolCall, Error>::Err(Error::Make(
        ErrorCategory::Internal, "ToolRegistry.Resolve", "Unhandled tool kind"));
}

} // namespace ftc_mcp
