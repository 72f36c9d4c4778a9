#include <catch2/catch_test_macros.hpp>

#include <ftc_mcp/mcp/tool_registry.hpp>

#include <stdexcept>
#include <string>
#include <variant>

using namespace ftc_mcp;

namespace {

const char* kEventId = "11111111-1111-1111-1111-111111111111";

} // anonymous namespace

// ===========================================================================
// Builtin catalog
// ===========================================================================

TEST_CASE("ToolRegistry: builtin lists the five tools in order", "[mcp][registry]") {
    auto registry = ToolRegistry::Builtin();
    const auto& tools = registry.Tools();
    REQUIRE(tools.size() == 5);
    CHECK(tools[0].name == "test_connection");
    CHECK(tools[1].name == "get_event_applications");
    CHECK(tools[2].name == "get_event_evaluations");
    CHECK(tools[3].name == "get_evaluation_criteria");
    CHECK(tools[4].name == "get_application_questions");
}

TEST_CASE("ToolRegistry: test_connection takes no parameters", "[mcp][registry]") {
    auto registry = ToolRegistry::Builtin();
    const auto* tool = registry.Find("test_connection");
    REQUIRE(tool != nullptr);
    CHECK(tool->params.empty());
    auto schema = tool->InputSchema();
    CHECK(schema["type"] == "object");
    CHECK(schema["properties"].empty());
    CHECK(schema["required"].empty());
}

TEST_CASE("ToolRegistry: event tools require eventId", "[mcp][registry]") {
    auto registry = ToolRegistry::Builtin();
    for (const auto& tool : registry.Tools()) {
        if (tool.name == "test_connection") {
            continue;
        }
        auto schema = tool.InputSchema();
        CHECK(schema["properties"]["eventId"]["type"] == "string");
        CHECK(schema["required"] == nlohmann::json::array({"eventId"}));
        CHECK_FALSE(tool.description.empty());
    }
}

TEST_CASE("ToolRegistry: ListJson is stable across calls", "[mcp][registry]") {
    auto registry = ToolRegistry::Builtin();
    auto first = registry.ListJson();
    auto second = registry.ListJson();
    CHECK(first == second);
    REQUIRE(first.size() == 5);
    CHECK(first[1]["name"] == "get_event_applications");
    CHECK(first[1].contains("inputSchema"));
    CHECK(first[1].contains("description"));
}

TEST_CASE("ToolRegistry: Find and HasTool", "[mcp][registry]") {
    auto registry = ToolRegistry::Builtin();
    CHECK(registry.HasTool("get_evaluation_criteria"));
    CHECK_FALSE(registry.HasTool("delete_everything"));
    CHECK(registry.Find("nope") == nullptr);
}

TEST_CASE("ToolRegistry: duplicate names are rejected", "[mcp][registry]") {
    std::vector<ToolDescriptor> tools = {
        {"dup", "first", {}, ToolKind::ConnectionCheck},
        {"dup", "second", {}, ToolKind::ConnectionCheck},
    };
    CHECK_THROWS_AS(ToolRegistry(tools), std::invalid_argument);
}

// ===========================================================================
// Resolve
// ===========================================================================

TEST_CASE("Resolve: connection check with no arguments", "[mcp][registry][resolve]") {
    auto registry = ToolRegistry::Builtin();
    auto call = registry.Resolve("test_connection", nullptr);
    REQUIRE(call.IsOk());
    CHECK(std::holds_alternative<ConnectionCheckCall>(call.Value()));
}

TEST_CASE("Resolve: each event tool maps to its call type", "[mcp][registry][resolve]") {
    auto registry = ToolRegistry::Builtin();
    nlohmann::json args = {{"eventId", kEventId}};

    auto apps = registry.Resolve("get_event_applications", args);
    REQUIRE(apps.IsOk());
    REQUIRE(std::holds_alternative<ListApplicationsCall>(apps.Value()));
    CHECK(std::get<ListApplicationsCall>(apps.Value()).event_id.Value() == kEventId);

    auto evals = registry.Resolve("get_event_evaluations", args);
    REQUIRE(evals.IsOk());
    CHECK(std::holds_alternative<ListEvaluationsCall>(evals.Value()));

    auto criteria = registry.Resolve("get_evaluation_criteria", args);
    REQUIRE(criteria.IsOk());
    CHECK(std::holds_alternative<ListCriteriaCall>(criteria.Value()));

    auto questions = registry.Resolve("get_application_questions", args);
    REQUIRE(questions.IsOk());
    CHECK(std::holds_alternative<ListQuestionsCall>(questions.Value()));
}

TEST_CASE("Resolve: unknown tool", "[mcp][registry][resolve]") {
    auto registry = ToolRegistry::Builtin();
    auto call = registry.Resolve("drop_tables", nlohmann::json::object());
    REQUIRE(call.IsErr());
    CHECK(call.Error().category == ErrorCategory::UnknownTool);
    CHECK(call.Error().message == "Unknown tool: drop_tables");
}

TEST_CASE("Resolve: missing required parameter", "[mcp][registry][resolve]") {
    auto registry = ToolRegistry::Builtin();

    SECTION("absent") {
        auto call = registry.Resolve("get_event_applications", nlohmann::json::object());
        REQUIRE(call.IsErr());
        CHECK(call.Error().category == ErrorCategory::InvalidArguments);
        CHECK(call.Error().message == "Missing required parameter: eventId");
    }
    SECTION("empty string") {
        auto call = registry.Resolve("get_event_applications", {{"eventId", ""}});
        REQUIRE(call.IsErr());
        CHECK(call.Error().message == "Missing required parameter: eventId");
    }
    SECTION("null") {
        auto call = registry.Resolve("get_event_applications", {{"eventId", nullptr}});
        REQUIRE(call.IsErr());
        CHECK(call.Error().message == "Missing required parameter: eventId");
    }
    SECTION("no arguments at all") {
        auto call = registry.Resolve("get_event_evaluations", nullptr);
        REQUIRE(call.IsErr());
        CHECK(call.Error().category == ErrorCategory::InvalidArguments);
    }
}

TEST_CASE("Resolve: wrong parameter type", "[mcp][registry][resolve]") {
    auto registry = ToolRegistry::Builtin();
    auto call = registry.Resolve("get_evaluation_criteria", {{"eventId", 42}});
    REQUIRE(call.IsErr());
    CHECK(call.Error().category == ErrorCategory::InvalidArguments);
    CHECK(call.Error().message == "Invalid parameter eventId: expected string");
}

TEST_CASE("Resolve: invalid event id", "[mcp][registry][resolve]") {
    auto registry = ToolRegistry::Builtin();
    auto call = registry.Resolve("get_evaluation_criteria", {{"eventId", "has space"}});
    REQUIRE(call.IsErr());
    CHECK(call.Error().category == ErrorCategory::InvalidArguments);
    CHECK(call.Error().message.find("Invalid parameter eventId") == 0);
}

TEST_CASE("Resolve: dot-segment event ids are rejected", "[mcp][registry][resolve]") {
    auto registry = ToolRegistry::Builtin();
    for (const char* tool : {"get_event_applications", "get_event_evaluations",
                             "get_evaluation_criteria", "get_application_questions"}) {
        for (const char* id : {".", ".."}) {
            auto call = registry.Resolve(tool, {{"eventId", id}});
            REQUIRE(call.IsErr());
            CHECK(call.Error().category == ErrorCategory::InvalidArguments);
        }
    }
}

TEST_CASE("Resolve: arguments must be an object", "[mcp][registry][resolve]") {
    auto registry = ToolRegistry::Builtin();
    auto call = registry.Resolve("get_application_questions", nlohmann::json::array());
    REQUIRE(call.IsErr());
    CHECK(call.Error().message == "Tool arguments must be an object");
}

TEST_CASE("Resolve: extra parameters are ignored", "[mcp][registry][resolve]") {
    auto registry = ToolRegistry::Builtin();
    auto call = registry.Resolve("get_application_questions",
                                 {{"eventId", kEventId}, {"verbose", true}});
    CHECK(call.IsOk());
}
