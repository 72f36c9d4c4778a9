#include <catch2/catch_test_macros.hpp>

#include <ftc_mcp/http/request_router.hpp>
#include <ftc_mcp/mcp/mcp_session.hpp>

#include "mocks/stub_upstream_client.hpp"

#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace ftc_mcp;
using namespace ftc_mcp::testing;

// ===========================================================================
// Fixture: real store and MCP sessions over a stub upstream.
// ===========================================================================

namespace {

struct RouterFixture {
    ToolRegistry registry = ToolRegistry::Builtin();
    StubUpstreamClient upstream;
    ToolDispatcher dispatcher{registry, upstream};
    SessionStore store{[this](const std::string& id, SessionEventChannel& events) {
        return std::make_unique<McpSession>(id, dispatcher, events);
    }};
    RequestRouter router{store};

    RouterResponse Post(const nlohmann::json& body,
                        std::optional<std::string> session_id = std::nullopt) {
        return router.Route(RouterRequest{"POST", std::move(session_id), body.dump()});
    }

    RouterResponse PostRaw(const std::string& body,
                           std::optional<std::string> session_id = std::nullopt) {
        return router.Route(RouterRequest{"POST", std::move(session_id), body});
    }

    std::string Initialize() {
        auto r = Post({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"},
                       {"params", {{"protocolVersion", "2025-03-26"}}}});
        REQUIRE(r.status == 200);
        REQUIRE(r.session_id.has_value());
        return *r.session_id;
    }

    RouterResponse CallTool(const std::string& session_id, int id,
                            const std::string& name,
                            const nlohmann::json& arguments = nlohmann::json::object()) {
        return Post({{"jsonrpc", "2.0"}, {"id", id}, {"method", "tools/call"},
                     {"params", {{"name", name}, {"arguments", arguments}}}},
                    session_id);
    }
};

void CheckRpcError(const RouterResponse& r, int status, int code) {
    CHECK(r.status == status);
    REQUIRE(r.body.has_value());
    CHECK((*r.body)["jsonrpc"] == "2.0");
    CHECK((*r.body)["error"]["code"] == code);
    CHECK((*r.body)["id"].is_null());
}

} // anonymous namespace

// ===========================================================================
// IsInitializeRequest
// ===========================================================================

TEST_CASE("IsInitializeRequest: recognises the handshake", "[http][router]") {
    CHECK(IsInitializeRequest({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"}}));
    CHECK_FALSE(IsInitializeRequest({{"jsonrpc", "2.0"}, {"method", "initialize"}}));
    CHECK_FALSE(IsInitializeRequest({{"jsonrpc", "1.0"}, {"id", 1}, {"method", "initialize"}}));
    CHECK_FALSE(IsInitializeRequest({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/list"}}));
    CHECK_FALSE(IsInitializeRequest(nlohmann::json::array()));
}

// ===========================================================================
// Handshake and session binding
// ===========================================================================

TEST_CASE("RequestRouter: initialize creates a session", "[http][router]") {
    RouterFixture f;
    auto r = f.Post({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"},
                     {"params", {{"protocolVersion", "2025-03-26"}}}});

    CHECK(r.status == 200);
    REQUIRE(r.session_id.has_value());
    REQUIRE(r.body.has_value());
    CHECK((*r.body)["id"] == 1);
    CHECK((*r.body)["result"]["sessionId"] == *r.session_id);
    CHECK(f.store.Size() == 1);
}

TEST_CASE("RequestRouter: empty session id is treated as absent", "[http][router]") {
    RouterFixture f;
    auto r = f.Post({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"},
                     {"params", {{"protocolVersion", "2025-03-26"}}}},
                    std::string(""));

    CHECK(r.status == 200);
    REQUIRE(r.session_id.has_value());
    CHECK_FALSE(r.session_id->empty());
    CHECK(f.store.Size() == 1);

    auto other = f.Post({{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/list"}},
                        std::string(""));
    CheckRpcError(other, 400, kJsonRpcServerError);
    CHECK((*other.body)["error"]["message"] == "No session ID provided. Initialize first.");

    auto del = f.router.Route(RouterRequest{"DELETE", std::string(""), ""});
    CheckRpcError(del, 400, kJsonRpcServerError);
    CHECK(f.store.Size() == 1);
}

TEST_CASE("RequestRouter: each handshake gets a distinct session", "[http][router]") {
    RouterFixture f;
    std::set<std::string> ids;
    for (int i = 0; i < 10; ++i) {
        ids.insert(f.Initialize());
    }
    CHECK(ids.size() == 10);
    CHECK(f.store.Size() == 10);
}

TEST_CASE("RequestRouter: follow-up requests reach the session", "[http][router]") {
    RouterFixture f;
    const auto id = f.Initialize();

    auto r = f.Post({{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/list"}}, id);

    CHECK(r.status == 200);
    CHECK(r.session_id == id);
    REQUIRE(r.body.has_value());
    CHECK((*r.body)["result"]["tools"].size() == 5);
}

TEST_CASE("RequestRouter: notifications are accepted without a body", "[http][router]") {
    RouterFixture f;
    const auto id = f.Initialize();

    auto r = f.Post({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}, id);

    CHECK(r.status == 202);
    CHECK_FALSE(r.body.has_value());
}

// ===========================================================================
// Rejections
// ===========================================================================

TEST_CASE("RequestRouter: missing session id requires initialize", "[http][router]") {
    RouterFixture f;
    auto r = f.Post({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/list"}});

    CheckRpcError(r, 400, kJsonRpcServerError);
    CHECK((*r.body)["error"]["message"] == "No session ID provided. Initialize first.");
    CHECK(f.store.Size() == 0);
}

TEST_CASE("RequestRouter: unknown session id is rejected", "[http][router]") {
    RouterFixture f;
    auto r = f.Post({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/list"}},
                    std::string("no-such-session"));

    CheckRpcError(r, 400, kJsonRpcServerError);
    CHECK((*r.body)["error"]["message"] == "Invalid session ID or session expired");
}

TEST_CASE("RequestRouter: malformed JSON is a parse error", "[http][router]") {
    RouterFixture f;
    auto r = f.PostRaw("{not json");
    CheckRpcError(r, 400, kJsonRpcParseError);
}

TEST_CASE("RequestRouter: batch bodies are rejected", "[http][router]") {
    RouterFixture f;
    auto r = f.PostRaw(R"([{"jsonrpc":"2.0","id":1,"method":"ping"}])");
    CheckRpcError(r, 400, kJsonRpcInvalidRequest);
}

TEST_CASE("RequestRouter: other verbs answer 405", "[http][router]") {
    RouterFixture f;
    auto r = f.router.Route(RouterRequest{"GET", std::nullopt, ""});

    CheckRpcError(r, 405, kJsonRpcServerError);
    CHECK(r.headers["Allow"] == "POST, DELETE");
}

// ===========================================================================
// Termination
// ===========================================================================

TEST_CASE("RequestRouter: DELETE ends the session", "[http][router]") {
    RouterFixture f;
    const auto id = f.Initialize();

    auto del = f.router.Route(RouterRequest{"DELETE", id, ""});
    CHECK(del.status == 204);
    CHECK_FALSE(del.body.has_value());
    CHECK(f.store.Size() == 0);

    auto after = f.Post({{"jsonrpc", "2.0"}, {"id", 2}, {"method", "ping"}}, id);
    CheckRpcError(after, 400, kJsonRpcServerError);
    CHECK((*after.body)["error"]["message"] == "Invalid session ID or session expired");
}

TEST_CASE("RequestRouter: DELETE without a session id", "[http][router]") {
    RouterFixture f;
    auto r = f.router.Route(RouterRequest{"DELETE", std::nullopt, ""});
    CheckRpcError(r, 400, kJsonRpcServerError);
}

TEST_CASE("RequestRouter: removed session is no longer served", "[http][router]") {
    RouterFixture f;
    const auto id = f.Initialize();
    f.store.Remove(id);

    auto r = f.CallTool(id, 2, "test_connection");
    CheckRpcError(r, 400, kJsonRpcServerError);
    CHECK(f.upstream.TotalCalls() == 0);
}

// ===========================================================================
// Tool calls through the router
// ===========================================================================

TEST_CASE("RequestRouter: unknown tool never reaches the upstream", "[http][router]") {
    RouterFixture f;
    const auto id = f.Initialize();

    auto r = f.CallTool(id, 2, "drop_database");

    CHECK(r.status == 200);
    REQUIRE(r.body.has_value());
    CHECK((*r.body)["result"]["isError"] == true);
    CHECK(f.upstream.TotalCalls() == 0);
}

TEST_CASE("RequestRouter: missing eventId never reaches the upstream", "[http][router]") {
    RouterFixture f;
    const auto id = f.Initialize();

    auto r = f.CallTool(id, 2, "get_event_applications");

    REQUIRE(r.body.has_value());
    CHECK((*r.body)["result"]["isError"] == true);
    CHECK(f.upstream.TotalCalls() == 0);
}

TEST_CASE("RequestRouter: dot-segment eventId never reaches the upstream", "[http][router]") {
    RouterFixture f;
    const auto id = f.Initialize();

    auto r = f.CallTool(id, 2, "get_event_applications", {{"eventId", ".."}});

    REQUIRE(r.body.has_value());
    CHECK((*r.body)["result"]["isError"] == true);
    CHECK(f.upstream.TotalCalls() == 0);
}

TEST_CASE("RequestRouter: upstream failure leaves the session usable", "[http][router]") {
    RouterFixture f;
    const auto id = f.Initialize();
    f.upstream.FailWithUpstreamMessage("Service unavailable");

    auto failed = f.CallTool(id, 2, "get_event_evaluations",
                             {{"eventId", "11111111-1111-1111-1111-111111111111"}});
    REQUIRE(failed.body.has_value());
    CHECK((*failed.body)["result"]["isError"] == true);
    auto text = (*failed.body)["result"]["content"][0]["text"].get<std::string>();
    CHECK(text.find("Service unavailable") != std::string::npos);

    f.upstream.Succeed();
    auto ok = f.CallTool(id, 3, "get_event_evaluations",
                         {{"eventId", "11111111-1111-1111-1111-111111111111"}});
    REQUIRE(ok.body.has_value());
    CHECK_FALSE((*ok.body)["result"].contains("isError"));
    CHECK(f.upstream.evaluations_calls == 2);
}

TEST_CASE("RequestRouter: concurrent sessions stay isolated", "[http][router]") {
    RouterFixture f;
    f.upstream.SetDelay(std::chrono::milliseconds(2));

    constexpr int kSessions = 10;
    constexpr int kPerSession = 5;
    std::vector<std::string> ids;
    for (int s = 0; s < kSessions; ++s) {
        ids.push_back(f.Initialize());
    }

    std::vector<RouterResponse> responses(kSessions * kPerSession);
    std::vector<std::thread> threads;
    for (int s = 0; s < kSessions; ++s) {
        for (int i = 0; i < kPerSession; ++i) {
            const int slot = s * kPerSession + i;
            threads.emplace_back([&f, &ids, &responses, s, slot] {
                responses[slot] = f.CallTool(ids[s], slot, "get_evaluation_criteria",
                                             {{"eventId", "event-" + std::to_string(slot)}});
            });
        }
    }
    for (auto& t : threads) {
        t.join();
    }

    for (int s = 0; s < kSessions; ++s) {
        for (int i = 0; i < kPerSession; ++i) {
            const int slot = s * kPerSession + i;
            const auto& r = responses[slot];
            CHECK(r.status == 200);
            CHECK(r.session_id == ids[s]);
            REQUIRE(r.body.has_value());
            CHECK((*r.body)["id"] == slot);
            auto text = (*r.body)["result"]["content"][0]["text"].get<std::string>();
            CHECK(nlohmann::json::parse(text)["eventId"] == "event-" + std::to_string(slot));
        }
    }
    CHECK(f.upstream.criteria_calls == kSessions * kPerSession);
}

