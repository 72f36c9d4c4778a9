#pragma once

#include <ftc_mcp/core/result.hpp>
#include <ftc_mcp/core/types.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace ftc_mcp {

// ---------------------------------------------------------------------------
// UpstreamStatus — configuration health of the upstream client, reported by
// the health check and the test_connection tool.
// ---------------------------------------------------------------------------
struct UpstreamStatus {
    bool configured = false;
    std::string base_url;
    bool has_api_key = false;

    [[nodiscard]] nlohmann::json ToJson() const {
        return {{"configured", configured},
                {"baseUrl", base_url},
                {"hasApiKey", has_api_key}};
    }
};

// ---------------------------------------------------------------------------
// IUpstreamClient — the FTC Platform REST API as seen by the tool dispatcher.
//
// Payloads are the upstream's `data` member, passed through untyped. Every
// operation performs exactly one request and never retries. Implementations
// must be callable from several threads at once.
// ---------------------------------------------------------------------------
class IUpstreamClient {
public:
    virtual ~IUpstreamClient() = default;

    /// GET /test
    [[nodiscard]] virtual Result<nlohmann::json, Error> TestConnection() = 0;

    /// GET /events/{id}/applications
    [[nodiscard]] virtual Result<nlohmann::json, Error> GetEventApplications(
        const EventId& event_id) = 0;

    /// GET /events/{id}/evaluations
    [[nodiscard]] virtual Result<nlohmann::json, Error> GetEventEvaluations(
        const EventId& event_id) = 0;

    /// GET /events/{id}/criteria
    [[nodiscard]] virtual Result<nlohmann::json, Error> GetEvaluationCriteria(
        const EventId& event_id) = 0;

    /// GET /events/{id}/questions
    [[nodiscard]] virtual Result<nlohmann::json, Error> GetApplicationQuestions(
        const EventId& event_id) = 0;

    [[nodiscard]] virtual UpstreamStatus Status() const = 0;
};

} // namespace ftc_mcp
