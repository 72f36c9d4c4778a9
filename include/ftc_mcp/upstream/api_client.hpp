#pragma once

#include <ftc_mcp/upstream/i_http_session.hpp>
#include <ftc_mcp/upstream/i_upstream_client.hpp>

#include <string>

namespace ftc_mcp {

// ---------------------------------------------------------------------------
// ApiClient — IUpstreamClient over an IHttpSession.
//
// The upstream wraps every payload in
//   {"success": bool, "data": ..., "error": "...", "details": "..."}
// and this class unwraps it: `data` on success, an Upstream Error otherwise.
// ---------------------------------------------------------------------------
class ApiClient : public IUpstreamClient {
public:
    ApiClient(IHttpSession& session, std::string base_url, bool has_api_key);

    [[nodiscard]] Result<nlohmann::json, Error> TestConnection() override;
    [[nodiscard]] Result<nlohmann::json, Error> GetEventApplications(
        const EventId& event_id) override;
    [[nodiscard]] Result<nlohmann::json, Error> GetEventEvaluations(
        const EventId& event_id) override;
    [[nodiscard]] Result<nlohmann::json, Error> GetEvaluationCriteria(
        const EventId& event_id) override;
    [[nodiscard]] Result<nlohmann::json, Error> GetApplicationQuestions(
        const EventId& event_id) override;

    [[nodiscard]] UpstreamStatus Status() const override;

private:
    Result<nlohmann::json, Error> Fetch(const std::string& operation,
                                        const std::string& endpoint);

    IHttpSession& session_;
    std::string base_url_;
    bool has_api_key_;
};

} // namespace ftc_mcp
