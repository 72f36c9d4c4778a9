#include <ftc_mcp/upstream/api_client.hpp>

#include <ftc_mcp/core/log.hpp>
#include <ftc_mcp/core/url.hpp>

namespace ftc_mcp {

namespace {

Error MakeApiError(const std::string& operation,
                   const std::string& endpoint,
                   std::optional<int> http_status,
                   const std::string& message,
                   std::optional<std::string> detail = std::nullopt) {
    return Error{operation, endpoint, http_status, message, std::move(detail),
                 ErrorCategory::Upstream};
}

std::string StringOr(const nlohmann::json& obj, const char* key,
                     const std::string& fallback) {
    if (obj.contains(key) && obj[key].is_string()) {
        return obj[key].get<std::string>();
    }
    return fallback;
}

} // anonymous namespace

ApiClient::ApiClient(IHttpSession& session, std::string base_url, bool has_api_key)
    : session_(session), base_url_(std::move(base_url)), has_api_key_(has_api_key) {}

Result<nlohmann::json, Error> ApiClient::Fetch(const std::string& operation,
                                               const std::string& endpoint) {
    auto response = session_.Get(endpoint);
    if (response.IsErr()) {
        auto error = std::move(response).Error();
        error.operation = operation;
        return Result<nlohmann::json, Error>::Err(std::move(error));
    }

    const auto& http = response.Value();
    if (http.status_code < 200 || http.status_code >= 300) {
        return Result<nlohmann::json, Error>::Err(Error::FromHttpStatus(
            operation, endpoint, http.status_code, http.reason, http.body));
    }

    nlohmann::json envelope;
    try {
        envelope = nlohmann::json::parse(http.body);
    } catch (const nlohmann::json::exception& e) {
        return Result<nlohmann::json, Error>::Err(MakeApiError(
            operation, endpoint, http.status_code,
            std::string("API returned malformed JSON: ") + e.what()));
    }

    if (!envelope.is_object()) {
        return Result<nlohmann::json, Error>::Err(MakeApiError(
            operation, endpoint, http.status_code,
            "API returned malformed JSON: expected an object"));
    }

    const bool success = envelope.contains("success") &&
                         envelope["success"].is_boolean() &&
                         envelope["success"].get<bool>();
    if (!success) {
        return Result<nlohmann::json, Error>::Err(MakeApiError(
            operation, endpoint, http.status_code,
            "API returned error: " + StringOr(envelope, "error", "Unknown error"),
            StringOr(envelope, "details", "No details")));
    }

    if (!envelope.contains("data") || envelope["data"].is_null()) {
        return Result<nlohmann::json, Error>::Err(MakeApiError(
            operation, endpoint, http.status_code,
            "API returned success but no data"));
    }

    LogDebug("upstream", operation + " succeeded");
    return Result<nlohmann::json, Error>::Ok(std::move(envelope["data"]));
}

Result<nlohmann::json, Error> ApiClient::TestConnection() {
    return Fetch("TestConnection", "/test");
}

Result<nlohmann::json, Error> ApiClient::GetEventApplications(const EventId& event_id) {
    return Fetch("GetEventApplications", EventPath(event_id.Value(), "applications"));
}

Result<nlohmann::json, Error> ApiClient::GetEventEvaluations(const EventId& event_id) {
    return Fetch("GetEventEvaluations", EventPath(event_id.Value(), "evaluations"));
}

Result<nlohmann::json, Error> ApiClient::GetEvaluationCriteria(const EventId& event_id) {
    return Fetch("GetEvaluationCriteria", EventPath(event_id.Value(), "criteria"));
}

Result<nlohmann::json, Error> ApiClient::GetApplicationQuestions(const EventId& event_id) {
    return Fetch("GetApplicationQuestions", EventPath(event_id.Value(), "questions"));
}

UpstreamStatus ApiClient::Status() const {
    return UpstreamStatus{!base_url_.empty() && has_api_key_, base_url_, has_api_key_};
}

} // namespace ftc_mcp
