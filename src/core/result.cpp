#include <ftc_mcp/core/result.hpp>

#include <sstream>

namespace ftc_mcp {

namespace {

// Upstream error bodies can be whole HTML pages; keep the useful prefix.
constexpr size_t kMaxDetailLength = 1000;

std::optional<std::string> TrimBody(const std::string& body) {
    const auto begin = body.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return std::nullopt;
    const auto end = body.find_last_not_of(" \t\r\n");
    auto trimmed = body.substr(begin, end - begin + 1);
    if (trimmed.size() > kMaxDetailLength) {
        trimmed = trimmed.substr(0, kMaxDetailLength) + "... (truncated)";
    }
    return trimmed;
}

} // anonymous namespace

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& endpoint,
                            int status_code,
                            const std::string& reason,
                            const std::string& response_body) {
    std::string message = "API request failed: " + std::to_string(status_code);
    if (!reason.empty()) {
        message += " " + reason;
    }
    return Error{operation, endpoint, status_code, message,
                 TrimBody(response_body), ErrorCategory::Upstream};
}

Error Error::Make(ErrorCategory category,
                  const std::string& operation,
                  const std::string& message) {
    return Error{operation, "", std::nullopt, message, std::nullopt, category};
}

std::string Error::CategoryName() const {
    switch (category) {
        case ErrorCategory::SessionMissing:   return "session_missing";
        case ErrorCategory::SessionInvalid:   return "session_invalid";
        case ErrorCategory::UnknownTool:      return "unknown_tool";
        case ErrorCategory::InvalidArguments: return "invalid_arguments";
        case ErrorCategory::Upstream:         return "upstream";
        case ErrorCategory::Configuration:    return "configuration";
        case ErrorCategory::Internal:         return "internal";
    }
    return "internal";
}

int Error::JsonRpcCode() const {
    switch (category) {
        case ErrorCategory::SessionMissing:
        case ErrorCategory::SessionInvalid:
            return kJsonRpcServerError;
        case ErrorCategory::UnknownTool:
        case ErrorCategory::InvalidArguments:
            return kJsonRpcInvalidParams;
        case ErrorCategory::Upstream:
        case ErrorCategory::Configuration:
        case ErrorCategory::Internal:
            return kJsonRpcInternalError;
    }
    return kJsonRpcInternalError;
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!endpoint.empty()) {
        oss << " [" << endpoint << "]";
    }
    if (http_status.has_value()) {
        oss << " (HTTP " << *http_status << ")";
    }
    oss << ": " << message;
    if (detail.has_value() && !detail->empty()) {
        oss << "\nDetails: " << *detail;
    }
    return oss.str();
}

nlohmann::json Error::ToJson() const {
    nlohmann::json j = {
        {"category", CategoryName()},
        {"operation", operation},
        {"message", message},
    };
    if (!endpoint.empty()) {
        j["endpoint"] = endpoint;
    }
    if (http_status.has_value()) {
        j["httpStatus"] = *http_status;
    }
    if (detail.has_value() && !detail->empty()) {
        j["detail"] = *detail;
    }
    return j;
}

} // namespace ftc_mcp
