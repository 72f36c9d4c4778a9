#include <ftc_mcp/upstream/http_session.hpp>

#include <ftc_mcp/core/log.hpp>
#include <ftc_mcp/core/version.hpp>

#include <httplib.h>

#include <algorithm>
#include <cctype>

namespace ftc_mcp {

namespace {

Error MakeTransportError(const std::string& endpoint, const std::string& message) {
    return Error{"HttpSession.Get", endpoint, std::nullopt, message,
                 std::nullopt, ErrorCategory::Upstream};
}

bool IsSensitiveHeader(std::string_view key) {
    std::string lower_key(key);
    std::transform(lower_key.begin(), lower_key.end(), lower_key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower_key == "authorization" || lower_key == "cookie" ||
           lower_key == "set-cookie";
}

HttpHeaders ToHttpHeaders(const httplib::Headers& hdrs) {
    HttpHeaders result;
    for (const auto& [key, value] : hdrs) {
        result[key] = value;
    }
    return result;
}

void LogRequestHeaders(const httplib::Headers& hdrs) {
    for (const auto& [k, v] : hdrs) {
        if (IsSensitiveHeader(k)) {
            LogDebug("upstream", "  > " + k + ": <redacted>");
        } else {
            LogDebug("upstream", "  > " + k + ": " + v);
        }
    }
}

void LogResponse(int status, const std::string& body) {
    LogInfo("upstream", "  < " + std::to_string(status));
    if (status >= 400 && !body.empty()) {
        constexpr size_t kMaxBodyLog = 2000;
        if (body.size() <= kMaxBodyLog) {
            LogDebug("upstream", "  < body: " + body);
        } else {
            LogDebug("upstream", "  < body: " + body.substr(0, kMaxBodyLog) + "... (truncated)");
        }
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl — connection settings shared by every request.
// ---------------------------------------------------------------------------
struct HttpSession::Impl {
    BaseUrl base_url;
    std::string api_key;
    HttpSessionOptions options;
    std::string user_agent;

    Impl(BaseUrl url, std::string key, const HttpSessionOptions& opts)
        : base_url(std::move(url)),
          api_key(std::move(key)),
          options(opts),
          user_agent(std::string("FTC-MCP-Server/") + kVersion) {}

    httplib::Headers BuildRequestHeaders(const HttpHeaders& extra) const {
        httplib::Headers hdrs;
        hdrs.emplace("Authorization", "Bearer " + api_key);
        hdrs.emplace("Content-Type", "application/json");
        hdrs.emplace("Accept", "application/json");
        hdrs.emplace("User-Agent", user_agent);
        for (const auto& [key, value] : extra) {
            hdrs.emplace(key, value);
        }
        return hdrs;
    }

    Result<HttpResponse, Error> DoGet(std::string_view path,
                                      const HttpHeaders& extra_headers) {
        const auto full_path = base_url.PathPrefix() + std::string(path);

        httplib::Client client(base_url.Origin());
        if (!client.is_valid()) {
            return Result<HttpResponse, Error>::Err(MakeTransportError(
                full_path, "HTTP client could not be created for " +
                               base_url.Origin() +
                               (base_url.IsHttps() ? " (HTTPS support missing?)" : "")));
        }
        client.set_connection_timeout(options.connect_timeout);
        client.set_read_timeout(options.read_timeout);

        auto hdrs = BuildRequestHeaders(extra_headers);
        LogInfo("upstream", "GET " + full_path);
        LogRequestHeaders(hdrs);

        auto res = client.Get(full_path, hdrs);
        if (!res) {
            return Result<HttpResponse, Error>::Err(MakeTransportError(
                full_path, "HTTP request failed: " + httplib::to_string(res.error())));
        }
        LogResponse(res->status, res->body);
        return Result<HttpResponse, Error>::Ok(HttpResponse{
            res->status, res->reason, ToHttpHeaders(res->headers), res->body});
    }
};

// ---------------------------------------------------------------------------
// HttpSession
// ---------------------------------------------------------------------------
HttpSession::HttpSession(BaseUrl base_url,
                         std::string api_key,
                         const HttpSessionOptions& options)
    : impl_(std::make_unique<Impl>(std::move(base_url), std::move(api_key), options)) {}

HttpSession::~HttpSession() = default;

Result<HttpResponse, Error> HttpSession::Get(std::string_view path,
                                             const HttpHeaders& headers) {
    return impl_->DoGet(path, headers);
}

} // namespace ftc_mcp
