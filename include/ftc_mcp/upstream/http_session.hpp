#pragma once

#include <ftc_mcp/core/types.hpp>
#include <ftc_mcp/upstream/i_http_session.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace ftc_mcp {

// ---------------------------------------------------------------------------
// HttpSessionOptions — configuration for the upstream HTTP session.
// ---------------------------------------------------------------------------
struct HttpSessionOptions {
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds read_timeout{60};
};

// ---------------------------------------------------------------------------
// HttpSession — concrete IHttpSession implementation using cpp-httplib.
//
// Uses pimpl to avoid leaking httplib into the public header.
//
//   - Bearer token on every request
//   - JSON content type and a "FTC-MCP-Server/<version>" user agent
//   - one httplib::Client per request, so concurrent tool calls do not
//     serialise on a shared connection
//   - request/response logging with the Authorization header redacted
// ---------------------------------------------------------------------------
class HttpSession : public IHttpSession {
public:
    HttpSession(BaseUrl base_url,
                std::string api_key,
                const HttpSessionOptions& options = {});

    ~HttpSession() override;

    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;
    HttpSession(HttpSession&&) = delete;
    HttpSession& operator=(HttpSession&&) = delete;

    [[nodiscard]] Result<HttpResponse, Error> Get(
        std::string_view path,
        const HttpHeaders& headers = {}) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ftc_mcp
