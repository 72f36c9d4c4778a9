#pragma once

#include <ftc_mcp/core/result.hpp>

#include <map>
#include <string>
#include <string_view>

namespace ftc_mcp {

// ---------------------------------------------------------------------------
// HttpHeaders — header name/value pairs. Names are kept as sent; callers
// compare case-insensitively where it matters.
// ---------------------------------------------------------------------------
using HttpHeaders = std::map<std::string, std::string>;

// ---------------------------------------------------------------------------
// HttpResponse — the result of an HTTP request that reached the server.
// ---------------------------------------------------------------------------
struct HttpResponse {
    int status_code = 0;
    std::string reason;
    HttpHeaders headers;
    std::string body;
};

// ---------------------------------------------------------------------------
// IHttpSession — abstract HTTP session against the upstream API.
//
// Paths are relative to the configured base URL ("/events/42/criteria").
// Transport failures come back as Err; any HTTP status (including 4xx/5xx)
// comes back as Ok so callers can map it. Never throws on expected failures.
// Implementations must be safe to call from several threads at once.
// ---------------------------------------------------------------------------
class IHttpSession {
public:
    virtual ~IHttpSession() = default;

    IHttpSession(const IHttpSession&) = delete;
    IHttpSession& operator=(const IHttpSession&) = delete;
    IHttpSession(IHttpSession&&) = delete;
    IHttpSession& operator=(IHttpSession&&) = delete;

    [[nodiscard]] virtual Result<HttpResponse, Error> Get(
        std::string_view path,
        const HttpHeaders& headers = {}) = 0;

protected:
    IHttpSession() = default;
};

} // namespace ftc_mcp
