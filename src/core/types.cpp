#include <ftc_mcp/core/types.hpp>

#include <algorithm>
#include <cctype>

namespace ftc_mcp {

namespace {

bool IsForbiddenIdChar(char c) {
    const auto uc = static_cast<unsigned char>(c);
    return std::iscntrl(uc) || std::isspace(uc);
}

std::string ToLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// EventId
// ---------------------------------------------------------------------------
Result<EventId, std::string> EventId::Create(std::string_view id) {
    if (id.empty()) {
        return Result<EventId, std::string>::Err("Event ID must not be empty");
    }
    if (id.size() > 128) {
        return Result<EventId, std::string>::Err(
            "Event ID must be at most 128 characters, got " +
            std::to_string(id.size()));
    }
    if (std::any_of(id.begin(), id.end(), IsForbiddenIdChar)) {
        return Result<EventId, std::string>::Err(
            "Event ID must not contain whitespace or control characters");
    }
    // Dot segments survive percent-encoding and would escape /events/{id}.
    if (id == "." || id == "..") {
        return Result<EventId, std::string>::Err(
            "Event ID must not be a dot segment, got '" + std::string(id) + "'");
    }
    return Result<EventId, std::string>::Ok(EventId(std::string(id)));
}

// ---------------------------------------------------------------------------
// BaseUrl
// ---------------------------------------------------------------------------
Result<BaseUrl, std::string> BaseUrl::Create(std::string_view url) {
    if (url.empty()) {
        return Result<BaseUrl, std::string>::Err("Base URL must not be empty");
    }

    const auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return Result<BaseUrl, std::string>::Err(
            "Base URL must start with http:// or https://");
    }

    BaseUrl result;
    result.scheme_ = ToLower(url.substr(0, scheme_end));
    if (result.scheme_ != "http" && result.scheme_ != "https") {
        return Result<BaseUrl, std::string>::Err(
            "Unsupported URL scheme '" + result.scheme_ + "' (expected http or https)");
    }

    auto rest = url.substr(scheme_end + 3);
    const auto path_start = rest.find('/');
    auto authority = rest.substr(0, path_start);
    auto path = path_start == std::string_view::npos
                    ? std::string_view{}
                    : rest.substr(path_start);

    if (authority.find('@') != std::string_view::npos) {
        return Result<BaseUrl, std::string>::Err(
            "Base URL must not embed credentials");
    }
    if (rest.find_first_of("?#") != std::string_view::npos) {
        return Result<BaseUrl, std::string>::Err(
            "Base URL must not contain a query or fragment");
    }

    result.port_ = result.IsHttps() ? 443 : 80;
    const auto bracket = authority.find(']');
    const auto colon = authority.rfind(':');
    if (colon != std::string_view::npos &&
        (bracket == std::string_view::npos || colon > bracket)) {
        auto port_str = authority.substr(colon + 1);
        authority = authority.substr(0, colon);
        if (port_str.empty() || port_str.size() > 5 ||
            !std::all_of(port_str.begin(), port_str.end(),
                         [](char c) { return c >= '0' && c <= '9'; })) {
            return Result<BaseUrl, std::string>::Err(
                "Invalid port in base URL: '" + std::string(port_str) + "'");
        }
        const auto port = std::stoi(std::string(port_str));
        if (port <= 0 || port > 65535) {
            return Result<BaseUrl, std::string>::Err(
                "Port out of range in base URL: " + std::to_string(port));
        }
        result.port_ = static_cast<uint16_t>(port);
    }

    if (authority.empty()) {
        return Result<BaseUrl, std::string>::Err("Base URL has no host");
    }
    result.host_ = std::string(authority);

    // Normalise the prefix: no trailing slash, so endpoints ("/test") can be
    // appended directly.
    std::string prefix(path);
    while (!prefix.empty() && prefix.back() == '/') {
        prefix.pop_back();
    }
    result.path_prefix_ = std::move(prefix);

    result.value_ = result.scheme_ + "://" + std::string(rest.substr(0, path_start)) +
                    result.path_prefix_;
    return Result<BaseUrl, std::string>::Ok(std::move(result));
}

std::string BaseUrl::Origin() const {
    return scheme_ + "://" + host_ + ":" + std::to_string(port_);
}

} // namespace ftc_mcp
