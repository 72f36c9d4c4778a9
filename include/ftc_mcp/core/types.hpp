#pragma once

#include <ftc_mcp/core/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace ftc_mcp {

// ---------------------------------------------------------------------------
// EventId — identifier of an FTC Platform event as accepted by the upstream
// API. Opaque to us (usually a UUID), but never empty, at most 128 characters
// and free of whitespace and control characters.
// ---------------------------------------------------------------------------
class EventId {
public:
    static Result<EventId, std::string> Create(std::string_view id);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const EventId& other) const { return value_ == other.value_; }
    bool operator!=(const EventId& other) const { return value_ != other.value_; }

private:
    explicit EventId(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// BaseUrl — validated http(s) base URL of the upstream API, split into the
// origin the HTTP client connects to and the path prefix every endpoint is
// appended to.
//
//   "https://ftc.example.com/api/mastra"
//     scheme = "https", host = "ftc.example.com", port = 443,
//     path_prefix = "/api/mastra"
// ---------------------------------------------------------------------------
class BaseUrl {
public:
    static Result<BaseUrl, std::string> Create(std::string_view url);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }
    [[nodiscard]] const std::string& Scheme() const noexcept { return scheme_; }
    [[nodiscard]] const std::string& Host() const noexcept { return host_; }
    [[nodiscard]] uint16_t Port() const noexcept { return port_; }
    [[nodiscard]] const std::string& PathPrefix() const noexcept { return path_prefix_; }
    [[nodiscard]] bool IsHttps() const noexcept { return scheme_ == "https"; }

    /// "scheme://host:port" — what httplib::Client expects.
    [[nodiscard]] std::string Origin() const;

    bool operator==(const BaseUrl& other) const { return value_ == other.value_; }
    bool operator!=(const BaseUrl& other) const { return value_ != other.value_; }

private:
    BaseUrl() = default;

    std::string value_;
    std::string scheme_;
    std::string host_;
    uint16_t port_ = 0;
    std::string path_prefix_;
};

} // namespace ftc_mcp
