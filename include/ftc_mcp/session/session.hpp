#pragma once

#include <ftc_mcp/core/result.hpp>
#include <ftc_mcp/session/i_session_context.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace ftc_mcp {

// ---------------------------------------------------------------------------
// Session — one client's protocol conversation: id, creation time and the
// owned context.
//
// Requests are serialised per session: Handle() runs the context under the
// session's own mutex, so concurrent requests carrying the same id are
// processed one after another in lock-acquisition order. Close() never waits
// for an in-flight request; a result produced after the session was closed
// is discarded and the caller gets SessionInvalid.
// ---------------------------------------------------------------------------
class Session {
public:
    Session(std::string id, std::unique_ptr<ISessionContext> context);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    [[nodiscard]] const std::string& Id() const noexcept { return id_; }

    [[nodiscard]] std::chrono::system_clock::time_point CreatedAt() const noexcept {
        return created_at_;
    }

    [[nodiscard]] bool IsClosed() const;

    /// Start of the most recent request, or creation time if none yet.
    [[nodiscard]] std::chrono::steady_clock::time_point LastActive() const noexcept;

    /// True while a request is being handled.
    [[nodiscard]] bool IsBusy() const noexcept { return in_flight_.load() > 0; }

    /// Forward one message to the context.
    [[nodiscard]] Result<std::optional<nlohmann::json>, Error> Handle(
        const nlohmann::json& message);

    /// Close the context (idempotent, non-blocking).
    void Close();

    /// Block until no request is running on this session.
    void WaitIdle();

private:
    std::string id_;
    std::chrono::system_clock::time_point created_at_;
    std::unique_ptr<ISessionContext> context_;
    std::mutex handle_mutex_;
    std::atomic<std::chrono::steady_clock::rep> last_active_;
    std::atomic<int> in_flight_{0};
};

} // namespace ftc_mcp
