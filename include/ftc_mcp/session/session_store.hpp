#pragma once

#include <ftc_mcp/core/result.hpp>
#include <ftc_mcp/session/i_session_context.hpp>
#include <ftc_mcp/session/session.hpp>
#include <ftc_mcp/session/session_events.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace ftc_mcp {

/// Random version-4 UUID in lowercase canonical form (libuuid).
std::string GenerateSessionId();

// ---------------------------------------------------------------------------
// SessionStore — registry of live sessions keyed by session id.
//
// Owns the map from id to Session and the event channel contexts report
// closure on. The reaper thread started by Start() drains that channel and
// removes closed sessions; tests may call ProcessPendingEvents() instead.
// With an idle timeout set, the reaper also drops sessions that have not
// seen a request for that long.
// All methods are thread-safe.
// ---------------------------------------------------------------------------
class SessionStore {
public:
    using ContextFactory = std::function<std::unique_ptr<ISessionContext>(
        const std::string& id, SessionEventChannel& events)>;
    using IdGenerator = std::function<std::string()>;

    explicit SessionStore(ContextFactory factory,
                          IdGenerator generate_id = GenerateSessionId);
    ~SessionStore();

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    /// Allocate a fresh id and context and register the session.
    [[nodiscard]] std::shared_ptr<Session> Create();

    /// SessionInvalid if the id is unknown or its session is closed.
    [[nodiscard]] Result<std::shared_ptr<Session>, Error> Lookup(
        const std::string& id) const;

    /// Remove and close the session. Returns false if it was already gone.
    bool Remove(const std::string& id);

    /// Close every session and wait for in-flight requests to finish.
    void CloseAll();

    [[nodiscard]] size_t Size() const;

    /// Sessions idle longer than this are removed by the reaper. Zero
    /// disables expiry.
    void SetIdleTimeout(std::chrono::seconds timeout) noexcept {
        idle_timeout_ = timeout.count();
    }

    /// Remove every session idle longer than the timeout as of `now`.
    /// Sessions with a request in flight are kept. Returns the number removed.
    size_t ExpireIdle(std::chrono::steady_clock::time_point now);

    /// Start the reaper thread. No-op if already running.
    void Start();

    /// Shut the event channel down and join the reaper. Idempotent.
    void Stop();

    /// Drain queued close events synchronously. Returns the number of
    /// sessions removed.
    size_t ProcessPendingEvents();

    [[nodiscard]] SessionEventChannel& Events() noexcept { return events_; }

private:
    bool HandleEvent(const SessionEvent& event);

    ContextFactory factory_;
    IdGenerator generate_id_;
    SessionEventChannel events_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Session>> sessions_;

    std::atomic<std::chrono::seconds::rep> idle_timeout_{0};

    std::mutex reaper_mutex_;
    std::thread reaper_;
};

} // namespace ftc_mcp
