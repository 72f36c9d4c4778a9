#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace ftc_mcp {

// ---------------------------------------------------------------------------
// SessionEvent — lifecycle notification emitted by a session context.
// ---------------------------------------------------------------------------
enum class SessionEventKind {
    Closed,
};

struct SessionEvent {
    SessionEventKind kind = SessionEventKind::Closed;
    std::string session_id;
};

// ---------------------------------------------------------------------------
// SessionEventChannel — multi-producer, single-consumer queue of session
// events. Contexts push from whatever thread closes them; the session store
// is the only consumer and performs the teardown.
// ---------------------------------------------------------------------------
class SessionEventChannel {
public:
    SessionEventChannel() = default;

    SessionEventChannel(const SessionEventChannel&) = delete;
    SessionEventChannel& operator=(const SessionEventChannel&) = delete;

    /// Enqueue an event. Returns false once the channel is shut down.
    bool Push(SessionEvent event);

    /// Block until an event is available or the channel is shut down.
    /// Returns nullopt only after Shutdown() with an empty queue.
    std::optional<SessionEvent> Pop();

    /// Pop() that gives up after `timeout`. nullopt on timeout or shutdown.
    std::optional<SessionEvent> PopFor(std::chrono::milliseconds timeout);

    /// Non-blocking variant of Pop().
    std::optional<SessionEvent> TryPop();

    /// Wake the consumer and refuse further events. Queued events can still
    /// be drained.
    void Shutdown();

    [[nodiscard]] bool IsShutdown() const;
    [[nodiscard]] size_t Pending() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<SessionEvent> queue_;
    bool shutdown_ = false;
};

} // namespace ftc_mcp
