#include <ftc_mcp/session/session_store.hpp>

#include <ftc_mcp/core/log.hpp>

#include <uuid/uuid.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace ftc_mcp {

namespace {

constexpr std::chrono::milliseconds kReapInterval{1000};

} // anonymous namespace

std::string GenerateSessionId() {
    uuid_t uuid;
    uuid_generate_random(uuid);
    char text[37];
    uuid_unparse_lower(uuid, text);
    return std::string(text);
}

SessionStore::SessionStore(ContextFactory factory, IdGenerator generate_id)
    : factory_(std::move(factory)), generate_id_(std::move(generate_id)) {}

SessionStore::~SessionStore() {
    Stop();
}

std::shared_ptr<Session> SessionStore::Create() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string id = generate_id_();
    constexpr int kMaxAttempts = 8;
    for (int attempt = 1; sessions_.count(id) > 0; ++attempt) {
        if (attempt >= kMaxAttempts) {
            throw std::runtime_error("Could not allocate a unique session id");
        }
        id = generate_id_();
    }

    auto context = factory_(id, events_);
    auto session = std::make_shared<Session>(id, std::move(context));
    sessions_.emplace(id, session);

    LogInfo("session", "Session initialized: " + id);
    return session;
}

Result<std::shared_ptr<Session>, Error> SessionStore::Lookup(
    const std::string& id) const {
    using R = Result<std::shared_ptr<Session>, Error>;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end() || it->second->IsClosed()) {
        return R::Err(Error{"SessionStore.Lookup", id, std::nullopt,
                            "Invalid session ID or session expired",
                            std::nullopt, ErrorCategory::SessionInvalid});
    }
    return R::Ok(it->second);
}

bool SessionStore::Remove(const std::string& id) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) {
            return false;
        }
        session = std::move(it->second);
        sessions_.erase(it);
    }
    // Outside the map lock: closing may push onto the event channel.
    session->Close();
    LogInfo("session", "Session closed: " + id);
    return true;
}

void SessionStore::CloseAll() {
    std::map<std::string, std::shared_ptr<Session>> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.swap(sessions_);
    }
    for (auto& [id, session] : drained) {
        session->Close();
    }
    for (auto& [id, session] : drained) {
        session->WaitIdle();
    }
    if (!drained.empty()) {
        LogInfo("session", "Closed " + std::to_string(drained.size()) + " session(s)");
    }
}

size_t SessionStore::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

size_t SessionStore::ExpireIdle(std::chrono::steady_clock::time_point now) {
    const std::chrono::seconds timeout{idle_timeout_.load()};
    if (timeout.count() <= 0) {
        return 0;
    }

    std::vector<std::string> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, session] : sessions_) {
            if (!session->IsBusy() && now - session->LastActive() > timeout) {
                expired.push_back(id);
            }
        }
    }

    size_t removed = 0;
    for (const auto& id : expired) {
        if (Remove(id)) {
            LogInfo("session", "Session expired after " +
                                   std::to_string(timeout.count()) + "s idle: " + id);
            ++removed;
        }
    }
    return removed;
}

void SessionStore::Start() {
    std::lock_guard<std::mutex> lock(reaper_mutex_);
    if (reaper_.joinable() || events_.IsShutdown()) {
        return;
    }
    reaper_ = std::thread([this] {
        for (;;) {
            if (auto event = events_.PopFor(kReapInterval)) {
                (void)HandleEvent(*event);
            } else if (events_.IsShutdown()) {
                break;
            }
            (void)ExpireIdle(std::chrono::steady_clock::now());
        }
        LogDebug("session", "Reaper stopped");
    });
}

void SessionStore::Stop() {
    std::lock_guard<std::mutex> lock(reaper_mutex_);
    events_.Shutdown();
    if (reaper_.joinable()) {
        reaper_.join();
    }
}

size_t SessionStore::ProcessPendingEvents() {
    size_t removed = 0;
    while (auto event = events_.TryPop()) {
        if (HandleEvent(*event)) {
            ++removed;
        }
    }
    return removed;
}

bool SessionStore::HandleEvent(const SessionEvent& event) {
    switch (event.kind) {
        case SessionEventKind::Closed:
            if (Remove(event.session_id)) {
                LogDebug("session", "Reaped closed session " + event.session_id);
                return true;
            }
            return false;
    }
    return false;
}

} // namespace ftc_mcp
