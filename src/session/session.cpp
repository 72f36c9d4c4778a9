#include <ftc_mcp/session/session.hpp>

#include <ftc_mcp/core/log.hpp>

namespace ftc_mcp {

namespace {

Error MakeClosedError(const std::string& id, const std::string& message) {
    return Error{"Session.Handle", id, std::nullopt, message, std::nullopt,
                 ErrorCategory::SessionInvalid};
}

} // anonymous namespace

Session::Session(std::string id, std::unique_ptr<ISessionContext> context)
    : id_(std::move(id)),
      created_at_(std::chrono::system_clock::now()),
      context_(std::move(context)),
      last_active_(std::chrono::steady_clock::now().time_since_epoch().count()) {}

bool Session::IsClosed() const {
    return context_->IsClosed();
}

std::chrono::steady_clock::time_point Session::LastActive() const noexcept {
    return std::chrono::steady_clock::time_point(
        std::chrono::steady_clock::duration(last_active_.load()));
}

Result<std::optional<nlohmann::json>, Error> Session::Handle(
    const nlohmann::json& message) {
    using R = Result<std::optional<nlohmann::json>, Error>;

    ++in_flight_;
    struct InFlightGuard {
        std::atomic<int>& count;
        ~InFlightGuard() { --count; }
    } in_flight_guard{in_flight_};
    last_active_ = std::chrono::steady_clock::now().time_since_epoch().count();

    std::lock_guard<std::mutex> lock(handle_mutex_);
    const ScopedLogSession log_scope(id_);
    if (context_->IsClosed()) {
        return R::Err(MakeClosedError(id_, "Session is closed"));
    }

    auto response = context_->HandleMessage(message);

    if (context_->IsClosed()) {
        LogDebug("session", "Discarding result for closed session " + id_);
        return R::Err(MakeClosedError(id_, "Session closed while the request was in flight"));
    }
    return R::Ok(std::move(response));
}

void Session::Close() {
    context_->Close();
}

void Session::WaitIdle() {
    std::lock_guard<std::mutex> lock(handle_mutex_);
}

} // namespace ftc_mcp
