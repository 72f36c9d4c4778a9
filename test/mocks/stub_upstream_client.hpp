#pragma once

#include <ftc_mcp/upstream/i_upstream_client.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

namespace ftc_mcp {
namespace testing {

// ---------------------------------------------------------------------------
// StubUpstreamClient — deterministic IUpstreamClient for dispatcher, session
// and router tests.
//
// TestConnection answers with a fixed timestamp. Event operations echo the
// event id and the operation name so callers can check attribution. A failure
// (Error or exception) can be configured for all operations at once. Every
// operation bumps its own counter. Thread-safe.
// ---------------------------------------------------------------------------
class StubUpstreamClient : public IUpstreamClient {
public:
    static constexpr const char* kFixedTimestamp = "2024-01-01T00:00:00.000Z";

    StubUpstreamClient() = default;

    // -- Configuration ------------------------------------------------------

    void FailWith(Error error) {
        std::lock_guard<std::mutex> lock(mutex_);
        failure_ = std::move(error);
    }

    void FailWithUpstreamMessage(const std::string& message) {
        FailWith(Error{"StubUpstreamClient", "", std::nullopt, message,
                       std::nullopt, ErrorCategory::Upstream});
    }

    void ThrowWith(const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        throw_message_ = message;
    }

    void Succeed() {
        std::lock_guard<std::mutex> lock(mutex_);
        failure_.reset();
        throw_message_.reset();
    }

    void SetDelay(std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        delay_ = delay;
    }

    void SetStatus(UpstreamStatus status) {
        std::lock_guard<std::mutex> lock(mutex_);
        status_ = std::move(status);
    }

    // -- IUpstreamClient ----------------------------------------------------

    Result<nlohmann::json, Error> TestConnection() override {
        ++test_connection_calls;
        return Respond("TestConnection", {
            {"message", "Connection successful"},
            {"timestamp", kFixedTimestamp},
        });
    }

    Result<nlohmann::json, Error> GetEventApplications(const EventId& id) override {
        ++applications_calls;
        return Respond("GetEventApplications", EventPayload("applications", id));
    }

    Result<nlohmann::json, Error> GetEventEvaluations(const EventId& id) override {
        ++evaluations_calls;
        return Respond("GetEventEvaluations", EventPayload("evaluations", id));
    }

    Result<nlohmann::json, Error> GetEvaluationCriteria(const EventId& id) override {
        ++criteria_calls;
        return Respond("GetEvaluationCriteria", EventPayload("criteria", id));
    }

    Result<nlohmann::json, Error> GetApplicationQuestions(const EventId& id) override {
        ++questions_calls;
        return Respond("GetApplicationQuestions", EventPayload("questions", id));
    }

    UpstreamStatus Status() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return status_;
    }

    // -- Call counters ------------------------------------------------------

    [[nodiscard]] int TotalCalls() const {
        return test_connection_calls + applications_calls + evaluations_calls +
               criteria_calls + questions_calls;
    }

    std::atomic<int> test_connection_calls{0};
    std::atomic<int> applications_calls{0};
    std::atomic<int> evaluations_calls{0};
    std::atomic<int> criteria_calls{0};
    std::atomic<int> questions_calls{0};

private:
    static nlohmann::json EventPayload(const std::string& resource, const EventId& id) {
        return {{"eventId", id.Value()}, {"resource", resource},
                {"items", nlohmann::json::array()}};
    }

    Result<nlohmann::json, Error> Respond(const std::string& operation,
                                          nlohmann::json payload) {
        std::optional<Error> failure;
        std::optional<std::string> throw_message;
        std::chrono::milliseconds delay{0};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            failure = failure_;
            throw_message = throw_message_;
            delay = delay_;
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        if (throw_message) {
            throw std::runtime_error(*throw_message);
        }
        if (failure) {
            failure->operation = operation;
            return Result<nlohmann::json, Error>::Err(*failure);
        }
        return Result<nlohmann::json, Error>::Ok(std::move(payload));
    }

    mutable std::mutex mutex_;
    std::optional<Error> failure_;
    std::optional<std::string> throw_message_;
    std::chrono::milliseconds delay_{0};
    UpstreamStatus status_{true, "http://stub.invalid/api", true};
};

} // namespace testing
} // namespace ftc_mcp
