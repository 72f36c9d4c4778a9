#pragma once

#include <optional>

#include <nlohmann/json.hpp>

namespace ftc_mcp {

// ---------------------------------------------------------------------------
// ISessionContext — protocol state owned by exactly one Session.
//
// HandleMessage is only ever called by the owning Session, one call at a
// time. Close may be called from any thread, including while HandleMessage
// is running; it must not block and must notify the session store (through
// the event channel the context was created with) exactly once.
// ---------------------------------------------------------------------------
class ISessionContext {
public:
    virtual ~ISessionContext() = default;

    /// Handle one JSON-RPC message. Returns nullopt for notifications.
    [[nodiscard]] virtual std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message) = 0;

    virtual void Close() = 0;

    [[nodiscard]] virtual bool IsClosed() const = 0;
};

} // namespace ftc_mcp
