#pragma once

#include <optional>
#include <string>

#include "domain/Types.h"

namespace core {

// Pure reconnect policy: (state, event) -> (state, action). Owns no timers or sockets.
class ConnectionStateMachine {
public:
    enum class Event {
        OpenRequested,
        Opened,
        ClosedUnexpectedly,
        CloseRequested,
        ReconnectTimerFired,
        ManualRetry,
        BecameVisible,
    };

    enum class Action {
        None,
        Connect,           // replace the transport with a fresh attempt now
        ScheduleReconnect, // arm the reconnect timer
        Disconnect,        // cancel timers and close the transport
    };

    struct Transition {
        domain::ConnectionState state;
        Action action{Action::None};
    };

    explicit ConnectionStateMachine(int maxAttempts);

    Transition apply(const domain::ConnectionState& current, Event event,
                     const std::optional<std::string>& error = std::nullopt) const;

    int maxAttempts() const noexcept { return maxAttempts_; }

    static const char* eventName(Event event) noexcept;
    static const char* actionName(Action action) noexcept;

private:
    Transition onClosed_(const domain::ConnectionState& current, const std::optional<std::string>& error) const;

    int maxAttempts_;
};

}  // namespace core
