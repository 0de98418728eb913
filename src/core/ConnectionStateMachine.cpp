#include "core/ConnectionStateMachine.h"

#include <algorithm>

namespace core {

using domain::ConnectionState;
using domain::ConnectionStatus;

ConnectionStateMachine::ConnectionStateMachine(int maxAttempts) : maxAttempts_(std::max(maxAttempts, 0)) {}

ConnectionStateMachine::Transition ConnectionStateMachine::apply(const ConnectionState& current,
                                                                 Event event,
                                                                 const std::optional<std::string>& error) const {
    Transition next{current, Action::None};

    switch (event) {
    case Event::OpenRequested:
        if (current.status == ConnectionStatus::Disconnected || current.status == ConnectionStatus::Failed) {
            next.state = ConnectionState{ConnectionStatus::Connecting, 0, current.lastError};
            next.action = Action::Connect;
        }
        break;

    case Event::Opened:
        if (current.status == ConnectionStatus::Connecting) {
            next.state = ConnectionState{ConnectionStatus::Connected, 0, std::nullopt};
        }
        break;

    case Event::ClosedUnexpectedly:
        if (current.status == ConnectionStatus::Connected || current.status == ConnectionStatus::Connecting) {
            next = onClosed_(current, error);
        }
        break;

    case Event::CloseRequested:
        next.state = ConnectionState{ConnectionStatus::Disconnected, 0, current.lastError};
        next.action = Action::Disconnect;
        break;

    case Event::ReconnectTimerFired:
        if (current.status == ConnectionStatus::Reconnecting) {
            next.state = ConnectionState{ConnectionStatus::Connecting, current.attempt, current.lastError};
            next.action = Action::Connect;
        }
        break;

    case Event::ManualRetry:
    case Event::BecameVisible:
        if (current.status == ConnectionStatus::Disconnected || current.status == ConnectionStatus::Failed) {
            next.state = ConnectionState{ConnectionStatus::Connecting, 0, current.lastError};
            next.action = Action::Connect;
        }
        else if (current.status == ConnectionStatus::Reconnecting) {
            // Skip the remaining wait; the attempt count is kept.
            next.state = ConnectionState{ConnectionStatus::Connecting, current.attempt, current.lastError};
            next.action = Action::Connect;
        }
        break;
    }

    return next;
}

ConnectionStateMachine::Transition ConnectionStateMachine::onClosed_(const ConnectionState& current,
                                                                     const std::optional<std::string>& error) const {
    const auto lastError = error ? error : current.lastError;
    if (current.attempt >= maxAttempts_) {
        return Transition{ConnectionState{ConnectionStatus::Failed, current.attempt, lastError}, Action::None};
    }
    return Transition{ConnectionState{ConnectionStatus::Reconnecting, current.attempt + 1, lastError},
                      Action::ScheduleReconnect};
}

const char* ConnectionStateMachine::eventName(Event event) noexcept {
    switch (event) {
    case Event::OpenRequested:
        return "open_requested";
    case Event::Opened:
        return "opened";
    case Event::ClosedUnexpectedly:
        return "closed_unexpectedly";
    case Event::CloseRequested:
        return "close_requested";
    case Event::ReconnectTimerFired:
        return "reconnect_timer";
    case Event::ManualRetry:
        return "manual_retry";
    case Event::BecameVisible:
        return "became_visible";
    }
    return "unknown";
}

const char* ConnectionStateMachine::actionName(Action action) noexcept {
    switch (action) {
    case Action::None:
        return "none";
    case Action::Connect:
        return "connect";
    case Action::ScheduleReconnect:
        return "schedule_reconnect";
    case Action::Disconnect:
        return "disconnect";
    }
    return "unknown";
}

}  // namespace core
