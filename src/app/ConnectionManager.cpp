#include "app/ConnectionManager.h"

#include <algorithm>
#include <exception>
#include <utility>

#include "core/EventBus.h"
#include "infra/net/Url.h"
#include "logging/Log.h"

namespace app {

using Event = core::ConnectionStateMachine::Event;
using Action = core::ConnectionStateMachine::Action;
using domain::ConnectionState;
using domain::ConnectionStatus;

ConnectionManager::ConnectionManager(core::Scheduler& scheduler,
                                     infra::net::ChannelFactory& factory,
                                     core::EventBus* eventBus,
                                     Options options)
    : scheduler_(scheduler),
      factory_(factory),
      eventBus_(eventBus),
      options_(std::move(options)),
      machine_(options_.maxAttempts),
      alive_(std::make_shared<int>(0)) {}

ConnectionManager::~ConnectionManager() {
    closeAll();
    alive_.reset();
}

ConnectionManager::Handle ConnectionManager::open(const domain::ChannelKey& key) {
    const Handle handle = nextHandle_++;
    handles_.emplace(handle, HandleRecord{key, {}, {}});

    auto it = connections_.find(key);
    if (it == connections_.end()) {
        Connection conn;
        conn.key = key;
        conn.url = infra::net::joinUrl(options_.baseUrl, key);
        it = connections_.emplace(key, std::move(conn)).first;
    }
    Connection& conn = it->second;
    ++conn.refCount;
    LOG_DEBUG(logging::LogCategory::NET, "open %s handle=%llu refs=%d", key.c_str(),
              static_cast<unsigned long long>(handle), conn.refCount);

    apply_(conn, Event::OpenRequested);
    return handle;
}

void ConnectionManager::close(Handle handle) {
    auto it = handles_.find(handle);
    if (it == handles_.end()) {
        return;
    }
    const domain::ChannelKey key = it->second.key;
    handles_.erase(it);

    auto connIt = connections_.find(key);
    if (connIt == connections_.end()) {
        return;
    }
    Connection& conn = connIt->second;
    if (--conn.refCount > 0) {
        return;
    }

    apply_(conn, Event::CloseRequested);
    // Listeners may have re-opened the key while being notified.
    connIt = connections_.find(key);
    if (connIt != connections_.end() && connIt->second.refCount <= 0) {
        cancelReconnect_(connIt->second);
        dropTransport_(connIt->second);
        connections_.erase(connIt);
        LOG_DEBUG(logging::LogCategory::NET, "channel %s released", key.c_str());
    }
}

void ConnectionManager::closeAll() {
    std::vector<Handle> open;
    open.reserve(handles_.size());
    for (const auto& item : handles_) {
        open.push_back(item.first);
    }
    for (Handle handle : open) {
        close(handle);
    }
}

void ConnectionManager::onMessage(Handle handle, MessageCallback callback) {
    auto it = handles_.find(handle);
    LOG_GUARD(it != handles_.end(), logging::LogCategory::NET, "onMessage on unknown handle");
    it->second.messageCallbacks.push_back(std::move(callback));
}

void ConnectionManager::onStateChange(Handle handle, StateCallback callback) {
    auto it = handles_.find(handle);
    LOG_GUARD(it != handles_.end(), logging::LogCategory::NET, "onStateChange on unknown handle");
    it->second.stateCallbacks.push_back(std::move(callback));
}

void ConnectionManager::onResync(ResyncCallback callback) {
    resyncCallbacks_.push_back(std::move(callback));
}

ConnectionState ConnectionManager::state(Handle handle) const {
    auto it = handles_.find(handle);
    if (it == handles_.end()) {
        return ConnectionState{};
    }
    return stateOf(it->second.key);
}

ConnectionState ConnectionManager::stateOf(const domain::ChannelKey& key) const {
    auto it = connections_.find(key);
    if (it == connections_.end()) {
        return ConnectionState{};
    }
    return it->second.state;
}

void ConnectionManager::reconnect(Handle handle) {
    auto it = handles_.find(handle);
    LOG_GUARD(it != handles_.end(), logging::LogCategory::NET, "reconnect on unknown handle");
    auto connIt = connections_.find(it->second.key);
    if (connIt == connections_.end()) {
        return;
    }
    apply_(connIt->second, Event::ManualRetry);
}

void ConnectionManager::setVisible(bool visible) {
    const bool becameVisible = visible && !visible_;
    visible_ = visible;
    if (!becameVisible) {
        return;
    }

    LOG_INFO(logging::LogCategory::UI, "became visible, resyncing");
    std::vector<domain::ChannelKey> keys;
    keys.reserve(connections_.size());
    for (const auto& item : connections_) {
        keys.push_back(item.first);
    }
    for (const auto& key : keys) {
        auto it = connections_.find(key);
        if (it != connections_.end() && it->second.state.status != ConnectionStatus::Connected) {
            apply_(it->second, Event::BecameVisible);
        }
    }

    const auto callbacks = resyncCallbacks_;
    for (const auto& callback : callbacks) {
        try {
            callback();
        }
        catch (const std::exception& ex) {
            LOG_ERROR(logging::LogCategory::UI, "resync listener threw: %s", ex.what());
        }
    }
}

std::size_t ConnectionManager::openConnectionCount() const {
    return static_cast<std::size_t>(std::count_if(connections_.begin(), connections_.end(),
                                                  [](const auto& item) { return item.second.channel != nullptr; }));
}

void ConnectionManager::apply_(Connection& conn, Event event, const std::optional<std::string>& error) {
    const ConnectionState previous = conn.state;
    const auto transition = machine_.apply(previous, event, error);
    conn.state = transition.state;

    LOG_TRACE(logging::LogCategory::NET,
              "%s: %s -> %s (%s)",
              conn.key.c_str(),
              core::ConnectionStateMachine::eventName(event),
              domain::to_string(conn.state.status),
              core::ConnectionStateMachine::actionName(transition.action));

    switch (transition.action) {
    case Action::Connect:
        connect_(conn);
        break;
    case Action::ScheduleReconnect:
        dropTransport_(conn);
        scheduleReconnect_(conn);
        break;
    case Action::Disconnect:
        cancelReconnect_(conn);
        dropTransport_(conn);
        break;
    case Action::None:
        if (conn.state.status == ConnectionStatus::Failed) {
            cancelReconnect_(conn);
            dropTransport_(conn);
        }
        break;
    }

    if (conn.state != previous) {
        if (conn.state.status == ConnectionStatus::Failed) {
            LOG_ERROR(logging::LogCategory::NET,
                      "%s failed after %d attempts: %s",
                      conn.key.c_str(),
                      conn.state.attempt,
                      conn.state.lastError.value_or("unknown").c_str());
        }
        else if (conn.state.status != previous.status) {
            LOG_INFO(logging::LogCategory::NET,
                     "%s %s -> %s attempt=%d",
                     conn.key.c_str(),
                     domain::to_string(previous.status),
                     domain::to_string(conn.state.status),
                     conn.state.attempt);
        }
        // conn may not survive the listeners.
        const domain::ChannelKey key = conn.key;
        const ConnectionState state = conn.state;
        notify_(key, state);
    }
}

void ConnectionManager::connect_(Connection& conn) {
    cancelReconnect_(conn);
    // At most one live transport per key: the old one goes first.
    dropTransport_(conn);

    const std::uint64_t generation = nextGeneration_++;
    conn.generation = generation;
    conn.channel = factory_.create(conn.url);

    const domain::ChannelKey key = conn.key;
    std::weak_ptr<int> alive = alive_;

    infra::net::ChannelCallbacks callbacks;
    callbacks.onOpen = [this, alive, key, generation]() {
        if (alive.expired()) {
            return;
        }
        if (auto* current = find_(key, generation)) {
            apply_(*current, Event::Opened);
        }
    };
    callbacks.onMessage = [this, alive, key, generation](std::string frame) {
        if (alive.expired() || !find_(key, generation)) {
            return;
        }
        deliver_(key, frame);
    };
    callbacks.onClose = [this, alive, key, generation](const std::string& reason) {
        if (alive.expired()) {
            return;
        }
        if (auto* current = find_(key, generation)) {
            LOG_WARN(logging::LogCategory::NET, "%s closed: %s", key.c_str(), reason.c_str());
            apply_(*current, Event::ClosedUnexpectedly, reason);
        }
    };

    LOG_DEBUG(logging::LogCategory::NET, "connecting %s attempt=%d", conn.url.c_str(), conn.state.attempt);
    conn.channel->open(std::move(callbacks));
}

void ConnectionManager::scheduleReconnect_(Connection& conn) {
    cancelReconnect_(conn);
    const domain::ChannelKey key = conn.key;
    const std::uint64_t generation = conn.generation;
    std::weak_ptr<int> alive = alive_;
    conn.reconnectTimer = scheduler_.schedule(options_.reconnectInterval, [this, alive, key, generation]() {
        if (alive.expired()) {
            return;
        }
        if (auto* current = find_(key, generation)) {
            current->reconnectTimer = core::Scheduler::kInvalidTimer;
            apply_(*current, Event::ReconnectTimerFired);
        }
    });
    LOG_DEBUG(logging::LogCategory::NET,
              "%s reconnect %d/%d in %lld ms",
              key.c_str(),
              conn.state.attempt,
              machine_.maxAttempts(),
              static_cast<long long>(options_.reconnectInterval.count()));
}

void ConnectionManager::cancelReconnect_(Connection& conn) {
    if (conn.reconnectTimer != core::Scheduler::kInvalidTimer) {
        scheduler_.cancel(conn.reconnectTimer);
        conn.reconnectTimer = core::Scheduler::kInvalidTimer;
    }
}

void ConnectionManager::dropTransport_(Connection& conn) {
    if (!conn.channel) {
        return;
    }
    std::shared_ptr<infra::net::Channel> channel(conn.channel.release());
    // Late callbacks from the dropped transport no longer match.
    conn.generation = nextGeneration_++;
    channel->close();
    // Released on a later turn: we may be inside one of its callbacks.
    scheduler_.post([channel]() {});
}

void ConnectionManager::notify_(const domain::ChannelKey& key, const ConnectionState& state) {
    std::vector<StateCallback> callbacks;
    for (const auto& item : handles_) {
        if (item.second.key == key) {
            callbacks.insert(callbacks.end(), item.second.stateCallbacks.begin(), item.second.stateCallbacks.end());
        }
    }
    for (const auto& callback : callbacks) {
        try {
            callback(state);
        }
        catch (const std::exception& ex) {
            LOG_ERROR(logging::LogCategory::NET, "%s state listener threw: %s", key.c_str(), ex.what());
        }
    }
    if (eventBus_) {
        eventBus_->publishConnectionChanged(core::EventBus::ConnectionChanged{key, state});
    }
}

void ConnectionManager::deliver_(const domain::ChannelKey& key, const std::string& frame) {
    std::vector<MessageCallback> callbacks;
    for (const auto& item : handles_) {
        if (item.second.key == key) {
            callbacks.insert(callbacks.end(), item.second.messageCallbacks.begin(), item.second.messageCallbacks.end());
        }
    }
    for (const auto& callback : callbacks) {
        try {
            callback(frame);
        }
        catch (const std::exception& ex) {
            LOG_ERROR(logging::LogCategory::NET, "%s message listener threw: %s", key.c_str(), ex.what());
        }
    }
}

ConnectionManager::Connection* ConnectionManager::find_(const domain::ChannelKey& key, std::uint64_t generation) {
    auto it = connections_.find(key);
    if (it == connections_.end() || it->second.generation != generation) {
        return nullptr;
    }
    return &it->second;
}

}  // namespace app
