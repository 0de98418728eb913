#include "core/EventBus.h"

#include <utility>

namespace core {

EventBus::Subscription::Subscription(EventBus* bus, Kind kind, std::size_t id)
    : bus_(bus), kind_(kind), id_(id) {}

EventBus::Subscription::~Subscription() {
    reset();
}

EventBus::Subscription::Subscription(Subscription&& other) noexcept {
    bus_ = other.bus_;
    kind_ = other.kind_;
    id_ = other.id_;
    other.bus_ = nullptr;
    other.kind_ = Kind::None;
    other.id_ = 0;
}

EventBus::Subscription& EventBus::Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        reset();
        bus_ = other.bus_;
        kind_ = other.kind_;
        id_ = other.id_;
        other.bus_ = nullptr;
        other.kind_ = Kind::None;
        other.id_ = 0;
    }
    return *this;
}

void EventBus::Subscription::reset() {
    if (bus_ && id_ != 0) {
        bus_->unsubscribe(kind_, id_);
    }
    bus_ = nullptr;
    kind_ = Kind::None;
    id_ = 0;
}

template <typename Callback>
void EventBus::remove_(std::vector<CallbackData<Callback>>& listeners, std::size_t id) {
    for (std::size_t idx = 0; idx < listeners.size(); ++idx) {
        if (listeners[idx].id == id) {
            if (idx + 1 != listeners.size()) {
                listeners[idx] = std::move(listeners.back());
            }
            listeners.pop_back();
            break;
        }
    }
}

// A listener may unsubscribe itself (or another listener) while being invoked.
template <typename Callback, typename Event>
void EventBus::publishTo_(std::vector<CallbackData<Callback>>& listeners, const Event& event) {
    for (std::size_t idx = 0; idx < listeners.size();) {
        const std::size_t listenerId = listeners[idx].id;
        auto callback = listeners[idx].callback;
        if (callback) {
            callback(event);
        }
        if (idx < listeners.size() && listeners[idx].id == listenerId) {
            ++idx;
        }
    }
}

EventBus::Subscription EventBus::subscribeCacheUpdated(CacheUpdatedCallback callback) {
    const std::size_t id = nextId_++;
    cacheListeners_.push_back(CallbackData<CacheUpdatedCallback>{id, std::move(callback)});
    return Subscription(this, Subscription::Kind::Cache, id);
}

EventBus::Subscription EventBus::subscribeConnectionChanged(ConnectionChangedCallback callback) {
    const std::size_t id = nextId_++;
    connectionListeners_.push_back(CallbackData<ConnectionChangedCallback>{id, std::move(callback)});
    return Subscription(this, Subscription::Kind::Connection, id);
}

void EventBus::unsubscribe(Subscription::Kind kind, std::size_t id) {
    switch (kind) {
    case Subscription::Kind::Cache:
        remove_(cacheListeners_, id);
        break;
    case Subscription::Kind::Connection:
        remove_(connectionListeners_, id);
        break;
    case Subscription::Kind::None:
        break;
    }
}

void EventBus::publishCacheUpdated(const CacheUpdated& event) {
    publishTo_(cacheListeners_, event);
}

void EventBus::publishConnectionChanged(const ConnectionChanged& event) {
    publishTo_(connectionListeners_, event);
}

}  // namespace core
