#pragma once

#include <cstddef>
#include <functional>
#include <vector>

#include "core/CacheEntry.h"
#include "domain/Types.h"

namespace core {

class EventBus {
public:
    struct CacheUpdated {
        domain::DomainKey key;
        CacheSnapshot snapshot;
    };

    struct ConnectionChanged {
        domain::ChannelKey key;
        domain::ConnectionState state;
    };

    using CacheUpdatedCallback = std::function<void(const CacheUpdated&)>;
    using ConnectionChangedCallback = std::function<void(const ConnectionChanged&)>;

    class Subscription {
    public:
        enum class Kind { None, Cache, Connection };

        Subscription() = default;
        Subscription(EventBus* bus, Kind kind, std::size_t id);
        ~Subscription();

        Subscription(Subscription&& other) noexcept;
        Subscription& operator=(Subscription&& other) noexcept;

        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        void reset();

    private:
        EventBus* bus_{nullptr};
        Kind kind_{Kind::None};
        std::size_t id_{0};
    };

    Subscription subscribeCacheUpdated(CacheUpdatedCallback callback);
    Subscription subscribeConnectionChanged(ConnectionChangedCallback callback);
    void unsubscribe(Subscription::Kind kind, std::size_t id);

    void publishCacheUpdated(const CacheUpdated& event);
    void publishConnectionChanged(const ConnectionChanged& event);

private:
    template <typename Callback>
    struct CallbackData {
        std::size_t id{};
        Callback callback{};
    };

    template <typename Callback, typename Event>
    static void publishTo_(std::vector<CallbackData<Callback>>& listeners, const Event& event);

    template <typename Callback>
    static void remove_(std::vector<CallbackData<Callback>>& listeners, std::size_t id);

    std::vector<CallbackData<CacheUpdatedCallback>> cacheListeners_;
    std::vector<CallbackData<ConnectionChangedCallback>> connectionListeners_;
    std::size_t nextId_{1};
};

}  // namespace core
