#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/ConnectionStateMachine.h"
#include "core/Scheduler.h"
#include "domain/Types.h"
#include "infra/net/Channel.h"

namespace core {
class EventBus;
}

namespace app {

// Owns every duplex channel. Handles to the same channel key share one physical
// connection; the connection closes with its last handle.
class ConnectionManager {
public:
    using Handle = std::uint64_t;
    using MessageCallback = std::function<void(const std::string&)>;
    using StateCallback = std::function<void(const domain::ConnectionState&)>;
    using ResyncCallback = std::function<void()>;

    static constexpr Handle kInvalidHandle = 0;

    struct Options {
        std::string baseUrl{"ws://localhost:8000"};
        std::chrono::milliseconds reconnectInterval{3000};
        int maxAttempts{5};
    };

    ConnectionManager(core::Scheduler& scheduler,
                      infra::net::ChannelFactory& factory,
                      core::EventBus* eventBus,
                      Options options);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    Handle open(const domain::ChannelKey& key);
    void close(Handle handle);
    void closeAll();

    void onMessage(Handle handle, MessageCallback callback);
    void onStateChange(Handle handle, StateCallback callback);
    void onResync(ResyncCallback callback);

    domain::ConnectionState state(Handle handle) const;
    domain::ConnectionState stateOf(const domain::ChannelKey& key) const;

    // Manual retry; the only way out of Failed besides visibility.
    void reconnect(Handle handle);
    void setVisible(bool visible);
    bool isVisible() const noexcept { return visible_; }

    // Live transport objects, not handles.
    std::size_t openConnectionCount() const;
    std::size_t channelCount() const noexcept { return connections_.size(); }
    std::size_t handleCount() const noexcept { return handles_.size(); }

private:
    struct HandleRecord {
        domain::ChannelKey key;
        std::vector<MessageCallback> messageCallbacks;
        std::vector<StateCallback> stateCallbacks;
    };

    struct Connection {
        domain::ChannelKey key;
        std::string url;
        domain::ConnectionState state{};
        std::unique_ptr<infra::net::Channel> channel;
        std::uint64_t generation{0};
        core::Scheduler::TimerId reconnectTimer{core::Scheduler::kInvalidTimer};
        int refCount{0};
    };

    void apply_(Connection& conn, core::ConnectionStateMachine::Event event, const std::optional<std::string>& error = std::nullopt);
    void connect_(Connection& conn);
    void scheduleReconnect_(Connection& conn);
    void cancelReconnect_(Connection& conn);
    void dropTransport_(Connection& conn);
    void notify_(const domain::ChannelKey& key, const domain::ConnectionState& state);
    void deliver_(const domain::ChannelKey& key, const std::string& frame);
    Connection* find_(const domain::ChannelKey& key, std::uint64_t generation);

    core::Scheduler& scheduler_;
    infra::net::ChannelFactory& factory_;
    core::EventBus* eventBus_{nullptr};
    Options options_;
    core::ConnectionStateMachine machine_;

    std::unordered_map<Handle, HandleRecord> handles_;
    std::unordered_map<domain::ChannelKey, Connection> connections_;
    std::vector<ResyncCallback> resyncCallbacks_;
    Handle nextHandle_{1};
    std::uint64_t nextGeneration_{1};
    bool visible_{true};
    std::shared_ptr<int> alive_;
};

}  // namespace app
