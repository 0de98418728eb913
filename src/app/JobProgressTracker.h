#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "app/ConnectionManager.h"
#include "app/MessageRouter.h"
#include "core/Scheduler.h"
#include "domain/Types.h"

namespace app {

struct JobSubscription {
    domain::JobId jobId;
    domain::ChannelKey channelKey;
    ConnectionManager::Handle channelRef{ConnectionManager::kInvalidHandle};
    domain::JobProgress progress{};
    int refCount{0};
};

// One scoped channel per tracked job. A job reaching a terminal status is removed
// and its channel closed once listeners have seen the final snapshot.
class JobProgressTracker {
public:
    using Listener = std::function<void(const domain::JobProgress&)>;
    using ListenerId = std::size_t;

    struct Options {
        std::string backtestChannel{"/ws/backtest/%s"};
        std::string collectionChannel{"/ws/data/collect/%s"};
        std::string repairChannel{"/ws/data/repair/%s"};
    };

    JobProgressTracker(ConnectionManager& connections, const core::Scheduler& clock, Options options);
    ~JobProgressTracker();

    JobProgressTracker(const JobProgressTracker&) = delete;
    JobProgressTracker& operator=(const JobProgressTracker&) = delete;

    // Subscribing again to a tracked job shares its channel and bumps the reference count.
    JobSubscription subscribe(const domain::JobId& jobId, domain::JobKind kind = domain::JobKind::Backtest);
    void unsubscribe(const domain::JobId& jobId);
    // Local cancellation; the job becomes terminal and its channel closes.
    void cancel(const domain::JobId& jobId);
    void clear();

    std::optional<domain::JobProgress> snapshot(const domain::JobId& jobId) const;
    bool isTracking(const domain::JobId& jobId) const { return jobs_.count(jobId) != 0; }
    std::size_t activeCount() const noexcept { return jobs_.size(); }

    ListenerId addListener(Listener listener);
    void removeListener(ListenerId id);

    domain::ChannelKey channelFor(domain::JobKind kind, const domain::JobId& jobId) const;

private:
    struct Tracked {
        JobSubscription subscription;
        std::unique_ptr<MessageRouter> router;
    };

    void onProgress_(const domain::JobId& jobId, const Message& message);
    void onChannelState_(const domain::JobId& jobId, const domain::ConnectionState& state);
    void publish_(const domain::JobProgress& progress);
    void finish_(const domain::JobId& jobId);

    ConnectionManager& connections_;
    const core::Scheduler& clock_;
    Options options_;
    std::unordered_map<domain::JobId, std::shared_ptr<Tracked>> jobs_;
    std::vector<std::pair<ListenerId, Listener>> listeners_;
    ListenerId nextListenerId_{1};
};

}  // namespace app
