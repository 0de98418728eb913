#pragma once

#include <memory>
#include <string>
#include <vector>

#include "app/ConnectionManager.h"
#include "app/JobProgressTracker.h"
#include "app/MessageRouter.h"
#include "app/NotificationDispatcher.h"
#include "config/Config.h"
#include "core/CacheStore.h"
#include "core/EventBus.h"
#include "core/Scheduler.h"
#include "infra/api/DashboardApi.h"
#include "infra/net/Channel.h"
#include "infra/net/HttpClient.h"

namespace app {

// Application root: owns one of every component and wires pushes into the cache.
class SyncService {
public:
    static constexpr const char* kDashboardChannel = "/ws/dashboard";

    static constexpr const char* kRatesDomain = "rates/current";
    static constexpr const char* kSignalsDomain = "signals/current";
    static constexpr const char* kPredictionsDomain = "predictions/latest";
    static constexpr const char* kAlertsDomain = "alerts/active";

    SyncService(const config::Config& config,
                core::Scheduler& scheduler,
                infra::net::ChannelFactory& channels,
                infra::net::HttpClient& http,
                Notifier& notifier);
    ~SyncService();

    SyncService(const SyncService&) = delete;
    SyncService& operator=(const SyncService&) = delete;

    void init();
    void teardown();
    bool isActive() const noexcept { return active_; }

    // Triggers a job over REST and tracks it once the server returns its id.
    void triggerJob(domain::JobKind kind, boost::json::object params, infra::api::DashboardApi::TriggerCallback callback);
    JobSubscription trackJob(const domain::JobId& jobId, domain::JobKind kind);
    void setVisible(bool visible);

    domain::ConnectionState dashboardState() const;

    core::EventBus& events() noexcept { return eventBus_; }
    core::CacheStore& cache() noexcept { return cache_; }
    ConnectionManager& connections() noexcept { return connections_; }
    MessageRouter& router() noexcept { return router_; }
    NotificationDispatcher& notifications() noexcept { return notifications_; }
    JobProgressTracker& jobs() noexcept { return jobs_; }
    infra::api::DashboardApi& api() noexcept { return api_; }

private:
    void registerPushHandlers_();

    config::Config config_;
    core::Scheduler& scheduler_;
    core::EventBus eventBus_;
    core::CacheStore cache_;
    ConnectionManager connections_;
    MessageRouter router_;
    NotificationDispatcher notifications_;
    JobProgressTracker jobs_;
    infra::api::DashboardApi api_;

    std::vector<MessageRouter::HandlerId> pushHandlers_;
    std::vector<domain::DomainKey> polled_;
    ConnectionManager::Handle dashboard_{ConnectionManager::kInvalidHandle};
    bool active_{false};
};

}  // namespace app
