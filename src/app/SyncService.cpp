#include "app/SyncService.h"

#include <utility>

#include "logging/Log.h"

namespace app {

namespace {

core::CacheStore::Options cacheOptions(const config::Config& config) {
    core::CacheStore::Options options;
    options.retryBase = std::chrono::milliseconds(config.retryBaseMs);
    options.retryCap = std::chrono::milliseconds(config.retryCapMs);
    return options;
}

ConnectionManager::Options connectionOptions(const config::Config& config) {
    ConnectionManager::Options options;
    options.baseUrl = config.wsBaseUrl;
    options.reconnectInterval = std::chrono::milliseconds(config.reconnectIntervalMs);
    options.maxAttempts = config.maxReconnectAttempts;
    return options;
}

JobProgressTracker::Options jobOptions(const config::Config& config) {
    JobProgressTracker::Options options;
    options.backtestChannel = config.backtestChannel;
    options.collectionChannel = config.collectionChannel;
    options.repairChannel = config.repairChannel;
    return options;
}

// Receive time never competes with server timestamps in the cache.
std::optional<domain::TimestampMs> pushTimestamp(const Message& message) {
    if (!message.serverTimestamp) {
        return std::nullopt;
    }
    return message.timestamp;
}

}  // namespace

SyncService::SyncService(const config::Config& config,
                         core::Scheduler& scheduler,
                         infra::net::ChannelFactory& channels,
                         infra::net::HttpClient& http,
                         Notifier& notifier)
    : config_(config),
      scheduler_(scheduler),
      cache_(scheduler, &eventBus_, cacheOptions(config)),
      connections_(scheduler, channels, &eventBus_, connectionOptions(config)),
      router_(decodeDashboardFrame, scheduler, "dashboard"),
      notifications_(router_, notifier),
      jobs_(connections_, scheduler, jobOptions(config)),
      api_(http, config.apiBaseUrl) {
    connections_.onResync([this]() { cache_.invalidateAll(); });
}

SyncService::~SyncService() {
    teardown();
}

void SyncService::init() {
    if (active_) {
        return;
    }
    active_ = true;
    cache_.init();

    if (config_.notifications) {
        notifications_.enable();
    }
    registerPushHandlers_();

    dashboard_ = connections_.open(kDashboardChannel);
    connections_.onMessage(dashboard_, [this](const std::string& raw) { router_.dispatch(raw); });

    for (const auto& spec : infra::api::defaultDomains()) {
        cache_.startPolling(spec.key, api_.fetcher(spec.path, spec.timestampFields), spec.poll);
        polled_.push_back(spec.key);
    }

    LOG_INFO(logging::LogCategory::DATA,
             "sync started api=%s ws=%s domains=%zu",
             config_.apiBaseUrl.c_str(),
             config_.wsBaseUrl.c_str(),
             polled_.size());
}

void SyncService::teardown() {
    if (!active_) {
        return;
    }
    active_ = false;

    jobs_.clear();
    connections_.close(dashboard_);
    dashboard_ = ConnectionManager::kInvalidHandle;
    connections_.closeAll();

    for (auto id : pushHandlers_) {
        router_.unregister(id);
    }
    pushHandlers_.clear();

    for (const auto& key : polled_) {
        cache_.stopPolling(key);
    }
    polled_.clear();
    cache_.teardown();
    notifications_.disable();

    LOG_INFO(logging::LogCategory::DATA, "sync stopped");
}

void SyncService::registerPushHandlers_() {
    pushHandlers_.push_back(router_.registerHandler(MessageType::RateUpdate, [this](const Message& message) {
        cache_.applyPush(kRatesDomain, message.payload, pushTimestamp(message));
    }));
    pushHandlers_.push_back(router_.registerHandler(MessageType::SignalUpdate, [this](const Message& message) {
        cache_.applyPush(kSignalsDomain, message.payload, pushTimestamp(message));
    }));
    pushHandlers_.push_back(router_.registerHandler(MessageType::PredictionUpdate,
                                                    [this](const Message&) { cache_.invalidate(kPredictionsDomain); }));
    pushHandlers_.push_back(
        router_.registerHandler(MessageType::AlertCreated, [this](const Message&) { cache_.invalidate(kAlertsDomain); }));
}

void SyncService::triggerJob(domain::JobKind kind,
                             boost::json::object params,
                             infra::api::DashboardApi::TriggerCallback callback) {
    LOG_GUARD(active_, logging::LogCategory::JOB, "triggerJob before init");
    api_.triggerJob(kind, std::move(params), [this, kind, callback = std::move(callback)](infra::api::TriggerResult result) {
        if (result.jobId && active_) {
            jobs_.subscribe(*result.jobId, kind);
        }
        if (callback) {
            callback(std::move(result));
        }
    });
}

JobSubscription SyncService::trackJob(const domain::JobId& jobId, domain::JobKind kind) {
    return jobs_.subscribe(jobId, kind);
}

void SyncService::setVisible(bool visible) {
    connections_.setVisible(visible);
}

domain::ConnectionState SyncService::dashboardState() const {
    return connections_.state(dashboard_);
}

}  // namespace app
