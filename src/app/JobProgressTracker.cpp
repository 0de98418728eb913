#include "app/JobProgressTracker.h"

#include <algorithm>
#include <exception>
#include <utility>

#include <boost/json.hpp>

#include "logging/Log.h"

namespace json = boost::json;

namespace app {

namespace {

std::string formatChannel(const std::string& templ, const std::string& jobId) {
    const auto pos = templ.find("%s");
    if (pos == std::string::npos) {
        std::string base = templ;
        if (!base.empty() && base.back() != '/') {
            base.push_back('/');
        }
        return base + jobId;
    }
    std::string result = templ;
    result.replace(pos, 2, jobId);
    if (!result.empty() && result.front() != '/') {
        result.insert(result.begin(), '/');
    }
    return result;
}

std::optional<double> numberField(const json::object& obj, const char* name) {
    const auto* field = obj.if_contains(name);
    if (!field) {
        return std::nullopt;
    }
    if (field->is_int64()) {
        return static_cast<double>(field->get_int64());
    }
    if (field->is_uint64()) {
        return static_cast<double>(field->get_uint64());
    }
    if (field->is_double()) {
        return field->get_double();
    }
    return std::nullopt;
}

std::optional<std::string> stringField(const json::object& obj, const char* name) {
    const auto* field = obj.if_contains(name);
    if (!field || !field->is_string()) {
        return std::nullopt;
    }
    const auto& str = field->get_string();
    return std::string(str.data(), str.size());
}

}  // namespace

JobProgressTracker::JobProgressTracker(ConnectionManager& connections, const core::Scheduler& clock, Options options)
    : connections_(connections), clock_(clock), options_(std::move(options)) {}

JobProgressTracker::~JobProgressTracker() {
    clear();
}

domain::ChannelKey JobProgressTracker::channelFor(domain::JobKind kind, const domain::JobId& jobId) const {
    switch (kind) {
    case domain::JobKind::Collection:
        return formatChannel(options_.collectionChannel, jobId);
    case domain::JobKind::Repair:
        return formatChannel(options_.repairChannel, jobId);
    case domain::JobKind::Backtest:
        break;
    }
    return formatChannel(options_.backtestChannel, jobId);
}

JobSubscription JobProgressTracker::subscribe(const domain::JobId& jobId, domain::JobKind kind) {
    auto it = jobs_.find(jobId);
    if (it != jobs_.end()) {
        ++it->second->subscription.refCount;
        LOG_DEBUG(logging::LogCategory::JOB, "job %s refs=%d", jobId.c_str(), it->second->subscription.refCount);
        return it->second->subscription;
    }

    auto tracked = std::make_shared<Tracked>();
    JobSubscription& sub = tracked->subscription;
    sub.jobId = jobId;
    sub.channelKey = channelFor(kind, jobId);
    sub.refCount = 1;
    sub.progress.jobId = jobId;
    sub.progress.kind = kind;
    sub.progress.status = domain::JobStatus::Pending;

    tracked->router = std::make_unique<MessageRouter>(decodeJobFrame, clock_, "job:" + jobId);
    tracked->router->registerHandler(MessageType::JobProgress,
                                     [this, jobId](const Message& message) { onProgress_(jobId, message); });

    jobs_.emplace(jobId, tracked);

    sub.channelRef = connections_.open(sub.channelKey);
    std::weak_ptr<Tracked> weak = tracked;
    connections_.onMessage(sub.channelRef, [weak](const std::string& raw) {
        // Holding the record keeps the router alive if the frame finishes the job.
        if (auto locked = weak.lock()) {
            locked->router->dispatch(raw);
        }
    });
    connections_.onStateChange(sub.channelRef,
                               [this, jobId](const domain::ConnectionState& state) { onChannelState_(jobId, state); });

    LOG_INFO(logging::LogCategory::JOB,
             "tracking %s job %s on %s",
             domain::to_string(kind),
             jobId.c_str(),
             sub.channelKey.c_str());
    return sub;
}

void JobProgressTracker::unsubscribe(const domain::JobId& jobId) {
    auto it = jobs_.find(jobId);
    if (it == jobs_.end()) {
        return;
    }
    if (--it->second->subscription.refCount > 0) {
        return;
    }
    finish_(jobId);
}

void JobProgressTracker::cancel(const domain::JobId& jobId) {
    auto it = jobs_.find(jobId);
    LOG_GUARD(it != jobs_.end(), logging::LogCategory::JOB, "cancel for untracked job %s", jobId.c_str());

    auto tracked = it->second;
    tracked->subscription.progress.status = domain::JobStatus::Cancelled;
    LOG_INFO(logging::LogCategory::JOB, "job %s cancelled", jobId.c_str());
    publish_(tracked->subscription.progress);
    finish_(jobId);
}

void JobProgressTracker::clear() {
    std::vector<domain::JobId> ids;
    ids.reserve(jobs_.size());
    for (const auto& item : jobs_) {
        ids.push_back(item.first);
    }
    for (const auto& id : ids) {
        finish_(id);
    }
}

std::optional<domain::JobProgress> JobProgressTracker::snapshot(const domain::JobId& jobId) const {
    auto it = jobs_.find(jobId);
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    return it->second->subscription.progress;
}

JobProgressTracker::ListenerId JobProgressTracker::addListener(Listener listener) {
    const ListenerId id = nextListenerId_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

void JobProgressTracker::removeListener(ListenerId id) {
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(), [id](const auto& item) { return item.first == id; }),
                     listeners_.end());
}

void JobProgressTracker::onProgress_(const domain::JobId& jobId, const Message& message) {
    auto it = jobs_.find(jobId);
    if (it == jobs_.end()) {
        return;
    }
    auto tracked = it->second;
    domain::JobProgress& progress = tracked->subscription.progress;
    if (domain::isTerminal(progress.status)) {
        return;
    }

    const auto& obj = message.payload.as_object();
    if (auto value = numberField(obj, "progress")) {
        progress.progress = static_cast<int>(std::clamp(*value, 0.0, 100.0));
    }
    if (auto step = stringField(obj, "current_step")) {
        progress.currentStep = *step;
    }
    if (auto text = stringField(obj, "message")) {
        progress.message = *text;
    }
    else if (auto error = stringField(obj, "error")) {
        progress.message = *error;
    }

    std::optional<domain::JobStatus> explicitStatus;
    if (auto label = stringField(obj, "status")) {
        explicitStatus = domain::job_status_from_label(*label);
        if (!explicitStatus) {
            LOG_DEBUG(logging::LogCategory::JOB, "job %s unknown status '%s'", jobId.c_str(), label->c_str());
        }
    }

    if (explicitStatus) {
        progress.status = *explicitStatus;
    }
    else if (progress.progress >= 100) {
        progress.status = domain::JobStatus::Completed;
    }
    else {
        progress.status = domain::JobStatus::Running;
    }

    LOG_DEBUG(logging::LogCategory::JOB,
              "job %s %d%% %s [%s]",
              jobId.c_str(),
              progress.progress,
              progress.currentStep.c_str(),
              domain::to_string(progress.status));

    const domain::JobProgress current = progress;
    publish_(current);
    if (domain::isTerminal(current.status)) {
        LOG_INFO(logging::LogCategory::JOB, "job %s finished: %s", jobId.c_str(), domain::to_string(current.status));
        finish_(jobId);
    }
}

void JobProgressTracker::onChannelState_(const domain::JobId& jobId, const domain::ConnectionState& state) {
    if (state.status == domain::ConnectionStatus::Failed) {
        LOG_WARN(logging::LogCategory::JOB,
                 "job %s channel failed: %s",
                 jobId.c_str(),
                 state.lastError.value_or("unknown").c_str());
    }
}

void JobProgressTracker::publish_(const domain::JobProgress& progress) {
    const auto listeners = listeners_;
    for (const auto& item : listeners) {
        try {
            item.second(progress);
        }
        catch (const std::exception& ex) {
            LOG_ERROR(logging::LogCategory::JOB, "job listener threw: %s", ex.what());
        }
    }
}

void JobProgressTracker::finish_(const domain::JobId& jobId) {
    auto it = jobs_.find(jobId);
    if (it == jobs_.end()) {
        return;
    }
    auto tracked = it->second;
    jobs_.erase(it);
    connections_.close(tracked->subscription.channelRef);
    LOG_DEBUG(logging::LogCategory::JOB, "job %s released channel %s", jobId.c_str(), tracked->subscription.channelKey.c_str());
}

}  // namespace app
