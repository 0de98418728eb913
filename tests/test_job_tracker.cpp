#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "TestSupport.h"
#include "app/ConnectionManager.h"
#include "app/JobProgressTracker.h"
#include "logging/Log.h"

using app::ConnectionManager;
using app::JobProgressTracker;
using domain::JobKind;
using domain::JobStatus;
using testsupport::FakeChannelFactory;
using testsupport::ManualScheduler;
using namespace std::chrono_literals;

namespace {

struct Fixture {
    ManualScheduler sched;
    FakeChannelFactory factory;
    ConnectionManager connections{sched, factory, nullptr, ConnectionManager::Options{"ws://localhost:8000", 3000ms, 5}};
    JobProgressTracker tracker{connections, sched, JobProgressTracker::Options{}};
    std::vector<domain::JobProgress> seen;

    Fixture() {
        tracker.addListener([this](const domain::JobProgress& p) { seen.push_back(p); });
    }
};

int testLifecycleToCompletion() {
    Fixture f;
    const auto sub = f.tracker.subscribe("bt-1");
    FXS_CHECK(sub.channelKey == "/ws/backtest/bt-1", "backtest channel path, got " << sub.channelKey);
    FXS_CHECK(sub.progress.status == JobStatus::Pending, "new subscription is pending");
    auto channel = f.factory.latest();
    FXS_CHECK(channel && channel->url == "ws://localhost:8000/ws/backtest/bt-1", "job channel opened");
    channel->simulateOpen();

    channel->simulateMessage(R"({"progress":10,"current_step":"Loading data"})");
    auto snap = f.tracker.snapshot("bt-1");
    FXS_CHECK(snap && snap->status == JobStatus::Running && snap->progress == 10, "first frame -> Running");
    FXS_CHECK(snap->currentStep == "Loading data", "current step tracked");

    int extra = 0;
    const auto extraId = f.tracker.addListener([&extra](const domain::JobProgress&) { ++extra; });
    channel->simulateMessage(R"({"progress":20,"current_step":"Training"})");
    f.tracker.removeListener(extraId);
    channel->simulateMessage(R"({"progress":30,"current_step":"Training"})");
    FXS_CHECK(extra == 1, "removed listener stops receiving snapshots");

    channel->simulateMessage("garbage");
    FXS_CHECK(f.tracker.snapshot("bt-1")->progress == 10, "malformed frame ignored");

    channel->simulateMessage(R"({"progress":100,"current_step":"Done"})");
    FXS_CHECK(!f.seen.empty() && f.seen.back().status == JobStatus::Completed, "listener sees the final snapshot");
    FXS_CHECK(f.seen.back().progress == 100, "final progress reported");
    FXS_CHECK(!f.tracker.isTracking("bt-1") && f.tracker.activeCount() == 0, "terminal job removed");
    FXS_CHECK(channel->closed && f.factory.liveCount() == 0, "terminal job has zero channels");
    FXS_CHECK(f.connections.channelCount() == 0, "channel released in the manager");

    const auto before = f.seen.size();
    channel->simulateMessage(R"({"progress":50})");
    FXS_CHECK(f.seen.size() == before, "frames after completion are ignored");
    f.sched.runReady();
    FXS_CHECK(channel->destroyed, "transport destroyed after the final frame");
    return 0;
}

int testExplicitStatus() {
    Fixture f;
    f.tracker.subscribe("c-9", JobKind::Collection);
    auto channel = f.factory.latest();
    FXS_CHECK(channel->url == "ws://localhost:8000/ws/data/collect/c-9", "collection channel path");

    channel->simulateMessage(R"({"progress":150,"status":"running"})");
    auto snap = f.tracker.snapshot("c-9");
    FXS_CHECK(snap->progress == 100, "progress clamped to 100");
    FXS_CHECK(snap->status == JobStatus::Running, "explicit status wins over progress");

    channel->simulateMessage(R"({"progress":-5,"status":"failed","message":"source timeout"})");
    FXS_CHECK(f.seen.back().status == JobStatus::Failed && f.seen.back().progress == 0, "failed with clamped progress");
    FXS_CHECK(f.seen.back().message && *f.seen.back().message == "source timeout", "failure message kept");
    FXS_CHECK(f.factory.liveCount() == 0, "failed job closes its channel");

    f.tracker.subscribe("r-1", JobKind::Repair);
    FXS_CHECK(f.factory.latest()->url == "ws://localhost:8000/ws/data/repair/r-1", "repair channel path");
    return 0;
}

int testReferenceCounting() {
    Fixture f;
    f.tracker.subscribe("bt-2");
    const auto again = f.tracker.subscribe("bt-2");
    FXS_CHECK(again.refCount == 2, "re-subscribe increments the count");
    FXS_CHECK(f.factory.created.size() == 1, "re-subscribe reuses the channel");

    f.tracker.unsubscribe("bt-2");
    FXS_CHECK(f.tracker.isTracking("bt-2") && f.factory.liveCount() == 1, "channel kept while referenced");
    f.tracker.unsubscribe("bt-2");
    FXS_CHECK(!f.tracker.isTracking("bt-2") && f.factory.liveCount() == 0, "last unsubscribe closes the channel");
    f.tracker.unsubscribe("bt-2");
    return 0;
}

int testCancelAndClear() {
    Fixture f;
    f.tracker.subscribe("bt-3");
    f.tracker.subscribe("bt-4");
    FXS_CHECK(f.tracker.activeCount() == 2 && f.factory.liveCount() == 2, "two jobs, two channels");

    f.tracker.cancel("bt-3");
    FXS_CHECK(!f.seen.empty() && f.seen.back().jobId == "bt-3" && f.seen.back().status == JobStatus::Cancelled,
              "cancel publishes a terminal snapshot");
    FXS_CHECK(f.factory.liveCount() == 1, "cancelled job closes its channel");

    f.tracker.clear();
    FXS_CHECK(f.tracker.activeCount() == 0 && f.factory.liveCount() == 0, "clear releases every channel");
    return 0;
}

int testReconnectKeepsProgress() {
    Fixture f;
    f.tracker.subscribe("bt-5");
    auto first = f.factory.latest();
    first->simulateOpen();
    first->simulateMessage(R"({"progress":30})");
    first->simulateClose();
    f.sched.advance(3000ms);
    auto second = f.factory.latest();
    FXS_CHECK(second != first, "job channel reconnects");
    second->simulateOpen();
    second->simulateMessage(R"({"progress":60})");
    FXS_CHECK(f.tracker.snapshot("bt-5")->progress == 60, "progress continues on the new channel");
    FXS_CHECK(f.factory.liveCount() == 1, "exactly one channel for a running job");
    return 0;
}

}  // namespace

int main() {
    logging::Log::set_log_level(config::LogLevel::Error);

    if (int rc = testLifecycleToCompletion()) return rc;
    if (int rc = testExplicitStatus()) return rc;
    if (int rc = testReferenceCounting()) return rc;
    if (int rc = testCancelAndClear()) return rc;
    if (int rc = testReconnectKeepsProgress()) return rc;
    return 0;
}
