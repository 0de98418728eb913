#include <chrono>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include <boost/json.hpp>

#include "TestSupport.h"
#include "core/CacheStore.h"
#include "core/EventBus.h"
#include "logging/Log.h"

using core::CacheStore;
using core::FetchCallback;
using core::FetchResult;
using core::PollOptions;
using core::WriteOutcome;
using testsupport::ManualScheduler;
using namespace std::chrono_literals;

namespace {

struct ScriptedFetch {
    int calls{0};
    std::vector<FetchCallback> pending;

    core::FetchFn fn() {
        return [this](FetchCallback done) {
            ++calls;
            pending.push_back(std::move(done));
        };
    }

    bool succeed(boost::json::value value, domain::TimestampMs ts) {
        if (pending.empty()) {
            return false;
        }
        auto done = std::move(pending.front());
        pending.erase(pending.begin());
        done(FetchResult::success(std::move(value), ts));
        return true;
    }

    bool succeedUnstamped(boost::json::value value) {
        if (pending.empty()) {
            return false;
        }
        auto done = std::move(pending.front());
        pending.erase(pending.begin());
        done(FetchResult::success(std::move(value)));
        return true;
    }

    bool failWith(const std::string& error) {
        if (pending.empty()) {
            return false;
        }
        auto done = std::move(pending.front());
        pending.erase(pending.begin());
        done(FetchResult::failure(error));
        return true;
    }
};

PollOptions ratesPoll() {
    PollOptions options;
    options.interval = 5min;
    options.staleAfter = 2min;
    options.retryLimit = 3;
    return options;
}

std::int64_t intOf(const CacheStore& store, const std::string& key) {
    const auto snap = store.get(key);
    if (!snap.value || !snap.value->is_object()) {
        return -1;
    }
    return snap.value->as_object().at("v").as_int64();
}

boost::json::value v(std::int64_t n) {
    return boost::json::value{{"v", n}};
}

int testInitialPoll() {
    ManualScheduler sched;
    core::EventBus bus;
    int updates = 0;
    auto sub = bus.subscribeCacheUpdated([&](const core::EventBus::CacheUpdated&) { ++updates; });
    CacheStore store(sched, &bus);
    store.init();
    ScriptedFetch fetch;

    store.startPolling("rates/current", fetch.fn(), ratesPoll());
    FXS_CHECK(fetch.calls == 1, "startPolling should fetch immediately");
    auto snap = store.get("rates/current");
    FXS_CHECK(snap.isLoading && snap.isStale && !snap.value, "first fetch should report loading");

    FXS_CHECK(fetch.succeed(v(1), 1000), "missing pending fetch");
    snap = store.get("rates/current");
    FXS_CHECK(!snap.isLoading && !snap.isStale && snap.value, "value should be fresh after first poll");
    FXS_CHECK(snap.fetchedAt == 1000, "fetchedAt should come from the response timestamp");
    FXS_CHECK(updates == 1, "one cache update expected, got " << updates);

    sched.advance(2min + 1ms);
    FXS_CHECK(store.get("rates/current").isStale, "value older than staleAfter must be stale");
    FXS_CHECK(fetch.calls == 1, "no refetch before the interval");
    sched.advance(3min);
    FXS_CHECK(fetch.calls == 2, "refetch after the interval, calls=" << fetch.calls);

    FXS_CHECK(store.get("unknown/domain").isStale, "unknown domain reads as stale");
    return 0;
}

int testPushNewerThanPoll() {
    ManualScheduler sched;
    CacheStore store(sched);
    store.init();
    ScriptedFetch fetch;
    store.startPolling("rates/current", fetch.fn(), ratesPoll());

    // A poll is in flight for T while a push for T+1 lands.
    FXS_CHECK(store.applyPush("rates/current", v(2), 2001) == WriteOutcome::Applied, "push should apply");
    FXS_CHECK(fetch.succeed(v(1), 2000), "missing pending fetch");
    FXS_CHECK(intOf(store, "rates/current") == 2, "older poll must not overwrite the push");
    FXS_CHECK(store.get("rates/current").fetchedAt == 2001, "fetchedAt must not regress");
    FXS_CHECK(!store.get("rates/current").isStale, "the push keeps the entry fresh");

    FXS_CHECK(store.applyPush("rates/current", v(3), 1500) == WriteOutcome::Outdated, "older push is dropped");
    FXS_CHECK(intOf(store, "rates/current") == 2, "value unchanged after outdated push");

    FXS_CHECK(store.applyPush("rates/current", v(4), 2001) == WriteOutcome::Applied, "equal timestamp is accepted");
    FXS_CHECK(intOf(store, "rates/current") == 4, "equal timestamp overwrites");

    FXS_CHECK(store.applyPush("signals/current", v(1), 1) == WriteOutcome::UnknownDomain,
              "push for an untracked domain is ignored");
    FXS_CHECK(!store.contains("signals/current"), "push must not create an entry");
    return 0;
}

int testInterleavings() {
    std::mt19937 rng(20240601);
    for (int round = 0; round < 50; ++round) {
        ManualScheduler sched;
        CacheStore store(sched);
        store.init();
        ScriptedFetch fetch;
        store.startPolling("signals/current", fetch.fn(), ratesPoll());

        std::vector<domain::TimestampMs> stamps;
        for (int i = 0; i < 12; ++i) {
            stamps.push_back(1000 + static_cast<domain::TimestampMs>(rng() % 20));
        }

        domain::TimestampMs maxSeen = -1;
        std::int64_t expected = -1;
        domain::TimestampMs lastFetchedAt = 0;
        for (std::size_t i = 0; i < stamps.size(); ++i) {
            const auto ts = stamps[i];
            const auto marker = static_cast<std::int64_t>(i);
            if (i % 2 == 0) {
                store.applyPush("signals/current", v(marker), ts);
            }
            else {
                if (fetch.pending.empty()) {
                    store.refetch("signals/current");
                }
                FXS_CHECK(fetch.succeed(v(marker), ts), "expected a pending fetch");
            }
            if (ts >= maxSeen) {
                maxSeen = ts;
                expected = marker;
            }
            const auto fetchedAt = store.get("signals/current").fetchedAt;
            FXS_CHECK(fetchedAt >= lastFetchedAt, "fetchedAt went backwards in round " << round);
            lastFetchedAt = fetchedAt;
        }
        FXS_CHECK(store.get("signals/current").fetchedAt == maxSeen, "fetchedAt must equal the newest write");
        FXS_CHECK(intOf(store, "signals/current") == expected, "last writer by timestamp must win in round " << round);
    }
    return 0;
}

int testServerClockAhead() {
    ManualScheduler sched;
    CacheStore store(sched);
    store.init();
    ScriptedFetch fetch;
    store.startPolling("signals/current", fetch.fn(), ratesPoll());

    // The body has no server time; the push carries one nine hours ahead of the local clock.
    FXS_CHECK(fetch.succeedUnstamped(v(1)), "missing pending fetch");
    FXS_CHECK(store.get("signals/current").fetchedAt == 0, "untimestamped poll leaves fetchedAt alone");
    const domain::TimestampMs pushTs = sched.now() + 9 * 3600 * 1000;
    FXS_CHECK(store.applyPush("signals/current", v(2), pushTs) == WriteOutcome::Applied, "push should apply");

    sched.advance(15min);
    FXS_CHECK(fetch.succeedUnstamped(v(3)), "expected the next poll");
    FXS_CHECK(intOf(store, "signals/current") == 3, "later poll replaces the pushed value");
    FXS_CHECK(!store.get("signals/current").isStale, "applied poll is fresh");
    FXS_CHECK(store.get("signals/current").fetchedAt == pushTs, "fetchedAt does not regress");

    // A push lands while an untimestamped poll is in flight: the push wins.
    store.refetch("signals/current");
    FXS_CHECK(store.applyPush("signals/current", v(4), std::nullopt) == WriteOutcome::Applied, "push should apply");
    FXS_CHECK(fetch.succeedUnstamped(v(5)), "missing refetch");
    FXS_CHECK(intOf(store, "signals/current") == 4, "poll issued before the push must not overwrite it");

    sched.advance(5min);
    FXS_CHECK(fetch.succeedUnstamped(v(6)), "expected the next poll");
    FXS_CHECK(intOf(store, "signals/current") == 6, "poll issued after the push applies");
    return 0;
}

int testOutdatedPollKeepsStaleness() {
    ManualScheduler sched;
    CacheStore store(sched);
    store.init();
    ScriptedFetch fetch;
    store.startPolling("rates/current", fetch.fn(), ratesPoll());
    FXS_CHECK(fetch.succeed(v(1), 1000), "missing pending fetch");
    FXS_CHECK(store.applyPush("rates/current", v(2), 5000) == WriteOutcome::Applied, "push should apply");

    sched.advance(5min);
    FXS_CHECK(fetch.succeed(v(3), 2000), "expected the next poll");
    FXS_CHECK(intOf(store, "rates/current") == 2, "older poll must not overwrite the push");
    FXS_CHECK(store.get("rates/current").isStale, "an older poll does not refresh the push's age");
    FXS_CHECK(!store.get("rates/current").error, "an older poll is still a successful request");
    return 0;
}

int testPushResetsFailures() {
    ManualScheduler sched;
    CacheStore store(sched);
    store.init();
    ScriptedFetch fetch;
    store.startPolling("rates/current", fetch.fn(), ratesPoll());
    FXS_CHECK(fetch.failWith("timeout"), "missing pending fetch");
    sched.advance(1000ms);
    FXS_CHECK(fetch.failWith("timeout"), "expected the first retry");
    FXS_CHECK(store.entry("rates/current")->failures == 2, "two failures counted");

    FXS_CHECK(store.applyPush("rates/current", v(1), 10) == WriteOutcome::Applied, "push should apply");
    FXS_CHECK(store.entry("rates/current")->failures == 0 && !store.get("rates/current").error,
              "push clears the error and the failure count");

    sched.advance(5min);
    const int before = fetch.calls;
    FXS_CHECK(fetch.failWith("timeout"), "expected the regular poll");
    sched.advance(1000ms);
    FXS_CHECK(fetch.calls == before + 1, "backoff restarts from the base delay");
    return 0;
}

int testInvalidate() {
    ManualScheduler sched;
    CacheStore store(sched);
    store.init();
    ScriptedFetch fetch;
    store.startPolling("alerts/active", fetch.fn(), ratesPoll());
    FXS_CHECK(fetch.succeed(v(1), 10), "missing pending fetch");

    store.invalidate("alerts/active");
    FXS_CHECK(store.get("alerts/active").isStale, "get right after invalidate must be stale");
    FXS_CHECK(fetch.calls == 1, "refetch must wait for the next loop turn");
    sched.runReady();
    FXS_CHECK(fetch.calls == 2, "invalidate should queue a refetch");
    FXS_CHECK(store.get("alerts/active").isStale, "still stale while the refetch is in flight");
    FXS_CHECK(!store.get("alerts/active").isLoading, "a cached value is not loading");

    FXS_CHECK(fetch.succeed(v(2), 20), "missing refetch");
    FXS_CHECK(!store.get("alerts/active").isStale, "fresh after the refetch");

    store.invalidateAll();
    FXS_CHECK(store.get("alerts/active").isStale, "invalidateAll marks every domain stale");
    return 0;
}

int testBackoff() {
    ManualScheduler sched;
    CacheStore store(sched);
    store.init();
    ScriptedFetch fetch;
    store.startPolling("rates/current", fetch.fn(), ratesPoll());
    FXS_CHECK(fetch.succeed(v(7), 100), "missing pending fetch");
    sched.advance(5min);
    FXS_CHECK(fetch.calls == 2, "regular poll expected");

    const std::chrono::milliseconds expected[] = {1000ms, 2000ms, 4000ms};
    for (auto delay : expected) {
        const int before = fetch.calls;
        FXS_CHECK(fetch.failWith("HTTP status 503"), "missing pending fetch");
        auto snap = store.get("rates/current");
        FXS_CHECK(snap.error && *snap.error == "HTTP status 503", "error must be exposed");
        FXS_CHECK(snap.isStale, "failing domain is stale");
        FXS_CHECK(intOf(store, "rates/current") == 7, "last good value is still served");
        sched.advance(delay - 1ms);
        FXS_CHECK(fetch.calls == before, "retry fired before " << delay.count() << " ms");
        sched.advance(1ms);
        FXS_CHECK(fetch.calls == before + 1, "retry expected after " << delay.count() << " ms");
    }

    // Retries exhausted: back to the regular interval.
    const int before = fetch.calls;
    FXS_CHECK(fetch.failWith("timeout"), "missing pending fetch");
    sched.advance(30s);
    FXS_CHECK(fetch.calls == before, "no fast retry after the limit");
    sched.advance(5min);
    FXS_CHECK(fetch.calls == before + 1, "regular poll after the limit");

    FXS_CHECK(fetch.succeed(v(8), 200), "missing pending fetch");
    FXS_CHECK(store.entry("rates/current")->failures == 0, "success resets the failure count");
    FXS_CHECK(!store.get("rates/current").error, "success clears the error");

    FXS_CHECK(store.retryDelay(1) == 1000ms, "base delay");
    FXS_CHECK(store.retryDelay(10) == 30000ms, "delay is capped");
    return 0;
}

int testInFlightSuppression() {
    ManualScheduler sched;
    CacheStore store(sched);
    store.init();
    ScriptedFetch fetch;
    store.startPolling("metrics/risk", fetch.fn(), ratesPoll());
    store.refetch("metrics/risk");
    store.invalidate("metrics/risk");
    sched.runReady();
    FXS_CHECK(fetch.calls == 1, "concurrent polls must be suppressed, calls=" << fetch.calls);
    FXS_CHECK(fetch.pending.size() == 1, "exactly one outstanding request");
    return 0;
}

int testPushReschedulesPoll() {
    ManualScheduler sched;
    CacheStore store(sched);
    store.init();
    ScriptedFetch fetch;
    store.startPolling("rates/current", fetch.fn(), ratesPoll());
    FXS_CHECK(fetch.succeed(v(1), 10), "missing pending fetch");

    sched.advance(4min);
    FXS_CHECK(store.applyPush("rates/current", v(2), 20) == WriteOutcome::Applied, "push should apply");
    sched.advance(2min);
    FXS_CHECK(fetch.calls == 1, "push should postpone the next poll");
    sched.advance(3min);
    FXS_CHECK(fetch.calls == 2, "poll one interval after the push");
    return 0;
}

int testReferenceCounting() {
    ManualScheduler sched;
    CacheStore store(sched);
    store.init();
    ScriptedFetch fetch;
    store.startPolling("data/status", fetch.fn(), ratesPoll());
    store.startPolling("data/status", fetch.fn(), ratesPoll());
    FXS_CHECK(fetch.calls == 1, "second subscriber shares the poller");
    FXS_CHECK(fetch.succeed(v(1), 1), "missing pending fetch");

    store.stopPolling("data/status");
    FXS_CHECK(store.contains("data/status"), "entry survives while a subscriber remains");
    store.stopPolling("data/status");
    FXS_CHECK(!store.contains("data/status"), "entry dropped with the last subscriber");
    sched.advance(1h);
    FXS_CHECK(fetch.calls == 1, "no polls after the domain is dropped");
    return 0;
}

int testTeardownOrphansFetches() {
    ManualScheduler sched;
    CacheStore store(sched);
    store.init();
    ScriptedFetch fetch;
    store.startPolling("data/sources", fetch.fn(), ratesPoll());
    store.teardown();
    FXS_CHECK(!store.isActive() && store.size() == 0, "teardown clears the store");
    FXS_CHECK(fetch.succeed(v(1), 1), "pending callback should still be callable");
    FXS_CHECK(store.size() == 0, "late result after teardown must be discarded");
    FXS_CHECK(sched.pending() == 0, "no timers left after teardown");

    store.startPolling("data/sources", fetch.fn(), ratesPoll());
    FXS_CHECK(store.size() == 0, "startPolling before init is refused");
    return 0;
}

}  // namespace

int main() {
    logging::Log::set_log_level(config::LogLevel::Error);

    if (int rc = testInitialPoll()) return rc;
    if (int rc = testPushNewerThanPoll()) return rc;
    if (int rc = testInterleavings()) return rc;
    if (int rc = testServerClockAhead()) return rc;
    if (int rc = testOutdatedPollKeepsStaleness()) return rc;
    if (int rc = testPushResetsFailures()) return rc;
    if (int rc = testInvalidate()) return rc;
    if (int rc = testBackoff()) return rc;
    if (int rc = testInFlightSuppression()) return rc;
    if (int rc = testPushReschedulesPoll()) return rc;
    if (int rc = testReferenceCounting()) return rc;
    if (int rc = testTeardownOrphansFetches()) return rc;
    return 0;
}
