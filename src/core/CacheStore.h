#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

#include <boost/json/value.hpp>

#include "core/CacheEntry.h"
#include "core/Scheduler.h"
#include "domain/Types.h"

namespace core {

class EventBus;

// Per-domain cache fed by two write paths: poll responses and pushes. Timestamped writes
// obey last-writer-wins by server time and fetchedAt never moves backwards. A write without
// a server timestamp is ordered by arrival: an untimestamped poll loses to any push applied
// while it was in flight.
class CacheStore {
public:
    struct Options {
        std::chrono::milliseconds retryBase{1000};
        std::chrono::milliseconds retryCap{30000};
    };

    CacheStore(Scheduler& scheduler, EventBus* eventBus, Options options);
    CacheStore(Scheduler& scheduler, EventBus* eventBus = nullptr);
    ~CacheStore();

    CacheStore(const CacheStore&) = delete;
    CacheStore& operator=(const CacheStore&) = delete;

    void init();
    // Cancels every timer, drops every entry and orphans in-flight fetches.
    void teardown();
    bool isActive() const noexcept { return active_; }

    CacheSnapshot get(const domain::DomainKey& key) const;
    void invalidate(const domain::DomainKey& key);
    void invalidateAll();
    WriteOutcome applyPush(const domain::DomainKey& key,
                           boost::json::value value,
                           std::optional<domain::TimestampMs> timestamp);

    // Reference counted: every call must be balanced by stopPolling().
    void startPolling(const domain::DomainKey& key, FetchFn fetch, PollOptions options);
    void startPolling(const domain::DomainKey& key,
                      FetchFn fetch,
                      std::chrono::milliseconds interval,
                      std::chrono::milliseconds staleAfter);
    void stopPolling(const domain::DomainKey& key);
    void refetch(const domain::DomainKey& key);

    bool contains(const domain::DomainKey& key) const;
    const CacheEntry* entry(const domain::DomainKey& key) const;
    std::vector<domain::DomainKey> keys() const;
    std::size_t size() const noexcept { return entries_.size(); }

    std::chrono::milliseconds retryDelay(int failures) const noexcept;

private:
    void poll_(const domain::DomainKey& key);
    void onFetchComplete_(const domain::DomainKey& key,
                          std::uint64_t generation,
                          std::uint64_t requestSeq,
                          std::uint64_t pushSeqAtIssue,
                          FetchResult result);
    void schedulePoll_(CacheEntry& entry, std::chrono::milliseconds delay);
    WriteOutcome write_(CacheEntry& entry, boost::json::value value, std::optional<domain::TimestampMs> timestamp);
    bool isStale_(const CacheEntry& entry) const;
    CacheSnapshot snapshot_(const CacheEntry& entry) const;
    void publish_(const CacheEntry& entry);

    Scheduler& scheduler_;
    EventBus* eventBus_{nullptr};
    Options options_;
    std::unordered_map<domain::DomainKey, CacheEntry> entries_;
    std::shared_ptr<int> epoch_;
    std::uint64_t nextGeneration_{1};
    bool active_{false};
};

}  // namespace core
