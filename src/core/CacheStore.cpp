#include "core/CacheStore.h"

#include <algorithm>
#include <exception>
#include <utility>

#include "core/EventBus.h"
#include "logging/Log.h"

namespace core {

namespace {
constexpr int kMaxBackoffShift = 16;
}  // namespace

CacheStore::CacheStore(Scheduler& scheduler, EventBus* eventBus, Options options)
    : scheduler_(scheduler), eventBus_(eventBus), options_(options) {
    if (options_.retryBase.count() <= 0) {
        options_.retryBase = std::chrono::milliseconds(1000);
    }
    if (options_.retryCap < options_.retryBase) {
        options_.retryCap = options_.retryBase;
    }
}

CacheStore::CacheStore(Scheduler& scheduler, EventBus* eventBus)
    : CacheStore(scheduler, eventBus, Options{}) {}

CacheStore::~CacheStore() {
    teardown();
}

void CacheStore::init() {
    if (active_) {
        return;
    }
    epoch_ = std::make_shared<int>(0);
    active_ = true;
    LOG_DEBUG(logging::LogCategory::CACHE, "Cache store initialised");
}

void CacheStore::teardown() {
    for (auto& item : entries_) {
        if (item.second.pollTimer != Scheduler::kInvalidTimer) {
            scheduler_.cancel(item.second.pollTimer);
            item.second.pollTimer = Scheduler::kInvalidTimer;
        }
    }
    const bool hadEntries = !entries_.empty();
    entries_.clear();
    epoch_.reset();
    if (active_ && hadEntries) {
        LOG_DEBUG(logging::LogCategory::CACHE, "Cache store torn down");
    }
    active_ = false;
}

CacheSnapshot CacheStore::get(const domain::DomainKey& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return CacheSnapshot{};
    }
    return snapshot_(it->second);
}

void CacheStore::invalidate(const domain::DomainKey& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return;
    }
    CacheEntry& entry = it->second;
    entry.invalidated = true;
    LOG_DEBUG(logging::LogCategory::CACHE, "Invalidated %s", key.c_str());

    // The refetch runs on a later loop turn so get() right after still reports stale.
    if (entry.refCount > 0 && entry.fetch && !entry.inFlight) {
        schedulePoll_(entry, std::chrono::milliseconds(0));
    }
    publish_(entry);
}

void CacheStore::invalidateAll() {
    for (const auto& key : keys()) {
        invalidate(key);
    }
}

WriteOutcome CacheStore::applyPush(const domain::DomainKey& key,
                                   boost::json::value value,
                                   std::optional<domain::TimestampMs> timestamp) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        LOG_DEBUG(logging::LogCategory::CACHE, "Push for untracked domain %s ignored", key.c_str());
        return WriteOutcome::UnknownDomain;
    }
    CacheEntry& entry = it->second;

    const auto outcome = write_(entry, std::move(value), timestamp);
    if (outcome == WriteOutcome::Outdated) {
        LOG_DEBUG(logging::LogCategory::CACHE,
                  "Push for %s dropped ts=%lld fetchedAt=%lld",
                  key.c_str(),
                  timestamp.value_or(-1),
                  entry.fetchedAt);
        return outcome;
    }

    ++entry.pushSeq;
    entry.failures = 0;
    entry.lastError.reset();
    // A push stands in for a poll; the next poll moves a full interval out.
    if (entry.refCount > 0 && entry.fetch && !entry.inFlight) {
        schedulePoll_(entry, entry.refetchInterval);
    }
    LOG_TRACE(logging::LogCategory::CACHE, "Push applied to %s ts=%lld", key.c_str(), timestamp.value_or(-1));
    publish_(entry);
    return outcome;
}

void CacheStore::startPolling(const domain::DomainKey& key,
                              FetchFn fetch,
                              std::chrono::milliseconds interval,
                              std::chrono::milliseconds staleAfter) {
    PollOptions options;
    options.interval = interval;
    options.staleAfter = staleAfter;
    startPolling(key, std::move(fetch), options);
}

void CacheStore::startPolling(const domain::DomainKey& key, FetchFn fetch, PollOptions options) {
    LOG_GUARD(active_, logging::LogCategory::CACHE, "startPolling(%s) before init", key.c_str());
    LOG_GUARD(static_cast<bool>(fetch), logging::LogCategory::CACHE, "startPolling(%s) without fetch function", key.c_str());

    auto [it, inserted] = entries_.try_emplace(key);
    CacheEntry& entry = it->second;
    ++entry.refCount;
    if (!inserted) {
        LOG_TRACE(logging::LogCategory::CACHE, "Poller for %s shared refs=%d", key.c_str(), entry.refCount);
        if (isStale_(entry) && !entry.inFlight) {
            schedulePoll_(entry, std::chrono::milliseconds(0));
        }
        return;
    }

    entry.domainKey = key;
    entry.fetch = std::move(fetch);
    entry.refetchInterval = std::max(options.interval, std::chrono::milliseconds(1));
    entry.staleAfter = std::max(options.staleAfter, std::chrono::milliseconds(0));
    entry.retryLimit = std::max(options.retryLimit, 0);
    entry.generation = nextGeneration_++;

    LOG_DEBUG(logging::LogCategory::CACHE,
              "Polling %s every %lld ms (stale after %lld ms)",
              key.c_str(),
              static_cast<long long>(entry.refetchInterval.count()),
              static_cast<long long>(entry.staleAfter.count()));
    poll_(key);
}

void CacheStore::stopPolling(const domain::DomainKey& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return;
    }
    CacheEntry& entry = it->second;
    if (--entry.refCount > 0) {
        return;
    }
    if (entry.pollTimer != Scheduler::kInvalidTimer) {
        scheduler_.cancel(entry.pollTimer);
    }
    LOG_DEBUG(logging::LogCategory::CACHE, "Dropping domain %s", key.c_str());
    entries_.erase(it);
}

void CacheStore::refetch(const domain::DomainKey& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return;
    }
    poll_(key);
}

bool CacheStore::contains(const domain::DomainKey& key) const {
    return entries_.find(key) != entries_.end();
}

const CacheEntry* CacheStore::entry(const domain::DomainKey& key) const {
    auto it = entries_.find(key);
    return it == entries_.end() ? nullptr : &it->second;
}

std::vector<domain::DomainKey> CacheStore::keys() const {
    std::vector<domain::DomainKey> result;
    result.reserve(entries_.size());
    for (const auto& item : entries_) {
        result.push_back(item.first);
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::chrono::milliseconds CacheStore::retryDelay(int failures) const noexcept {
    const int shift = std::clamp(failures - 1, 0, kMaxBackoffShift);
    const auto raw = options_.retryBase.count() * (static_cast<long long>(1) << shift);
    return std::chrono::milliseconds(std::min<long long>(raw, options_.retryCap.count()));
}

void CacheStore::poll_(const domain::DomainKey& key) {
    auto it = entries_.find(key);
    if (!active_ || it == entries_.end()) {
        return;
    }
    CacheEntry& entry = it->second;
    if (entry.inFlight) {
        LOG_TRACE(logging::LogCategory::CACHE, "Poll for %s suppressed: already in flight", key.c_str());
        return;
    }
    if (entry.pollTimer != Scheduler::kInvalidTimer) {
        scheduler_.cancel(entry.pollTimer);
        entry.pollTimer = Scheduler::kInvalidTimer;
    }

    entry.inFlight = true;
    const std::uint64_t generation = entry.generation;
    const std::uint64_t requestSeq = ++entry.requestSeq;
    const std::uint64_t pushSeqAtIssue = entry.pushSeq;
    std::weak_ptr<int> epoch = epoch_;
    FetchFn fetch = entry.fetch;

    LOG_TRACE(logging::LogCategory::CACHE, "Poll %s seq=%llu", key.c_str(), static_cast<unsigned long long>(requestSeq));

    auto callback = [this, key, generation, requestSeq, pushSeqAtIssue, epoch](FetchResult result) {
        if (epoch.expired()) {
            return;
        }
        onFetchComplete_(key, generation, requestSeq, pushSeqAtIssue, std::move(result));
    };

    try {
        fetch(std::move(callback));
    }
    catch (const std::exception& ex) {
        LOG_WARN(logging::LogCategory::CACHE, "Fetch for %s threw: %s", key.c_str(), ex.what());
        onFetchComplete_(key, generation, requestSeq, pushSeqAtIssue, FetchResult::failure(ex.what()));
    }
}

void CacheStore::onFetchComplete_(const domain::DomainKey& key,
                                  std::uint64_t generation,
                                  std::uint64_t requestSeq,
                                  std::uint64_t pushSeqAtIssue,
                                  FetchResult result) {
    auto it = entries_.find(key);
    if (it == entries_.end() || it->second.generation != generation) {
        LOG_TRACE(logging::LogCategory::CACHE, "Late fetch result for %s discarded", key.c_str());
        return;
    }
    CacheEntry& entry = it->second;
    if (!entry.inFlight || entry.requestSeq != requestSeq) {
        LOG_TRACE(logging::LogCategory::CACHE, "Duplicate fetch completion for %s ignored", key.c_str());
        return;
    }
    entry.inFlight = false;

    if (result.value) {
        entry.failures = 0;
        entry.lastError.reset();
        if (!result.timestamp && entry.value && entry.pushSeq != pushSeqAtIssue) {
            // Untimestamped and a push landed while the request was in flight.
            LOG_DEBUG(logging::LogCategory::CACHE, "Poll for %s superseded by a push", key.c_str());
        }
        else if (write_(entry, std::move(*result.value), result.timestamp) == WriteOutcome::Outdated) {
            // The cached value keeps its own freshness; the poll confirms nothing newer.
            LOG_DEBUG(logging::LogCategory::CACHE,
                      "Poll for %s older than cached value ts=%lld fetchedAt=%lld",
                      key.c_str(),
                      *result.timestamp,
                      entry.fetchedAt);
        }
        schedulePoll_(entry, entry.refetchInterval);
    }
    else {
        ++entry.failures;
        entry.lastError = result.error.value_or("fetch failed");
        const bool retry = entry.failures <= entry.retryLimit;
        const auto delay = retry ? retryDelay(entry.failures) : entry.refetchInterval;
        LOG_WARN(logging::LogCategory::CACHE,
                 "Poll for %s failed (%d/%d): %s; next in %lld ms",
                 key.c_str(),
                 entry.failures,
                 entry.retryLimit,
                 entry.lastError->c_str(),
                 static_cast<long long>(delay.count()));
        schedulePoll_(entry, delay);
    }

    publish_(entry);
}

void CacheStore::schedulePoll_(CacheEntry& entry, std::chrono::milliseconds delay) {
    if (entry.pollTimer != Scheduler::kInvalidTimer) {
        scheduler_.cancel(entry.pollTimer);
    }
    const domain::DomainKey key = entry.domainKey;
    const std::uint64_t generation = entry.generation;
    std::weak_ptr<int> epoch = epoch_;
    entry.pollTimer = scheduler_.schedule(delay, [this, key, generation, epoch]() {
        if (epoch.expired()) {
            return;
        }
        auto it = entries_.find(key);
        if (it == entries_.end() || it->second.generation != generation) {
            return;
        }
        it->second.pollTimer = Scheduler::kInvalidTimer;
        poll_(key);
    });
}

WriteOutcome CacheStore::write_(CacheEntry& entry,
                               boost::json::value value,
                               std::optional<domain::TimestampMs> timestamp) {
    if (timestamp) {
        if (entry.value && *timestamp < entry.fetchedAt) {
            return WriteOutcome::Outdated;
        }
        entry.fetchedAt = *timestamp;
    }
    entry.value = std::move(value);
    entry.updatedAt = scheduler_.now();
    entry.invalidated = false;
    return WriteOutcome::Applied;
}

bool CacheStore::isStale_(const CacheEntry& entry) const {
    if (!entry.value || entry.invalidated || entry.lastError) {
        return true;
    }
    return scheduler_.now() - entry.updatedAt > static_cast<domain::TimestampMs>(entry.staleAfter.count());
}

CacheSnapshot CacheStore::snapshot_(const CacheEntry& entry) const {
    CacheSnapshot snapshot;
    snapshot.value = entry.value;
    snapshot.isLoading = entry.inFlight && !entry.value;
    snapshot.isStale = isStale_(entry);
    snapshot.error = entry.lastError;
    snapshot.fetchedAt = entry.fetchedAt;
    return snapshot;
}

void CacheStore::publish_(const CacheEntry& entry) {
    if (!eventBus_) {
        return;
    }
    eventBus_->publishCacheUpdated(EventBus::CacheUpdated{entry.domainKey, snapshot_(entry)});
}

}  // namespace core
