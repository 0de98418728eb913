#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>

#include <boost/json/value.hpp>

#include "core/Scheduler.h"
#include "domain/Types.h"

namespace core {

// Result of one fetch. `timestamp` is the server's time for the value; without it the
// result is ordered against pushes by arrival only.
struct FetchResult {
    std::optional<boost::json::value> value{};
    std::optional<domain::TimestampMs> timestamp{};
    std::optional<std::string> error{};

    static FetchResult success(boost::json::value v, std::optional<domain::TimestampMs> ts = std::nullopt) {
        FetchResult result;
        result.value = std::move(v);
        result.timestamp = ts;
        return result;
    }

    static FetchResult failure(std::string message) {
        FetchResult result;
        result.error = std::move(message);
        return result;
    }
};

using FetchCallback = std::function<void(FetchResult)>;
using FetchFn = std::function<void(FetchCallback)>;

struct PollOptions {
    std::chrono::milliseconds interval{std::chrono::minutes(5)};
    std::chrono::milliseconds staleAfter{std::chrono::minutes(2)};
    int retryLimit{3};
};

struct CacheEntry {
    domain::DomainKey domainKey;
    std::optional<boost::json::value> value{};
    // Server time of the newest timestamped write; never compared with the local clock.
    domain::TimestampMs fetchedAt{0};
    // Local time of the last accepted write.
    domain::TimestampMs updatedAt{0};
    std::chrono::milliseconds staleAfter{0};
    std::chrono::milliseconds refetchInterval{0};
    bool inFlight{false};
    bool invalidated{false};
    std::optional<std::string> lastError{};

    FetchFn fetch{};
    int retryLimit{0};
    int failures{0};
    int refCount{0};
    std::uint64_t generation{0};
    std::uint64_t requestSeq{0};
    std::uint64_t pushSeq{0};
    Scheduler::TimerId pollTimer{Scheduler::kInvalidTimer};
};

struct CacheSnapshot {
    std::optional<boost::json::value> value{};
    bool isLoading{false};
    bool isStale{true};
    std::optional<std::string> error{};
    domain::TimestampMs fetchedAt{0};
};

enum class WriteOutcome { Applied, Outdated, UnknownDomain };

inline const char* to_string(WriteOutcome outcome) noexcept {
    switch (outcome) {
    case WriteOutcome::Applied:
        return "applied";
    case WriteOutcome::Outdated:
        return "outdated";
    case WriteOutcome::UnknownDomain:
        return "unknown_domain";
    }
    return "unknown";
}

}  // namespace core
