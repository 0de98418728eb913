#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

#include "core/CacheEntry.h"
#include "domain/Types.h"
#include "infra/net/HttpClient.h"

namespace infra::api {

struct DomainSpec {
    domain::DomainKey key;
    std::string path;
    core::PollOptions poll;
    // Member paths holding the server's time for the body, tried in order.
    std::vector<std::string> timestampFields;
};

// The dashboard's polled domains with their refresh policy.
const std::vector<DomainSpec>& defaultDomains();

struct TriggerResult {
    std::optional<domain::JobId> jobId{};
    std::optional<std::string> error{};
    boost::json::value body{};
};

// REST surface of the dashboard server. Every request carries the bearer token set on the client.
class DashboardApi {
public:
    using TriggerCallback = std::function<void(TriggerResult)>;

    DashboardApi(net::HttpClient& http, std::string baseUrl);

    std::string url(const std::string& path) const;

    // GET `path` and parse the body as JSON. The first of `timestampFields` present in the
    // body becomes the ordering time; a body without one is delivered untimestamped.
    core::FetchFn fetcher(const std::string& path, std::vector<std::string> timestampFields = {"timestamp"}) const;

    void triggerJob(domain::JobKind kind, boost::json::object params, TriggerCallback callback);

    static std::string triggerPath(domain::JobKind kind);
    static std::string backtestResultsPath(const domain::JobId& jobId);
    static std::optional<domain::JobId> extractJobId(domain::JobKind kind, const boost::json::value& body);

    // Request bodies the CLI uses when no parameters are given.
    static boost::json::object defaultBacktestParams(domain::TimestampMs now);
    static boost::json::object defaultCollectionParams();

private:
    net::HttpClient& http_;
    std::string baseUrl_;
};

}  // namespace infra::api
