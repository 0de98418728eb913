#include "infra/api/DashboardApi.h"

#include <chrono>
#include <utility>

#include <boost/json.hpp>

#include "core/TimeUtils.h"
#include "infra/net/Url.h"
#include "logging/Log.h"

namespace json = boost::json;

namespace infra::api {

namespace {

using std::chrono::minutes;

core::PollOptions poll(minutes interval, minutes staleAfter, int retryLimit) {
    core::PollOptions options;
    options.interval = interval;
    options.staleAfter = staleAfter;
    options.retryLimit = retryLimit;
    return options;
}

std::optional<std::string> stringMember(const json::object& obj, const char* name) {
    const auto* field = obj.if_contains(name);
    if (!field) {
        return std::nullopt;
    }
    if (field->is_string()) {
        const auto& str = field->get_string();
        if (str.empty()) {
            return std::nullopt;
        }
        return std::string(str.data(), str.size());
    }
    if (field->is_int64()) {
        return std::to_string(field->get_int64());
    }
    if (field->is_uint64()) {
        return std::to_string(field->get_uint64());
    }
    return std::nullopt;
}

}  // namespace

const std::vector<DomainSpec>& defaultDomains() {
    static const std::vector<DomainSpec> domains{
        {"rates/current", "/api/rates/current", poll(minutes(5), minutes(2), 3), {"timestamp"}},
        {"predictions/latest", "/api/predictions/latest", poll(minutes(30), minutes(15), 2), {"generated_at"}},
        {"signals/current", "/api/signals/current", poll(minutes(15), minutes(10), 2), {"signal.created_at"}},
        {"metrics/risk", "/api/metrics/risk", poll(minutes(60), minutes(30), 2), {"calculation_time"}},
        {"alerts/active", "/api/alerts/active", poll(minutes(10), minutes(5), 2), {"last_updated"}},
        {"data/status", "/api/data/status", poll(minutes(5), minutes(2), 3), {"status_generated_at"}},
        {"data/quality", "/api/data/quality", poll(minutes(5), minutes(2), 3), {"quality_metrics.last_quality_check"}},
        {"data/sources", "/api/data/sources", poll(minutes(2), minutes(1), 3), {"response_generated_at"}},
    };
    return domains;
}

DashboardApi::DashboardApi(net::HttpClient& http, std::string baseUrl) : http_(http), baseUrl_(std::move(baseUrl)) {}

std::string DashboardApi::url(const std::string& path) const {
    return net::joinUrl(baseUrl_, path);
}

core::FetchFn DashboardApi::fetcher(const std::string& path, std::vector<std::string> timestampFields) const {
    net::HttpClient* http = &http_;
    const std::string target = url(path);
    return [http, target, fields = std::move(timestampFields)](core::FetchCallback done) {
        http->get(target, [target, fields, done = std::move(done)](net::HttpResponse response) {
            if (response.error) {
                done(core::FetchResult::failure(*response.error));
                return;
            }
            if (!response.ok()) {
                done(core::FetchResult::failure("HTTP status " + std::to_string(response.status)));
                return;
            }
            boost::system::error_code ec;
            json::value body = json::parse(response.body, ec);
            if (ec) {
                LOG_WARN(logging::LogCategory::DATA, "Unparseable body from %s: %s", target.c_str(), ec.message().c_str());
                done(core::FetchResult::failure("invalid json: " + ec.message()));
                return;
            }
            std::optional<domain::TimestampMs> timestamp;
            for (const auto& field : fields) {
                timestamp = core::TimeUtils::extractTimestamp(body, field);
                if (timestamp) {
                    break;
                }
            }
            done(core::FetchResult::success(std::move(body), timestamp));
        });
    };
}

void DashboardApi::triggerJob(domain::JobKind kind, json::object params, TriggerCallback callback) {
    const std::string target = url(triggerPath(kind));
    LOG_INFO(logging::LogCategory::JOB, "Triggering %s job via %s", domain::to_string(kind), target.c_str());
    http_.post(target, json::serialize(params), [kind, callback = std::move(callback)](net::HttpResponse response) {
        TriggerResult result;
        if (response.error) {
            result.error = *response.error;
        }
        else if (!response.ok()) {
            result.error = "HTTP status " + std::to_string(response.status);
        }
        else {
            boost::system::error_code ec;
            result.body = json::parse(response.body, ec);
            if (ec) {
                result.error = "invalid json: " + ec.message();
            }
            else {
                result.jobId = extractJobId(kind, result.body);
                if (!result.jobId) {
                    result.error = "response carries no job id";
                }
            }
        }
        if (result.error) {
            LOG_ERROR(logging::LogCategory::JOB, "%s trigger failed: %s", domain::to_string(kind), result.error->c_str());
        }
        if (callback) {
            callback(std::move(result));
        }
    });
}

std::string DashboardApi::triggerPath(domain::JobKind kind) {
    switch (kind) {
    case domain::JobKind::Collection:
        return "/api/data/collect";
    case domain::JobKind::Repair:
        return "/api/data/repair";
    case domain::JobKind::Backtest:
        break;
    }
    return "/api/backtest/run";
}

std::string DashboardApi::backtestResultsPath(const domain::JobId& jobId) {
    return "/api/backtest/results/" + jobId;
}

std::optional<domain::JobId> DashboardApi::extractJobId(domain::JobKind kind, const json::value& body) {
    const auto* obj = body.if_object();
    if (!obj) {
        return std::nullopt;
    }
    const char* primary = "job_id";
    if (kind == domain::JobKind::Collection) {
        primary = "collection_id";
    }
    else if (kind == domain::JobKind::Repair) {
        primary = "repair_id";
    }
    for (const char* name : {primary, "job_id", "operation_id"}) {
        if (auto id = stringMember(*obj, name)) {
            return id;
        }
    }
    return std::nullopt;
}

json::object DashboardApi::defaultBacktestParams(domain::TimestampMs now) {
    constexpr domain::TimestampMs kYearMs = 365LL * 24 * core::TimeUtils::kMillisPerHour;
    json::object params;
    params["start_date"] = core::TimeUtils::formatDate(now - kYearMs);
    params["end_date"] = core::TimeUtils::formatDate(now);
    params["initial_capital"] = 1000000;
    params["prediction_model_type"] = "ensemble";
    return params;
}

json::object DashboardApi::defaultCollectionParams() {
    json::object params;
    params["force_update"] = false;
    params["notify_on_completion"] = true;
    return params;
}

}  // namespace infra::api
