#include "app/NotificationDispatcher.h"
#include "app/SyncService.h"
#include "config/ConfigProvider.h"
#include "core/AsioScheduler.h"
#include "core/TimeUtils.h"
#include "infra/api/DashboardApi.h"
#include "infra/net/BeastHttpClient.h"
#include "infra/net/WebSocketChannel.h"
#include "logging/Log.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/json/serialize.hpp>

#include <chrono>
#include <csignal>
#include <functional>
#include <iostream>
#include <string>
#include <utility>

namespace bootstrap {
namespace {
void printHelp(const config::Config& defaults) {
    std::cout << "Usage: fxsync [options]\n"
              << "  -a, --api-url URL              (default: " << defaults.apiBaseUrl << ")\n"
              << "  -w, --ws-url URL               (default: " << defaults.wsBaseUrl << ")\n"
              << "  -t, --token TOKEN              Bearer token for REST and websocket requests\n"
              << "      --config FILE              key=value file (apiUrl=..., wsUrl=..., etc.)\n"
              << "      --reconnect-interval MS    (default: " << defaults.reconnectIntervalMs << ")\n"
              << "      --max-reconnect-attempts N (default: " << defaults.maxReconnectAttempts << ")\n"
              << "      --http-timeout MS          (default: " << defaults.httpTimeoutMs << ")\n"
              << "      --no-notifications         Disable alert notifications\n"
              << "  -j, --track-job [KIND:]ID      Track a job; KIND is backtest|collection|repair (repeatable)\n"
              << "      --run-backtest             Start a backtest and track it\n"
              << "      --collect-data             Start a data collection and track it\n"
              << "  -l, --log-level LEVEL          trace|debug|info|warn|error (default: "
              << config::ConfigProvider::logLevelToString(defaults.logLevel) << ")\n"
              << "  -h, --help                     Show this help\n"
              << "      --version                  Show the version\n"
              << "Environment: FXS_API_URL, FXS_WS_URL, FXS_AUTH_TOKEN, FXS_CONFIG, FXS_RECONNECT_INTERVAL_MS,\n"
              << "             FXS_MAX_RECONNECT_ATTEMPTS, FXS_HTTP_TIMEOUT_MS, FXS_NOTIFICATIONS,\n"
              << "             FXS_TRACK_JOBS, FXS_LOG_LEVEL\n"
              << "Precedence: CLI > ENV > file > defaults\n"
              << "Signals: SIGUSR1 = hidden, SIGUSR2 = visible (resync), SIGINT/SIGTERM = stop\n";
}

void printVersion() {
#if defined(PROJECT_NAME) && defined(PROJECT_VERSION)
    std::cout << PROJECT_NAME << ' ' << PROJECT_VERSION << '\n';
#else
    std::cout << "fxsync" << '\n';
#endif
}

// "backtest:abc", "repair:42" or a bare id (backtest).
std::pair<domain::JobKind, domain::JobId> parseJobSpec(const std::string& spec) {
    const auto colon = spec.find(':');
    if (colon != std::string::npos) {
        if (auto kind = domain::job_kind_from_label(spec.substr(0, colon))) {
            return {*kind, spec.substr(colon + 1)};
        }
    }
    return {domain::JobKind::Backtest, spec};
}

void printJob(const domain::JobProgress& job) {
    std::cout << domain::to_string(job.kind) << ' ' << job.jobId << ": " << job.progress << "% "
              << domain::to_string(job.status);
    if (!job.currentStep.empty()) {
        std::cout << " - " << job.currentStep;
    }
    if (job.message) {
        std::cout << " (" << *job.message << ')';
    }
    std::cout << std::endl;
}

// Prints the server's result document once a backtest finishes.
void fetchBacktestResults(infra::api::DashboardApi& api, const domain::JobId& jobId) {
    auto fetch = api.fetcher(infra::api::DashboardApi::backtestResultsPath(jobId));
    fetch([jobId](core::FetchResult result) {
        if (!result.value) {
            LOG_WARN(logging::LogCategory::JOB,
                     "Results for %s unavailable: %s",
                     jobId.c_str(),
                     result.error.value_or("unknown error").c_str());
            return;
        }
        std::cout << "backtest " << jobId << " results: " << boost::json::serialize(*result.value) << std::endl;
    });
}

void waitForSignals(boost::asio::signal_set& signals, app::SyncService& service, boost::asio::io_context& ioc) {
    signals.async_wait([&signals, &service, &ioc](const boost::system::error_code& ec, int signo) {
        if (ec) {
            return;
        }
        if (signo == SIGUSR1 || signo == SIGUSR2) {
            service.setVisible(signo == SIGUSR2);
            waitForSignals(signals, service, ioc);
            return;
        }
        LOG_INFO(logging::LogCategory::UI, "Signal %d received, shutting down", signo);
        service.teardown();
        ioc.stop();
    });
}
}  // namespace

int run(int argc, char** argv) {
    config::ConfigProvider provider(argc, argv);
    const config::Config& config = provider.get();

    if (config.showHelp) {
        printHelp(config::Config{});
        return 0;
    }

    if (config.showVersion) {
        printVersion();
        return 0;
    }

    logging::Log::SetGlobalLogLevel(config.logLevel);
    LOG_INFO(logging::LogCategory::UI,
             "Startup level=%s api=%s ws=%s",
             logging::Log::level_to_string(config.logLevel),
             config.apiBaseUrl.c_str(),
             config.wsBaseUrl.c_str());

    boost::asio::io_context ioc(1);
    core::AsioScheduler scheduler(ioc);

    const auto timeout = std::chrono::milliseconds(config.httpTimeoutMs);
    infra::net::WebSocketChannelFactory channels(ioc, infra::net::WebSocketChannel::Options{config.authToken, timeout});
    infra::net::BeastHttpClient http(ioc, infra::net::BeastHttpClient::Options{config.authToken, timeout});
    app::ConsoleNotifier notifier;

    app::SyncService service(config, scheduler, channels, http, notifier);

    auto cacheSub = service.events().subscribeCacheUpdated([](const core::EventBus::CacheUpdated& event) {
        const auto& snap = event.snapshot;
        if (snap.error) {
            LOG_WARN(logging::LogCategory::DATA, "%s error=%s stale=%d", event.key.c_str(), snap.error->c_str(), snap.isStale);
            return;
        }
        LOG_INFO(logging::LogCategory::DATA,
                 "%s %s fetchedAt=%lld stale=%d",
                 event.key.c_str(),
                 snap.value ? "updated" : "pending",
                 snap.fetchedAt,
                 snap.isStale);
    });
    auto connectionSub = service.events().subscribeConnectionChanged([](const core::EventBus::ConnectionChanged& event) {
        LOG_INFO(logging::LogCategory::UI,
                 "connection %s: %s attempt=%d",
                 event.key.c_str(),
                 domain::to_string(event.state.status),
                 event.state.attempt);
    });
    service.jobs().addListener([&service](const domain::JobProgress& job) {
        printJob(job);
        if (job.kind == domain::JobKind::Backtest && job.status == domain::JobStatus::Completed) {
            fetchBacktestResults(service.api(), job.jobId);
        }
    });

    service.init();

    for (const auto& spec : config.trackJobs) {
        const auto job = parseJobSpec(spec);
        if (job.second.empty()) {
            LOG_WARN(logging::LogCategory::JOB, "Ignoring empty job id in '%s'", spec.c_str());
            continue;
        }
        service.trackJob(job.second, job.first);
    }

    auto reportTrigger = [](infra::api::TriggerResult result) {
        if (result.jobId) {
            std::cout << "started job " << *result.jobId << std::endl;
        }
    };
    if (config.runBacktest) {
        service.triggerJob(domain::JobKind::Backtest,
                           infra::api::DashboardApi::defaultBacktestParams(core::TimeUtils::wallClockMs()),
                           reportTrigger);
    }
    if (config.collectData) {
        service.triggerJob(domain::JobKind::Collection, infra::api::DashboardApi::defaultCollectionParams(), reportTrigger);
    }

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.add(SIGUSR1);
    signals.add(SIGUSR2);
    waitForSignals(signals, service, ioc);

    ioc.run();

    service.teardown();
    return 0;
}

}  // namespace bootstrap

int main(int argc, char** argv) {
    return bootstrap::run(argc, argv);
}
