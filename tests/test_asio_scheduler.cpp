#include <chrono>
#include <iostream>
#include <stdexcept>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "TestSupport.h"
#include "core/AsioScheduler.h"
#include "logging/Log.h"

using namespace std::chrono_literals;

namespace {

int testOrderingAndCancel() {
    boost::asio::io_context ioc;
    core::AsioScheduler scheduler(ioc);
    std::vector<int> order;

    scheduler.schedule(20ms, [&] { order.push_back(2); });
    const auto cancelled = scheduler.schedule(10ms, [&] { order.push_back(99); });
    scheduler.post([&] { order.push_back(1); });
    scheduler.cancel(cancelled);
    scheduler.cancel(cancelled);
    scheduler.cancel(core::Scheduler::kInvalidTimer);
    FXS_CHECK(scheduler.pending() == 2, "cancelled timer is forgotten");

    ioc.run();
    FXS_CHECK(order.size() == 2 && order[0] == 1 && order[1] == 2, "timers fire in due order, cancelled one never");
    FXS_CHECK(scheduler.pending() == 0, "fired timers are forgotten");
    return 0;
}

int testThrowingTaskDoesNotStopLoop() {
    boost::asio::io_context ioc;
    core::AsioScheduler scheduler(ioc);
    bool later = false;

    scheduler.post([] { throw std::runtime_error("boom"); });
    scheduler.schedule(5ms, [&] { later = true; });
    ioc.run();
    FXS_CHECK(later, "loop keeps running after a task throws");
    return 0;
}

int testNestedScheduling() {
    boost::asio::io_context ioc;
    core::AsioScheduler scheduler(ioc);
    int fired = 0;

    const auto start = scheduler.now();
    scheduler.post([&] {
        ++fired;
        scheduler.schedule(15ms, [&] { ++fired; });
    });
    ioc.run();
    FXS_CHECK(fired == 2, "tasks may schedule further tasks");
    FXS_CHECK(scheduler.now() - start >= 15, "wall clock advanced past the delay");
    return 0;
}

}  // namespace

int main() {
    logging::Log::set_log_level(config::LogLevel::Error);
    logging::Log::set_sink([](const logging::Log::Record&) {});

    if (int rc = testOrderingAndCancel()) return rc;
    if (int rc = testThrowingTaskDoesNotStopLoop()) return rc;
    if (int rc = testNestedScheduling()) return rc;
    return 0;
}
