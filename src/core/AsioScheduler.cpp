#include "core/AsioScheduler.h"

#include <exception>
#include <utility>

#include "core/TimeUtils.h"
#include "logging/Log.h"

namespace core {

AsioScheduler::AsioScheduler(boost::asio::io_context& ioc) : ioc_(ioc) {}

AsioScheduler::~AsioScheduler() {
    for (auto& entry : timers_) {
        entry.second->cancel();
    }
    timers_.clear();
}

Scheduler::TimerId AsioScheduler::schedule(std::chrono::milliseconds delay, Task task) {
    const TimerId id = nextId_++;
    auto timer = std::make_shared<boost::asio::steady_timer>(ioc_);
    timer->expires_after(delay.count() > 0 ? delay : std::chrono::milliseconds(0));
    timers_.emplace(id, timer);

    timer->async_wait([this, id, timer, task = std::move(task)](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        auto it = timers_.find(id);
        if (it == timers_.end() || it->second != timer) {
            return;
        }
        timers_.erase(it);
        try {
            task();
        }
        catch (const std::exception& ex) {
            LOG_ERROR(logging::LogCategory::DATA, "Scheduled task %llu threw: %s",
                      static_cast<unsigned long long>(id), ex.what());
        }
    });
    return id;
}

void AsioScheduler::cancel(TimerId id) {
    auto it = timers_.find(id);
    if (it == timers_.end()) {
        return;
    }
    it->second->cancel();
    timers_.erase(it);
}

domain::TimestampMs AsioScheduler::now() const {
    return TimeUtils::wallClockMs();
}

}  // namespace core
