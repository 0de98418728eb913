#pragma once

#include <memory>
#include <unordered_map>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "core/Scheduler.h"

namespace core {

class AsioScheduler : public Scheduler {
public:
    explicit AsioScheduler(boost::asio::io_context& ioc);
    ~AsioScheduler() override;

    AsioScheduler(const AsioScheduler&) = delete;
    AsioScheduler& operator=(const AsioScheduler&) = delete;

    TimerId schedule(std::chrono::milliseconds delay, Task task) override;
    void cancel(TimerId id) override;
    domain::TimestampMs now() const override;

    std::size_t pending() const noexcept { return timers_.size(); }

private:
    boost::asio::io_context& ioc_;
    std::unordered_map<TimerId, std::shared_ptr<boost::asio::steady_timer>> timers_;
    TimerId nextId_{1};
};

}  // namespace core
