#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <utility>

#include "domain/Types.h"

namespace core {

// Timer and clock source for the event loop. Every task runs on the loop thread.
class Scheduler {
public:
    using TimerId = std::uint64_t;
    using Task = std::function<void()>;

    static constexpr TimerId kInvalidTimer = 0;

    virtual ~Scheduler() = default;

    virtual TimerId schedule(std::chrono::milliseconds delay, Task task) = 0;
    // Cancelling an unknown or already fired timer is a no-op.
    virtual void cancel(TimerId id) = 0;
    virtual domain::TimestampMs now() const = 0;

    TimerId post(Task task) { return schedule(std::chrono::milliseconds(0), std::move(task)); }
};

}  // namespace core
