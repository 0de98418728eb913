#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "app/Messages.h"
#include "core/Scheduler.h"

namespace app {

// Typed dispatch table for one channel. Handlers run synchronously, in registration order.
class MessageRouter {
public:
    using Handler = std::function<void(const Message&)>;
    using HandlerId = std::size_t;

    enum class DispatchResult { Handled, Unhandled, Unknown, Malformed };

    MessageRouter(FrameDecoder decoder, const core::Scheduler& clock, std::string name);

    HandlerId registerHandler(MessageType type, Handler handler);
    void unregister(HandlerId id);

    DispatchResult dispatch(std::string_view raw);

    std::size_t handlerCount(MessageType type) const;
    const std::string& name() const noexcept { return name_; }

private:
    struct Registration {
        HandlerId id{};
        MessageType type{};
        Handler handler{};
    };

    FrameDecoder decoder_;
    const core::Scheduler& clock_;
    std::string name_;
    std::vector<Registration> handlers_;
    HandlerId nextId_{1};
};

const char* to_string(MessageRouter::DispatchResult result) noexcept;

}  // namespace app
