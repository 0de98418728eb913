#include "app/MessageRouter.h"

#include <algorithm>
#include <exception>
#include <utility>

#include "logging/Log.h"

namespace app {

MessageRouter::MessageRouter(FrameDecoder decoder, const core::Scheduler& clock, std::string name)
    : decoder_(std::move(decoder)), clock_(clock), name_(std::move(name)) {}

MessageRouter::HandlerId MessageRouter::registerHandler(MessageType type, Handler handler) {
    const HandlerId id = nextId_++;
    handlers_.push_back(Registration{id, type, std::move(handler)});
    return id;
}

void MessageRouter::unregister(HandlerId id) {
    handlers_.erase(std::remove_if(handlers_.begin(), handlers_.end(), [id](const Registration& r) { return r.id == id; }),
                    handlers_.end());
}

std::size_t MessageRouter::handlerCount(MessageType type) const {
    return static_cast<std::size_t>(
        std::count_if(handlers_.begin(), handlers_.end(), [type](const Registration& r) { return r.type == type; }));
}

MessageRouter::DispatchResult MessageRouter::dispatch(std::string_view raw) {
    DecodedFrame frame;
    try {
        frame = decoder_(raw, clock_.now());
    }
    catch (const std::exception& ex) {
        frame.status = DecodedFrame::Status::Malformed;
        frame.detail = ex.what();
    }

    if (frame.status == DecodedFrame::Status::Malformed) {
        LOG_WARN(logging::LogCategory::NET, "[%s] malformed frame dropped: %s", name_.c_str(), frame.detail.c_str());
        return DispatchResult::Malformed;
    }
    if (frame.status == DecodedFrame::Status::Unknown) {
        LOG_DEBUG(logging::LogCategory::NET, "[%s] unknown frame ignored: %s", name_.c_str(), frame.detail.c_str());
        return DispatchResult::Unknown;
    }

    const Message& message = frame.message;
    // Handlers may register or unregister while this frame is being delivered.
    std::vector<Handler> targets;
    for (const auto& registration : handlers_) {
        if (registration.type == message.type) {
            targets.push_back(registration.handler);
        }
    }
    if (targets.empty()) {
        LOG_DEBUG(logging::LogCategory::NET, "[%s] no handler for %s", name_.c_str(), to_string(message.type));
        return DispatchResult::Unhandled;
    }

    for (const auto& handler : targets) {
        try {
            handler(message);
        }
        catch (const std::exception& ex) {
            LOG_ERROR(logging::LogCategory::NET,
                      "[%s] handler for %s threw: %s",
                      name_.c_str(),
                      to_string(message.type),
                      ex.what());
        }
    }
    return DispatchResult::Handled;
}

const char* to_string(MessageRouter::DispatchResult result) noexcept {
    switch (result) {
    case MessageRouter::DispatchResult::Handled:
        return "handled";
    case MessageRouter::DispatchResult::Unhandled:
        return "unhandled";
    case MessageRouter::DispatchResult::Unknown:
        return "unknown";
    case MessageRouter::DispatchResult::Malformed:
        return "malformed";
    }
    return "unknown";
}

}  // namespace app
