#pragma once

#include <functional>
#include <memory>
#include <string>

namespace infra::net {

struct ChannelCallbacks {
    std::function<void()> onOpen;
    std::function<void(std::string)> onMessage;
    // Transport closed or failed to open. Never invoked after close().
    std::function<void(const std::string& reason)> onClose;
};

// One duplex connection attempt. A closed channel is not reopened; a new one is created.
class Channel {
public:
    virtual ~Channel() = default;

    virtual void open(ChannelCallbacks callbacks) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;
};

class ChannelFactory {
public:
    virtual ~ChannelFactory() = default;

    virtual std::unique_ptr<Channel> create(const std::string& url) = 0;
};

}  // namespace infra::net
