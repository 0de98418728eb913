#pragma once

#include <cstddef>
#include <string>

#include "app/MessageRouter.h"

namespace app {

struct Notification {
    std::string title;
    std::string body;
};

class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void notify(const Notification& notification) = 0;
};

// Writes "[title] body" lines to stdout.
class ConsoleNotifier : public Notifier {
public:
    void notify(const Notification& notification) override;
};

// Side observer of AlertCreated on the dashboard router.
class NotificationDispatcher {
public:
    enum class Permission { Default, Granted, Denied };

    NotificationDispatcher(MessageRouter& router, Notifier& notifier);
    ~NotificationDispatcher();

    NotificationDispatcher(const NotificationDispatcher&) = delete;
    NotificationDispatcher& operator=(const NotificationDispatcher&) = delete;

    void enable();
    void disable();
    bool isEnabled() const noexcept { return enabled_; }

    void setPermission(Permission permission);
    Permission permission() const noexcept { return permission_; }

    std::size_t delivered() const noexcept { return delivered_; }
    std::size_t suppressed() const noexcept { return suppressed_; }

private:
    void onAlert_(const Message& message);

    MessageRouter& router_;
    Notifier& notifier_;
    MessageRouter::HandlerId handlerId_{0};
    bool enabled_{false};
    Permission permission_{Permission::Default};
    std::size_t delivered_{0};
    std::size_t suppressed_{0};
};

const char* to_string(NotificationDispatcher::Permission permission) noexcept;

}  // namespace app
