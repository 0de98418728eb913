#include "app/NotificationDispatcher.h"

#include <iostream>

#include <boost/json.hpp>

#include "logging/Log.h"

namespace app {

namespace {
constexpr const char* kAlertTitle = "New alert";
constexpr const char* kAlertFallbackBody = "An alert was raised";
}  // namespace

void ConsoleNotifier::notify(const Notification& notification) {
    std::cout << '[' << notification.title << "] " << notification.body << std::endl;
}

NotificationDispatcher::NotificationDispatcher(MessageRouter& router, Notifier& notifier)
    : router_(router), notifier_(notifier) {
    handlerId_ = router_.registerHandler(MessageType::AlertCreated, [this](const Message& message) { onAlert_(message); });
}

NotificationDispatcher::~NotificationDispatcher() {
    router_.unregister(handlerId_);
}

void NotificationDispatcher::enable() {
    enabled_ = true;
    if (permission_ == Permission::Default) {
        // Headless hosts have no prompt; enabling counts as consent.
        permission_ = Permission::Granted;
    }
    LOG_DEBUG(logging::LogCategory::UI, "notifications enabled permission=%s", to_string(permission_));
}

void NotificationDispatcher::disable() {
    enabled_ = false;
    LOG_DEBUG(logging::LogCategory::UI, "notifications disabled");
}

void NotificationDispatcher::setPermission(Permission permission) {
    permission_ = permission;
}

void NotificationDispatcher::onAlert_(const Message& message) {
    if (!enabled_ || permission_ != Permission::Granted) {
        ++suppressed_;
        LOG_TRACE(logging::LogCategory::UI, "alert notification suppressed");
        return;
    }

    Notification notification{kAlertTitle, kAlertFallbackBody};
    if (message.payload.is_object()) {
        const auto* text = message.payload.as_object().if_contains("message");
        if (text && text->is_string() && !text->get_string().empty()) {
            notification.body.assign(text->get_string().data(), text->get_string().size());
        }
    }

    notifier_.notify(notification);
    ++delivered_;
}

const char* to_string(NotificationDispatcher::Permission permission) noexcept {
    switch (permission) {
    case NotificationDispatcher::Permission::Default:
        return "default";
    case NotificationDispatcher::Permission::Granted:
        return "granted";
    case NotificationDispatcher::Permission::Denied:
        return "denied";
    }
    return "unknown";
}

}  // namespace app
