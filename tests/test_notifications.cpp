#include <iostream>
#include <string>
#include <vector>

#include "TestSupport.h"
#include "app/MessageRouter.h"
#include "app/NotificationDispatcher.h"
#include "logging/Log.h"

using app::NotificationDispatcher;
using testsupport::ManualScheduler;

namespace {

class RecordingNotifier : public app::Notifier {
public:
    void notify(const app::Notification& notification) override { received.push_back(notification); }

    std::vector<app::Notification> received;
};

}  // namespace

int main() {
    logging::Log::set_log_level(config::LogLevel::Error);

    ManualScheduler sched;
    app::MessageRouter router(app::decodeDashboardFrame, sched, "dashboard");
    RecordingNotifier notifier;
    int invalidations = 0;
    router.registerHandler(app::MessageType::AlertCreated, [&](const app::Message&) { ++invalidations; });

    NotificationDispatcher dispatcher(router, notifier);
    const std::string alert = R"({"type":"alert_created","data":{"message":"USD/JPY crossed 150"}})";

    router.dispatch(alert);
    FXS_CHECK(notifier.received.empty(), "disabled dispatcher must not notify");
    FXS_CHECK(invalidations == 1, "other handlers still run while suppressed");

    dispatcher.enable();
    FXS_CHECK(dispatcher.permission() == NotificationDispatcher::Permission::Granted, "enable grants by default");
    router.dispatch(alert);
    FXS_CHECK(notifier.received.size() == 1, "enabled dispatcher notifies");
    FXS_CHECK(notifier.received.back().title == "New alert", "title");
    FXS_CHECK(notifier.received.back().body == "USD/JPY crossed 150", "body from the payload message");

    router.dispatch(R"({"type":"alert_created","data":{}})");
    FXS_CHECK(notifier.received.back().body == "An alert was raised", "fallback body");

    dispatcher.setPermission(NotificationDispatcher::Permission::Denied);
    router.dispatch(alert);
    FXS_CHECK(notifier.received.size() == 2, "denied permission suppresses");
    dispatcher.enable();
    FXS_CHECK(dispatcher.permission() == NotificationDispatcher::Permission::Denied, "enable does not override a denial");

    dispatcher.setPermission(NotificationDispatcher::Permission::Granted);
    dispatcher.disable();
    router.dispatch(alert);
    FXS_CHECK(notifier.received.size() == 2, "disabled dispatcher suppresses");
    FXS_CHECK(dispatcher.suppressed() == 3 && dispatcher.delivered() == 2, "counters track outcomes");
    FXS_CHECK(invalidations == 5, "alert handler saw every frame, got " << invalidations);

    router.dispatch(R"({"type":"rate_update","data":{"message":"ignored"}})");
    FXS_CHECK(notifier.received.size() == 2, "only alerts notify");
    return 0;
}
