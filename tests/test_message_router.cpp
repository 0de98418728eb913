#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "TestSupport.h"
#include "app/MessageRouter.h"
#include "core/TimeUtils.h"
#include "logging/Log.h"

using app::DecodedFrame;
using app::Message;
using app::MessageRouter;
using app::MessageType;
using Result = MessageRouter::DispatchResult;
using testsupport::ManualScheduler;

namespace {

int testDashboardDecoder() {
    auto frame = app::decodeDashboardFrame(
        R"({"type":"rate_update","data":{"rate":150.25},"timestamp":"2024-03-01T12:00:00"})", 42);
    FXS_CHECK(frame.status == DecodedFrame::Status::Ok, "rate_update should decode");
    FXS_CHECK(frame.message.type == MessageType::RateUpdate, "wrong type");
    FXS_CHECK(frame.message.payload.as_object().at("rate").as_double() == 150.25, "payload is the data member");
    FXS_CHECK(frame.message.timestamp == *core::TimeUtils::parseIso8601Ms("2024-03-01T12:00:00Z"),
              "naive timestamp is read as UTC");
    FXS_CHECK(frame.message.serverTimestamp, "frame timestamp is the server's");

    auto noStamp = app::decodeDashboardFrame(R"({"type":"alert_created","data":{}})", 42);
    FXS_CHECK(noStamp.status == DecodedFrame::Status::Ok && noStamp.message.timestamp == 42,
              "missing timestamp falls back to the local clock");
    FXS_CHECK(!noStamp.message.serverTimestamp, "receive time is flagged as local");

    auto epoch = app::decodeDashboardFrame(R"({"type":"signal_update","data":{},"timestamp":1700000000})", 0);
    FXS_CHECK(epoch.message.timestamp == 1700000000000LL, "epoch seconds are scaled to millis");

    FXS_CHECK(app::decodeDashboardFrame("not json", 0).status == DecodedFrame::Status::Malformed, "bad json");
    FXS_CHECK(app::decodeDashboardFrame("[1,2]", 0).status == DecodedFrame::Status::Malformed, "array frame");
    FXS_CHECK(app::decodeDashboardFrame(R"({"data":{}})", 0).status == DecodedFrame::Status::Malformed, "no type");
    FXS_CHECK(app::decodeDashboardFrame(R"({"type":"heartbeat"})", 0).status == DecodedFrame::Status::Unknown,
              "unknown type");
    return 0;
}

int testJobDecoder() {
    auto frame = app::decodeJobFrame(R"({"progress":40,"current_step":"Training"})", 5);
    FXS_CHECK(frame.status == DecodedFrame::Status::Ok && frame.message.type == MessageType::JobProgress,
              "job frame should decode");
    FXS_CHECK(frame.message.payload.as_object().at("current_step").as_string() == "Training", "payload kept whole");
    FXS_CHECK(app::decodeJobFrame(R"({"progress":"40"})", 0).status == DecodedFrame::Status::Malformed,
              "string progress is malformed");
    FXS_CHECK(app::decodeJobFrame(R"({"type":"ping"})", 0).status == DecodedFrame::Status::Unknown,
              "frame without progress fields is unknown");
    return 0;
}

int testDispatch() {
    ManualScheduler sched;
    MessageRouter router(app::decodeDashboardFrame, sched, "dashboard");

    std::vector<std::string> calls;
    router.registerHandler(MessageType::RateUpdate, [&](const Message&) { calls.push_back("first"); });
    router.registerHandler(MessageType::RateUpdate, [&](const Message&) { throw std::runtime_error("boom"); });
    const auto third =
        router.registerHandler(MessageType::RateUpdate, [&](const Message&) { calls.push_back("third"); });

    const std::string rate = R"({"type":"rate_update","data":{"rate":1}})";
    FXS_CHECK(router.dispatch(rate) == Result::Handled, "rate frame should be handled");
    FXS_CHECK((calls == std::vector<std::string>{"first", "third"}), "handlers run in order despite a throw");

    FXS_CHECK(router.dispatch("{oops") == Result::Malformed, "malformed frame reported");
    FXS_CHECK(router.dispatch(R"({"type":"mystery"})") == Result::Unknown, "unknown type reported");
    FXS_CHECK(router.dispatch(R"({"type":"prediction_update","data":{}})") == Result::Unhandled,
              "recognized type without handler");

    // A bad frame does not poison later ones.
    calls.clear();
    FXS_CHECK(router.dispatch(rate) == Result::Handled, "router keeps working after bad frames");
    FXS_CHECK(calls.size() == 2, "both handlers ran again");

    router.unregister(third);
    FXS_CHECK(router.handlerCount(MessageType::RateUpdate) == 2, "unregister removes one handler");

    // Unregistering from inside a handler is safe.
    MessageRouter::HandlerId self = 0;
    int selfCalls = 0;
    self = router.registerHandler(MessageType::AlertCreated, [&](const Message&) {
        ++selfCalls;
        router.unregister(self);
    });
    router.dispatch(R"({"type":"alert_created"})");
    router.dispatch(R"({"type":"alert_created"})");
    FXS_CHECK(selfCalls == 1, "self-unregistering handler ran " << selfCalls << " times");
    return 0;
}

}  // namespace

int main() {
    logging::Log::set_log_level(config::LogLevel::Error);

    if (int rc = testDashboardDecoder()) return rc;
    if (int rc = testJobDecoder()) return rc;
    if (int rc = testDispatch()) return rc;
    return 0;
}
