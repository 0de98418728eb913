#include "app/Messages.h"

#include <boost/json/parse.hpp>

#include "core/TimeUtils.h"

namespace json = boost::json;

namespace app {

namespace {

DecodedFrame malformed(std::string detail) {
    DecodedFrame frame;
    frame.status = DecodedFrame::Status::Malformed;
    frame.detail = std::move(detail);
    return frame;
}

std::optional<json::object> parseObject(std::string_view raw, std::string& detail) {
    boost::system::error_code ec;
    json::value root = json::parse(json::string_view(raw.data(), raw.size()), ec);
    if (ec) {
        detail = "invalid json: " + ec.message();
        return std::nullopt;
    }
    if (!root.is_object()) {
        detail = "frame is not an object";
        return std::nullopt;
    }
    return std::move(root.as_object());
}

}  // namespace

const char* to_string(MessageType type) noexcept {
    switch (type) {
    case MessageType::RateUpdate:
        return "rate_update";
    case MessageType::SignalUpdate:
        return "signal_update";
    case MessageType::AlertCreated:
        return "alert_created";
    case MessageType::PredictionUpdate:
        return "prediction_update";
    case MessageType::JobProgress:
        return "job_progress";
    }
    return "unknown";
}

std::optional<MessageType> message_type_from_wire(std::string_view wire) {
    if (wire == "rate_update") {
        return MessageType::RateUpdate;
    }
    if (wire == "signal_update") {
        return MessageType::SignalUpdate;
    }
    if (wire == "alert_created") {
        return MessageType::AlertCreated;
    }
    if (wire == "prediction_update") {
        return MessageType::PredictionUpdate;
    }
    return std::nullopt;
}

DecodedFrame decodeDashboardFrame(std::string_view raw, domain::TimestampMs now) {
    std::string detail;
    auto root = parseObject(raw, detail);
    if (!root) {
        return malformed(std::move(detail));
    }

    const auto* typeField = root->if_contains("type");
    if (!typeField || !typeField->is_string()) {
        return malformed("missing type");
    }
    const auto& wire = typeField->as_string();
    const auto type = message_type_from_wire(std::string_view(wire.data(), wire.size()));

    DecodedFrame frame;
    if (!type) {
        frame.status = DecodedFrame::Status::Unknown;
        frame.detail = std::string(wire.data(), wire.size());
        return frame;
    }

    frame.status = DecodedFrame::Status::Ok;
    frame.message.type = *type;
    if (auto* data = root->if_contains("data")) {
        frame.message.payload = std::move(*data);
    }
    const json::value rootValue(std::move(*root));
    const auto stamp = core::TimeUtils::extractTimestamp(rootValue);
    frame.message.timestamp = stamp.value_or(now);
    frame.message.serverTimestamp = stamp.has_value();
    return frame;
}

DecodedFrame decodeJobFrame(std::string_view raw, domain::TimestampMs now) {
    std::string detail;
    auto root = parseObject(raw, detail);
    if (!root) {
        return malformed(std::move(detail));
    }

    const auto* progress = root->if_contains("progress");
    if (progress && !progress->is_number()) {
        return malformed("progress is not a number");
    }
    if (!progress && !root->contains("status") && !root->contains("current_step")) {
        DecodedFrame frame;
        frame.status = DecodedFrame::Status::Unknown;
        frame.detail = "no progress fields";
        return frame;
    }

    DecodedFrame frame;
    frame.status = DecodedFrame::Status::Ok;
    frame.message.type = MessageType::JobProgress;
    frame.message.payload = json::value(std::move(*root));
    const auto stamp = core::TimeUtils::extractTimestamp(frame.message.payload);
    frame.message.timestamp = stamp.value_or(now);
    frame.message.serverTimestamp = stamp.has_value();
    return frame;
}

}  // namespace app
