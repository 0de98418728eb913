#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <boost/json/value.hpp>

#include "domain/Types.h"

namespace app {

enum class MessageType { RateUpdate, SignalUpdate, AlertCreated, PredictionUpdate, JobProgress };

struct Message {
    MessageType type{MessageType::RateUpdate};
    boost::json::value payload{};
    domain::TimestampMs timestamp{0};
    // False when the frame had no timestamp and `timestamp` is the local receive time.
    bool serverTimestamp{false};
};

struct DecodedFrame {
    enum class Status { Ok, Unknown, Malformed };

    Status status{Status::Malformed};
    Message message{};
    std::string detail{};
};

// `now` stamps frames that carry no timestamp of their own.
using FrameDecoder = std::function<DecodedFrame(std::string_view raw, domain::TimestampMs now)>;

// Dashboard channel: {"type": "rate_update", "data": {...}, "timestamp": "2024-01-01T00:00:00"}.
DecodedFrame decodeDashboardFrame(std::string_view raw, domain::TimestampMs now);

// Job channel: {"progress": 40, "current_step": "...", "status"?: "...", "message"?: "..."}.
DecodedFrame decodeJobFrame(std::string_view raw, domain::TimestampMs now);

const char* to_string(MessageType type) noexcept;
std::optional<MessageType> message_type_from_wire(std::string_view wire);

}  // namespace app
