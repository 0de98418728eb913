#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace domain {

using TimestampMs = long long;
using DomainKey = std::string;
using ChannelKey = std::string;
using JobId = std::string;

enum class ConnectionStatus { Disconnected, Connecting, Connected, Reconnecting, Failed };

struct ConnectionState {
    ConnectionStatus status{ConnectionStatus::Disconnected};
    int attempt{0};
    std::optional<std::string> lastError{};

    bool operator==(const ConnectionState& other) const {
        return status == other.status && attempt == other.attempt && lastError == other.lastError;
    }
    bool operator!=(const ConnectionState& other) const { return !(*this == other); }
};

enum class JobStatus { Pending, Running, Completed, Failed, Cancelled };

enum class JobKind { Backtest, Collection, Repair };

struct JobProgress {
    JobId jobId;
    JobKind kind{JobKind::Backtest};
    int progress{0};
    std::string currentStep;
    JobStatus status{JobStatus::Pending};
    std::optional<std::string> message{};
};

inline bool isTerminal(JobStatus status) noexcept {
    return status == JobStatus::Completed || status == JobStatus::Failed || status == JobStatus::Cancelled;
}

inline const char* to_string(ConnectionStatus status) noexcept {
    switch (status) {
    case ConnectionStatus::Disconnected:
        return "Disconnected";
    case ConnectionStatus::Connecting:
        return "Connecting";
    case ConnectionStatus::Connected:
        return "Connected";
    case ConnectionStatus::Reconnecting:
        return "Reconnecting";
    case ConnectionStatus::Failed:
        return "Failed";
    }
    return "Unknown";
}

inline const char* to_string(JobStatus status) noexcept {
    switch (status) {
    case JobStatus::Pending:
        return "Pending";
    case JobStatus::Running:
        return "Running";
    case JobStatus::Completed:
        return "Completed";
    case JobStatus::Failed:
        return "Failed";
    case JobStatus::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

inline const char* to_string(JobKind kind) noexcept {
    switch (kind) {
    case JobKind::Backtest:
        return "backtest";
    case JobKind::Collection:
        return "collection";
    case JobKind::Repair:
        return "repair";
    }
    return "unknown";
}

inline std::optional<JobKind> job_kind_from_label(std::string_view label) {
    if (label == "backtest") {
        return JobKind::Backtest;
    }
    if (label == "collection" || label == "collect") {
        return JobKind::Collection;
    }
    if (label == "repair") {
        return JobKind::Repair;
    }
    return std::nullopt;
}

// Accepts the server's lowercase labels ("started" and "in_progress" count as running).
inline std::optional<JobStatus> job_status_from_label(std::string_view label) {
    if (label == "pending" || label == "queued") {
        return JobStatus::Pending;
    }
    if (label == "running" || label == "started" || label == "in_progress" || label == "analyzing" ||
        label == "repairing") {
        return JobStatus::Running;
    }
    if (label == "completed") {
        return JobStatus::Completed;
    }
    if (label == "failed") {
        return JobStatus::Failed;
    }
    if (label == "cancelled" || label == "canceled") {
        return JobStatus::Cancelled;
    }
    return std::nullopt;
}

}  // namespace domain
