#pragma once

#include <nimbus/core/types.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace nimbus::session {

using SessionId = std::string;
using TargetId = std::string;

enum class SessionStatus : std::uint8_t { Connecting, Active, Inactive, Reconnecting, Terminated };

enum class SessionPriority : std::uint8_t { Low = 0, Normal = 1, High = 2, Critical = 3 };

constexpr std::string_view statusName(SessionStatus status) noexcept {
    switch (status) {
        case SessionStatus::Connecting:
            return "Connecting";
        case SessionStatus::Active:
            return "Active";
        case SessionStatus::Inactive:
            return "Inactive";
        case SessionStatus::Reconnecting:
            return "Reconnecting";
        case SessionStatus::Terminated:
            return "Terminated";
    }
    return "Unknown";
}

constexpr std::string_view priorityName(SessionPriority priority) noexcept {
    switch (priority) {
        case SessionPriority::Low:
            return "Low";
        case SessionPriority::Normal:
            return "Normal";
        case SessionPriority::High:
            return "High";
        case SessionPriority::Critical:
            return "Critical";
    }
    return "Unknown";
}

/// Session lifecycle:
///   Connecting   -> Active | Terminated
///   Active       -> Inactive | Reconnecting | Terminated
///   Inactive     -> Reconnecting | Terminated
///   Reconnecting -> Active | Terminated
///   Terminated   (absorbing)
constexpr bool isLegalTransition(SessionStatus from, SessionStatus to) noexcept {
    switch (from) {
        case SessionStatus::Connecting:
            return to == SessionStatus::Active || to == SessionStatus::Terminated;
        case SessionStatus::Active:
            return to == SessionStatus::Inactive || to == SessionStatus::Reconnecting ||
                   to == SessionStatus::Terminated;
        case SessionStatus::Inactive:
            return to == SessionStatus::Reconnecting || to == SessionStatus::Terminated;
        case SessionStatus::Reconnecting:
            return to == SessionStatus::Active || to == SessionStatus::Terminated;
        case SessionStatus::Terminated:
            return false;
    }
    return false;
}

/// Statuses that hold a live broker slot (used for the per-target cap property).
constexpr bool isLive(SessionStatus status) noexcept {
    return status == SessionStatus::Active || status == SessionStatus::Connecting ||
           status == SessionStatus::Reconnecting;
}

/// Ordering used by reuse suggestions: higher is healthier.
constexpr int healthRank(SessionStatus status) noexcept {
    switch (status) {
        case SessionStatus::Active:
            return 4;
        case SessionStatus::Connecting:
            return 3;
        case SessionStatus::Reconnecting:
            return 2;
        case SessionStatus::Inactive:
            return 1;
        case SessionStatus::Terminated:
            return 0;
    }
    return 0;
}

/// Opaque reference to a broker-side tunnel.
struct BrokerHandle {
    std::string id;
    std::optional<std::int32_t> processId;

    bool empty() const noexcept { return id.empty(); }
};

struct SessionConfig {
    TargetId targetId;
    std::uint16_t localPort{0};
    std::uint16_t remotePort{22};
    std::optional<std::string> remoteHost;
    std::optional<std::string> profile;
    std::string region{"us-east-1"};
    SessionPriority priority{SessionPriority::Normal};
    std::map<std::string, std::string> tags;
};

struct Session {
    SessionId id;
    SessionConfig config;
    BrokerHandle handle;
    SessionStatus status{SessionStatus::Connecting};
    TimePoint createdAt{};
    TimePoint lastActivity{};
    // When the current broker handle was obtained; the broker lifetime runs from here.
    TimePoint handleSince{};
    std::uint32_t connectionCount{0};
    std::uint64_t bytesTransferred{0};

    const TargetId& targetId() const noexcept { return config.targetId; }
    SessionPriority priority() const noexcept { return config.priority; }

    Duration idleFor(TimePoint now) const {
        return now > lastActivity ? std::chrono::duration_cast<Duration>(now - lastActivity)
                                  : Duration{0};
    }
    Duration age(TimePoint now) const {
        return now > createdAt ? std::chrono::duration_cast<Duration>(now - createdAt)
                               : Duration{0};
    }
};

} // namespace nimbus::session
