#pragma once

#include <nimbus/core/types.h>
#include <nimbus/session/session.h>

#include <optional>
#include <string>
#include <string_view>

namespace nimbus::session {

enum class SessionEventKind : std::uint8_t {
    HealthDegraded,
    TimeoutPredicted,
    ActivityDetected,
    ConnectionLost,
    SessionIdle,
    StatusChanged,
    HandleSwapped
};

constexpr std::string_view eventKindName(SessionEventKind kind) noexcept {
    switch (kind) {
        case SessionEventKind::HealthDegraded:
            return "HealthDegraded";
        case SessionEventKind::TimeoutPredicted:
            return "TimeoutPredicted";
        case SessionEventKind::ActivityDetected:
            return "ActivityDetected";
        case SessionEventKind::ConnectionLost:
            return "ConnectionLost";
        case SessionEventKind::SessionIdle:
            return "SessionIdle";
        case SessionEventKind::StatusChanged:
            return "StatusChanged";
        case SessionEventKind::HandleSwapped:
            return "HandleSwapped";
    }
    return "Unknown";
}

struct SessionEvent {
    SessionId sessionId;
    SessionEventKind kind{SessionEventKind::StatusChanged};
    std::string detail;
    TimePoint at{};
    // TimeoutPredicted: predicted remaining lifetime.
    std::optional<Duration> remaining;
    // StatusChanged: transition endpoints.
    std::optional<SessionStatus> from;
    std::optional<SessionStatus> to;
};

} // namespace nimbus::session
