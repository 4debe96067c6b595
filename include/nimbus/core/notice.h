#pragma once

#include <nimbus/core/types.h>

#include <string>
#include <string_view>
#include <vector>

namespace nimbus {

enum class NoticeKind : std::uint8_t {
    ReconnectionExhausted,
    ReconnectionRefused,
    RegistrationTimeout,
    AutoFixFailed,
    ConnectionAborted
};

constexpr std::string_view noticeKindName(NoticeKind kind) noexcept {
    switch (kind) {
        case NoticeKind::ReconnectionExhausted:
            return "ReconnectionExhausted";
        case NoticeKind::ReconnectionRefused:
            return "ReconnectionRefused";
        case NoticeKind::RegistrationTimeout:
            return "RegistrationTimeout";
        case NoticeKind::AutoFixFailed:
            return "AutoFixFailed";
        case NoticeKind::ConnectionAborted:
            return "ConnectionAborted";
    }
    return "Unknown";
}

/// Published on every give-up path so the caller always learns why work stopped.
struct TerminalNotice {
    NoticeKind kind{NoticeKind::AutoFixFailed};
    std::string subject; // session id or target id
    ErrorCode code{ErrorCode::Unknown};
    std::string message;
    std::vector<std::string> recommendations;
};

} // namespace nimbus
