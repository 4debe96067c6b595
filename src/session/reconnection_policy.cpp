#include <nimbus/session/reconnection_policy.h>

#include <fmt/format.h>

namespace nimbus::session {

Result<void> validatePolicy(const ReconnectionPolicy& policy) {
    if (policy.maxDelay.count() <= 0) {
        return Error{ErrorCode::InvalidArgument, "reconnection.max_delay_ms must be positive"};
    }
    if (policy.baseDelay.count() <= 0) {
        return Error{ErrorCode::InvalidArgument, "reconnection.base_delay_ms must be positive"};
    }
    if (policy.baseDelay > policy.maxDelay) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("reconnection.base_delay_ms ({}) exceeds max_delay_ms ({})",
                                 policy.baseDelay.count(), policy.maxDelay.count())};
    }
    if (policy.aggressiveMode && policy.aggressiveInterval.count() <= 0) {
        return Error{ErrorCode::InvalidArgument,
                     "reconnection.aggressive_interval_ms must be positive"};
    }
    return {};
}

} // namespace nimbus::session
