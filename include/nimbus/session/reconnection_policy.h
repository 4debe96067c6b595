#pragma once

#include <nimbus/core/types.h>

#include <algorithm>
#include <chrono>
#include <cstdint>

namespace nimbus::session {

struct ReconnectionPolicy {
    bool enabled{true};
    std::uint32_t maxAttempts{5};
    Duration baseDelay{1000};
    Duration maxDelay{16000};
    bool aggressiveMode{false};
    std::uint32_t aggressiveAttempts{10};
    Duration aggressiveInterval{500};
    // TimeoutPredicted with less remaining lifetime than this triggers a
    // preemptive handle swap.
    Duration preemptiveThreshold{60000};
};

/// Rejects policies whose delays are inconsistent (base > max, zero max).
Result<void> validatePolicy(const ReconnectionPolicy& policy);

/// Delay before reconnection attempt `attempt` (1-based).
/// Exponential: min(base * 2^(attempt-1), max). In aggressive mode the first
/// `aggressiveAttempts` attempts use the fixed aggressive interval instead.
constexpr Duration reconnectDelay(const ReconnectionPolicy& policy,
                                  std::uint32_t attempt) noexcept {
    if (attempt == 0) {
        attempt = 1;
    }
    if (policy.aggressiveMode && attempt <= policy.aggressiveAttempts) {
        return policy.aggressiveInterval;
    }
    const auto base = policy.baseDelay.count();
    const auto cap = policy.maxDelay.count();
    std::int64_t delay = base;
    for (std::uint32_t i = 1; i < attempt; ++i) {
        if (delay >= cap) {
            break;
        }
        delay *= 2;
    }
    return Duration{std::min<std::int64_t>(delay, cap)};
}

} // namespace nimbus::session
