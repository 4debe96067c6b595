#pragma once

#include <nimbus/core/types.h>

#include <cstddef>

namespace nimbus::resource {

/// Point-in-time process usage. Written only by the ResourceGovernor; every
/// other component receives copies.
struct ResourceUsage {
    double memoryMb{0.0};
    double cpuPercent{0.0};
    std::size_t activeSessions{0};
    bool lowPower{false};
    TimePoint sampledAt{};
};

} // namespace nimbus::resource
