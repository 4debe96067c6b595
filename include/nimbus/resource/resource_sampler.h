#pragma once

#include <nimbus/core/types.h>

#include <cstdint>

namespace nimbus::resource {

struct ResourceSample {
    double memoryMb{0.0};
    double cpuPercent{0.0};
};

class IResourceSampler {
public:
    virtual ~IResourceSampler() = default;
    virtual Result<ResourceSample> sample() = 0;
};

// Reads VmRSS from /proc/self/status and derives CPU % from utime+stime
// deltas in /proc/self/stat against the aggregate /proc/stat line. The first
// call establishes the CPU baseline and reports 0%.
class ProcResourceSampler final : public IResourceSampler {
public:
    Result<ResourceSample> sample() override;

private:
    std::uint64_t lastProcJiffies_{0};
    std::uint64_t lastTotalJiffies_{0};
};

} // namespace nimbus::resource
