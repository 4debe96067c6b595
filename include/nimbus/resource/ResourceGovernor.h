#pragma once

// ResourceGovernor
// ----------------
// Samples process memory/CPU on a fixed cadence and compares them against
// configured ceilings. A sustained breach (stabilityWindow consecutive
// samples) switches the process to low-power mode, in which the health
// monitor and diagnostic engine stretch their polling cadence. An equally
// long run of in-limit samples switches back. The governor never stops or
// terminates anything.

#include <nimbus/core/clock.h>
#include <nimbus/core/event_hub.h>
#include <nimbus/core/types.h>
#include <nimbus/resource/resource_sampler.h>
#include <nimbus/resource/resource_usage.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>

#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

namespace nimbus::resource {

enum class PowerMode : std::uint8_t { Normal = 0, LowPower = 1 };

constexpr std::string_view powerModeName(PowerMode mode) noexcept {
    switch (mode) {
        case PowerMode::Normal:
            return "Normal";
        case PowerMode::LowPower:
            return "LowPower";
    }
    return "Unknown";
}

struct GovernorConfig {
    double memoryLimitMb{10.0};
    double cpuLimitPercent{0.5};
    Duration sampleInterval{5000};
    std::uint32_t stabilityWindow{3};
    // Polling intervals are multiplied by this factor while in low-power mode.
    std::uint32_t lowPowerMultiplier{6};
};

struct PowerModeChange {
    PowerMode from{PowerMode::Normal};
    PowerMode to{PowerMode::Normal};
    ResourceUsage usage;
};

class ResourceGovernor {
public:
    ResourceGovernor(std::shared_ptr<IResourceSampler> sampler, std::shared_ptr<Clock> clock,
                     GovernorConfig config = {});
    ~ResourceGovernor();

    ResourceGovernor(const ResourceGovernor&) = delete;
    ResourceGovernor& operator=(const ResourceGovernor&) = delete;

    /// Pure predicate: memory and CPU both at or under their ceilings.
    [[nodiscard]] static bool isWithinLimits(const ResourceUsage& usage, double memLimitMb,
                                             double cpuLimitPercent) noexcept;

    /// Take one sample and run the mode state machine.
    ResourceUsage tick();

    /// Run the mode state machine on an externally obtained sample.
    ResourceUsage observe(const ResourceSample& sample);

    void start(boost::asio::any_io_executor executor);
    void stop();

    [[nodiscard]] ResourceUsage current() const;
    [[nodiscard]] PowerMode mode() const noexcept { return mode_.load(std::memory_order_acquire); }
    [[nodiscard]] bool isLowPower() const noexcept { return mode() == PowerMode::LowPower; }

    /// `base` stretched by the low-power multiplier when in low-power mode.
    [[nodiscard]] Duration scaleInterval(Duration base) const noexcept;

    void setActiveSessionSource(std::function<std::size_t()> source);

    EventHub<PowerModeChange>& modeChanges() noexcept { return modeChanges_; }
    const GovernorConfig& config() const noexcept { return config_; }

private:
    boost::asio::awaitable<void> samplingLoop(std::shared_ptr<std::atomic<bool>> alive,
                                              std::shared_ptr<Clock> clock);

    std::shared_ptr<IResourceSampler> sampler_;
    std::shared_ptr<Clock> clock_;
    const GovernorConfig config_;

    mutable std::mutex mutex_;
    ResourceUsage current_{};
    std::uint32_t breachStreak_{0};
    std::uint32_t recoveryStreak_{0};
    std::function<std::size_t()> activeSessions_;

    std::atomic<PowerMode> mode_{PowerMode::Normal};
    std::shared_ptr<std::atomic<bool>> running_;

    EventHub<PowerModeChange> modeChanges_;
};

} // namespace nimbus::resource
