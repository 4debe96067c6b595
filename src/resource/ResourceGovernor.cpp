#include <nimbus/resource/ResourceGovernor.h>

#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

#include <spdlog/spdlog.h>

#include <optional>
#include <stdexcept>

namespace nimbus::resource {

ResourceGovernor::ResourceGovernor(std::shared_ptr<IResourceSampler> sampler,
                                   std::shared_ptr<Clock> clock, GovernorConfig config)
    : sampler_(std::move(sampler)), clock_(std::move(clock)), config_(config) {
    if (!sampler_ || !clock_) {
        throw std::invalid_argument("ResourceGovernor requires a sampler and a clock");
    }
    current_.sampledAt = clock_->now();
}

ResourceGovernor::~ResourceGovernor() {
    stop();
}

bool ResourceGovernor::isWithinLimits(const ResourceUsage& usage, double memLimitMb,
                                      double cpuLimitPercent) noexcept {
    return usage.memoryMb <= memLimitMb && usage.cpuPercent <= cpuLimitPercent;
}

ResourceUsage ResourceGovernor::tick() {
    auto sample = sampler_->sample();
    if (!sample) {
        spdlog::debug("[ResourceGovernor] sample failed: {}", sample.error().message);
        return current();
    }
    return observe(sample.value());
}

ResourceUsage ResourceGovernor::observe(const ResourceSample& sample) {
    std::function<std::size_t()> sessions;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        sessions = activeSessions_;
    }

    ResourceUsage usage;
    usage.memoryMb = sample.memoryMb;
    usage.cpuPercent = sample.cpuPercent;
    usage.activeSessions = sessions ? sessions() : 0;
    usage.sampledAt = clock_->now();

    const bool within = isWithinLimits(usage, config_.memoryLimitMb, config_.cpuLimitPercent);
    const std::uint32_t window = config_.stabilityWindow == 0 ? 1 : config_.stabilityWindow;

    std::optional<PowerModeChange> change;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (within) {
            ++recoveryStreak_;
            breachStreak_ = 0;
        } else {
            ++breachStreak_;
            recoveryStreak_ = 0;
        }

        const PowerMode before = mode_.load(std::memory_order_relaxed);
        PowerMode after = before;
        if (before == PowerMode::Normal && breachStreak_ >= window) {
            after = PowerMode::LowPower;
        } else if (before == PowerMode::LowPower && recoveryStreak_ >= window) {
            after = PowerMode::Normal;
        }
        if (after != before) {
            mode_.store(after, std::memory_order_release);
            breachStreak_ = 0;
            recoveryStreak_ = 0;
        }
        usage.lowPower = after == PowerMode::LowPower;
        current_ = usage;
        if (after != before) {
            change = PowerModeChange{before, after, usage};
        }
    }

    if (!within) {
        spdlog::debug("[ResourceGovernor] over ceiling: {:.2f} MB / {:.2f}% (limits {:.2f} MB / "
                      "{:.2f}%)",
                      usage.memoryMb, usage.cpuPercent, config_.memoryLimitMb,
                      config_.cpuLimitPercent);
    }
    if (change) {
        spdlog::info("[ResourceGovernor] Power mode: {} -> {} (mem={:.2f} MB, cpu={:.2f}%)",
                     powerModeName(change->from), powerModeName(change->to), usage.memoryMb,
                     usage.cpuPercent);
        modeChanges_.publish(*change);
    }
    return usage;
}

void ResourceGovernor::start(boost::asio::any_io_executor executor) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (running_ && running_->load()) {
        return;
    }
    running_ = std::make_shared<std::atomic<bool>>(true);
    boost::asio::co_spawn(executor, samplingLoop(running_, clock_), boost::asio::detached);
}

void ResourceGovernor::stop() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (running_) {
        running_->store(false);
        running_.reset();
    }
}

ResourceUsage ResourceGovernor::current() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return current_;
}

Duration ResourceGovernor::scaleInterval(Duration base) const noexcept {
    if (!isLowPower()) {
        return base;
    }
    return base * static_cast<Duration::rep>(config_.lowPowerMultiplier == 0
                                                  ? 1
                                                  : config_.lowPowerMultiplier);
}

void ResourceGovernor::setActiveSessionSource(std::function<std::size_t()> source) {
    std::lock_guard<std::mutex> lk(mutex_);
    activeSessions_ = std::move(source);
}

boost::asio::awaitable<void>
ResourceGovernor::samplingLoop(std::shared_ptr<std::atomic<bool>> alive,
                               std::shared_ptr<Clock> clock) {
    spdlog::debug("[ResourceGovernor] sampling loop started (interval={}ms)",
                  config_.sampleInterval.count());
    while (alive->load()) {
        try {
            tick();
        } catch (const std::exception& e) {
            spdlog::warn("[ResourceGovernor] tick error: {}", e.what());
        }
        co_await clock->sleepFor(config_.sampleInterval);
    }
    spdlog::debug("[ResourceGovernor] sampling loop exiting");
}

} // namespace nimbus::resource
