#pragma once

#include <nimbus/core/clock.h>
#include <nimbus/core/types.h>
#include <nimbus/session/SessionManager.h>
#include <nimbus/session/probe.h>
#include <nimbus/session/session.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

namespace nimbus::resource {
class ResourceGovernor;
}

namespace nimbus::session {

struct MonitorConfig {
    Duration heartbeatInterval{5000};
    std::uint32_t failureThreshold{3};
    Duration degradedLatency{1000};
    // Inactivity: all three windows must have elapsed.
    Duration connectionIdleWindow{30000};
    Duration transferIdleWindow{30000};
    Duration probeResponseWindow{5000};
    // Broker-side session lifetime and the horizon inside which an expiry is predicted.
    Duration sessionLifetime{1200000};
    Duration timeoutHorizon{300000};
    std::uint32_t metricsEveryNPolls{12};
};

struct HealthSnapshot {
    SessionId sessionId;
    SessionStatus status{SessionStatus::Connecting};
    bool monitored{false};
    bool healthy{false};
    std::uint32_t consecutiveFailures{0};
    bool connectionLost{false};
    std::optional<Duration> lastLatency;
    std::optional<TimePoint> lastResponseAt;
    Duration idleFor{0};
    std::optional<Duration> predictedTimeout;
};

// Per-session heartbeat. Each monitored session gets one coroutine that
// sleeps for the heartbeat interval (stretched in low-power mode) and then
// runs pollOnce(). Events are published on the SessionManager event hub.
//
// ConnectionLost is emitted once per loss episode, after failureThreshold
// consecutive probe failures; a successful probe or a new broker handle ends
// the episode. The monitor may be destroyed while probes are in flight; the
// loops notice on resumption and exit without touching it.
class HealthMonitor {
public:
    HealthMonitor(SessionManager& sessions, std::shared_ptr<ISessionProbe> probe,
                  std::shared_ptr<Clock> clock, boost::asio::any_io_executor executor,
                  MonitorConfig config = {});
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    Result<void> startMonitoring(const SessionId& id);
    void stopMonitoring(const SessionId& id);
    void stopAll();

    [[nodiscard]] bool isMonitoring(const SessionId& id) const;
    std::vector<SessionId> monitoredSessions() const;

    Result<HealthSnapshot> checkHealth(const SessionId& id) const;

    // Remaining broker lifetime when it falls inside the prediction horizon,
    // zero once the lifetime has elapsed, nullopt otherwise.
    std::optional<Duration> predictTimeout(const SessionId& id) const;

    // One heartbeat iteration. Results are discarded when monitoring of the
    // session stopped while the probe was in flight.
    boost::asio::awaitable<void> pollOnce(SessionId id);

    [[nodiscard]] Duration currentInterval() const;
    void setGovernor(const resource::ResourceGovernor* governor);
    const MonitorConfig& config() const noexcept { return config_; }

private:
    struct Watch {
        std::uint64_t generation{0};
        std::shared_ptr<std::atomic<bool>> running;
        std::uint32_t consecutiveFailures{0};
        bool lossReported{false};
        bool timeoutReported{false};
        TimePoint timeoutArmedFor{};
        TimePoint lastResponseAt{};
        TimePoint lastConnectionChange{};
        TimePoint lastTransferChange{};
        bool everResponded{false};
        std::optional<Duration> lastLatency;
        std::uint32_t lastConnections{0};
        std::uint64_t lastBytes{0};
        std::uint64_t polls{0};
    };

    boost::asio::awaitable<void> monitorLoop(SessionId id,
                                             std::shared_ptr<std::atomic<bool>> running,
                                             std::shared_ptr<std::atomic<bool>> alive,
                                             std::shared_ptr<Clock> clock);
    std::optional<Duration> remainingLifetime(const Session& s, TimePoint now) const;

    SessionManager& sessions_;
    std::shared_ptr<ISessionProbe> probe_;
    std::shared_ptr<Clock> clock_;
    boost::asio::any_io_executor executor_;
    const MonitorConfig config_;
    std::atomic<const resource::ResourceGovernor*> governor_{nullptr};

    mutable std::mutex mu_;
    std::unordered_map<SessionId, Watch> watches_;
    std::uint64_t nextGeneration_{0};
    std::shared_ptr<std::atomic<bool>> alive_;
};

} // namespace nimbus::session
