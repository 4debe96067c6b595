#include <nimbus/session/HealthMonitor.h>

#include <nimbus/resource/ResourceGovernor.h>

#include <algorithm>
#include <stdexcept>

#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace nimbus::session {

namespace {

Duration since(TimePoint now, TimePoint then) {
    return now > then ? std::chrono::duration_cast<Duration>(now - then) : Duration{0};
}

} // namespace

HealthMonitor::HealthMonitor(SessionManager& sessions, std::shared_ptr<ISessionProbe> probe,
                             std::shared_ptr<Clock> clock, boost::asio::any_io_executor executor,
                             MonitorConfig config)
    : sessions_(sessions), probe_(std::move(probe)), clock_(std::move(clock)),
      executor_(std::move(executor)), config_(config),
      alive_(std::make_shared<std::atomic<bool>>(true)) {
    if (!probe_ || !clock_) {
        throw std::invalid_argument("HealthMonitor requires a probe and a clock");
    }
    std::weak_ptr<std::atomic<bool>> alive = alive_;
    sessions_.addTerminationHook([this, alive](const SessionId& id) {
        if (auto a = alive.lock(); a && a->load()) {
            stopMonitoring(id);
        }
    });
}

HealthMonitor::~HealthMonitor() {
    alive_->store(false);
    stopAll();
}

Result<void> HealthMonitor::startMonitoring(const SessionId& id) {
    auto session = sessions_.getSession(id);
    if (!session) {
        return Error{ErrorCode::NotFound, fmt::format("session {} not found", id)};
    }
    if (session->status == SessionStatus::Terminated) {
        return Error{ErrorCode::InvalidState, fmt::format("session {} is terminated", id)};
    }

    std::shared_ptr<std::atomic<bool>> running;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (watches_.count(id)) {
            return Error{ErrorCode::AlreadyExists, fmt::format("session {} already monitored", id)};
        }
        const auto now = clock_->now();
        Watch w;
        w.generation = ++nextGeneration_;
        w.running = std::make_shared<std::atomic<bool>>(true);
        w.lastResponseAt = now;
        w.lastConnectionChange = now;
        w.lastTransferChange = now;
        w.lastConnections = session->connectionCount;
        w.lastBytes = session->bytesTransferred;
        w.timeoutArmedFor = session->handleSince;
        running = w.running;
        watches_.emplace(id, std::move(w));
    }

    spdlog::debug("[HealthMonitor] monitoring {} every {}ms", id, currentInterval().count());
    boost::asio::co_spawn(executor_, monitorLoop(id, running, alive_, clock_),
                          boost::asio::detached);
    return {};
}

void HealthMonitor::stopMonitoring(const SessionId& id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = watches_.find(id);
    if (it == watches_.end()) {
        return;
    }
    it->second.running->store(false);
    watches_.erase(it);
    spdlog::debug("[HealthMonitor] stopped monitoring {}", id);
}

void HealthMonitor::stopAll() {
    std::lock_guard<std::mutex> lk(mu_);
    for (auto& [id, w] : watches_) {
        w.running->store(false);
    }
    watches_.clear();
}

bool HealthMonitor::isMonitoring(const SessionId& id) const {
    std::lock_guard<std::mutex> lk(mu_);
    return watches_.count(id) != 0;
}

std::vector<SessionId> HealthMonitor::monitoredSessions() const {
    std::vector<SessionId> out;
    {
        std::lock_guard<std::mutex> lk(mu_);
        out.reserve(watches_.size());
        for (const auto& [id, w] : watches_) {
            out.push_back(id);
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

Result<HealthSnapshot> HealthMonitor::checkHealth(const SessionId& id) const {
    auto session = sessions_.getSession(id);
    if (!session) {
        return Error{ErrorCode::NotFound, fmt::format("session {} not found", id)};
    }
    const auto now = clock_->now();

    HealthSnapshot snap;
    snap.sessionId = id;
    snap.status = session->status;
    snap.idleFor = session->idleFor(now);
    snap.predictedTimeout = remainingLifetime(*session, now);
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (auto it = watches_.find(id); it != watches_.end()) {
            const auto& w = it->second;
            snap.monitored = true;
            snap.consecutiveFailures = w.consecutiveFailures;
            snap.connectionLost = w.lossReported;
            snap.lastLatency = w.lastLatency;
            if (w.everResponded) {
                snap.lastResponseAt = w.lastResponseAt;
            }
        }
    }
    snap.healthy = snap.status == SessionStatus::Active && snap.consecutiveFailures == 0 &&
                   (!snap.lastLatency || *snap.lastLatency <= config_.degradedLatency);
    return snap;
}

std::optional<Duration> HealthMonitor::predictTimeout(const SessionId& id) const {
    auto session = sessions_.getSession(id);
    if (!session) {
        return std::nullopt;
    }
    return remainingLifetime(*session, clock_->now());
}

std::optional<Duration> HealthMonitor::remainingLifetime(const Session& s, TimePoint now) const {
    if (s.status == SessionStatus::Terminated || s.handle.empty()) {
        return std::nullopt;
    }
    const auto elapsed = since(now, s.handleSince);
    const Duration remaining =
        elapsed >= config_.sessionLifetime ? Duration{0} : config_.sessionLifetime - elapsed;
    if (remaining > config_.timeoutHorizon) {
        return std::nullopt;
    }
    return remaining;
}

Duration HealthMonitor::currentInterval() const {
    const auto* gov = governor_.load();
    return gov ? gov->scaleInterval(config_.heartbeatInterval) : config_.heartbeatInterval;
}

void HealthMonitor::setGovernor(const resource::ResourceGovernor* governor) {
    governor_.store(governor);
}

boost::asio::awaitable<void> HealthMonitor::pollOnce(SessionId id) {
    auto session = sessions_.getSession(id);
    if (!session) {
        stopMonitoring(id);
        co_return;
    }
    // Connecting and Reconnecting sessions are owned by their connect/reconnect flow.
    if (session->status != SessionStatus::Active && session->status != SessionStatus::Inactive) {
        co_return;
    }

    // Keeps the flag alive across the probe; members are touched only while it holds.
    const auto alive = alive_;
    const auto probe = probe_;
    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = watches_.find(id);
        if (it == watches_.end()) {
            co_return;
        }
        generation = it->second.generation;
    }

    auto result = co_await probe->probe(*session);
    if (!alive->load()) {
        co_return;
    }
    const auto now = clock_->now();

    bool activity = false;
    if (result) {
        auto recorded = sessions_.recordProbe(id, result.value().connectionCount,
                                              result.value().bytesTransferred);
        if (!recorded) {
            co_return;
        }
        activity = recorded.value();
    }

    std::vector<SessionEvent> out;
    std::optional<SessionMetrics> metrics;
    bool goIdle = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = watches_.find(id);
        if (it == watches_.end() || it->second.generation != generation) {
            spdlog::debug("[HealthMonitor] discarding probe result for stopped session {}", id);
            co_return;
        }
        auto& w = it->second;

        // A new broker handle starts a new loss episode and timeout window.
        if (session->handleSince != w.timeoutArmedFor) {
            w.timeoutArmedFor = session->handleSince;
            w.timeoutReported = false;
            w.consecutiveFailures = 0;
            w.lossReported = false;
        }

        if (result) {
            const auto& sample = result.value();
            if (w.consecutiveFailures > 0) {
                spdlog::debug("[HealthMonitor] {} recovered after {} failed probe(s)", id,
                              w.consecutiveFailures);
            }
            w.consecutiveFailures = 0;
            w.lossReported = false;
            w.everResponded = true;
            w.lastResponseAt = now;
            w.lastLatency = sample.latency;
            if (sample.connectionCount > w.lastConnections) {
                w.lastConnectionChange = now;
            }
            if (sample.bytesTransferred > w.lastBytes) {
                w.lastTransferChange = now;
            }
            w.lastConnections = sample.connectionCount;
            w.lastBytes = sample.bytesTransferred;

            if (activity) {
                out.push_back(SessionEvent{id, SessionEventKind::ActivityDetected,
                                           fmt::format("{} connections, {} bytes",
                                                       sample.connectionCount,
                                                       sample.bytesTransferred),
                                           now, std::nullopt, std::nullopt, std::nullopt});
            }
            if (sample.latency > config_.degradedLatency) {
                out.push_back(SessionEvent{id, SessionEventKind::HealthDegraded,
                                           fmt::format("probe latency {}ms above {}ms",
                                                       sample.latency.count(),
                                                       config_.degradedLatency.count()),
                                           now, std::nullopt, std::nullopt, std::nullopt});
            }
            if (config_.metricsEveryNPolls > 0 && ++w.polls % config_.metricsEveryNPolls == 0) {
                metrics = SessionMetrics{id, now, sample.connectionCount, sample.bytesTransferred,
                                         sample.latency};
            }
        } else {
            ++w.consecutiveFailures;
            const auto threshold = std::max<std::uint32_t>(1, config_.failureThreshold);
            if (w.consecutiveFailures >= threshold) {
                if (!w.lossReported) {
                    w.lossReported = true;
                    spdlog::warn("[HealthMonitor] connection lost for {} after {} failed probes: {}",
                                 id, w.consecutiveFailures, result.error().message);
                    out.push_back(SessionEvent{id, SessionEventKind::ConnectionLost,
                                               result.error().message, now, std::nullopt,
                                               std::nullopt, std::nullopt});
                }
            } else if (w.consecutiveFailures > 1) {
                out.push_back(SessionEvent{id, SessionEventKind::HealthDegraded,
                                           fmt::format("{} consecutive probe failures: {}",
                                                       w.consecutiveFailures,
                                                       result.error().message),
                                           now, std::nullopt, std::nullopt, std::nullopt});
            } else {
                spdlog::debug("[HealthMonitor] transient probe failure for {}: {}", id,
                              result.error().message);
            }
        }

        if (session->status == SessionStatus::Active &&
            since(now, w.lastConnectionChange) >= config_.connectionIdleWindow &&
            since(now, w.lastTransferChange) >= config_.transferIdleWindow &&
            since(now, w.lastResponseAt) >= config_.probeResponseWindow) {
            goIdle = true;
        }

        if (!w.timeoutReported) {
            if (auto remaining = remainingLifetime(*session, now)) {
                w.timeoutReported = true;
                out.push_back(SessionEvent{id, SessionEventKind::TimeoutPredicted,
                                           fmt::format("broker session expires in {}s",
                                                       remaining->count() / 1000),
                                           now, remaining, std::nullopt, std::nullopt});
            }
        }
    }

    if (metrics) {
        sessions_.saveMetrics(*metrics);
    }
    if (goIdle) {
        if (auto r = sessions_.transition(id, SessionStatus::Inactive, "idle"); r) {
            spdlog::info("[HealthMonitor] session {} marked inactive", id);
            out.push_back(SessionEvent{id, SessionEventKind::SessionIdle, "no activity", now,
                                       std::nullopt, std::nullopt, std::nullopt});
        }
    }
    for (const auto& ev : out) {
        sessions_.events().publish(ev);
    }
}

boost::asio::awaitable<void>
HealthMonitor::monitorLoop(SessionId id, std::shared_ptr<std::atomic<bool>> running,
                           std::shared_ptr<std::atomic<bool>> alive,
                           std::shared_ptr<Clock> clock) {
    while (alive->load() && running->load()) {
        co_await clock->sleepFor(currentInterval());
        if (!alive->load() || !running->load()) {
            break;
        }
        try {
            co_await pollOnce(id);
        } catch (const std::exception& e) {
            if (!alive->load()) {
                break;
            }
            spdlog::warn("[HealthMonitor] poll for {} failed: {}", id, e.what());
        }
    }
    spdlog::debug("[HealthMonitor] loop for {} exiting", id);
}

} // namespace nimbus::session
