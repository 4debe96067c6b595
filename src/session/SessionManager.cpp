#include <nimbus/session/SessionManager.h>

#include <nimbus/core/uuid.h>
#include <nimbus/resource/ResourceGovernor.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace nimbus::session {

SessionManager::SessionManager(std::shared_ptr<ISessionBroker> broker,
                               std::shared_ptr<ISessionStore> store, std::shared_ptr<Clock> clock,
                               SessionLimits limits)
    : broker_(std::move(broker)), store_(std::move(store)), clock_(std::move(clock)),
      limits_(limits) {
    if (!broker_ || !clock_) {
        throw std::invalid_argument("SessionManager requires a broker and a clock");
    }
}

SessionManager::~SessionManager() = default;

Result<Session> SessionManager::createSession(const SessionConfig& config) {
    if (config.targetId.empty()) {
        return Error{ErrorCode::InvalidArgument, "target id is required"};
    }

    std::vector<Eviction> evicted;
    SessionId id;
    std::optional<SessionEvent> created;
    {
        std::unique_lock<std::mutex> lk(mu_);
        if (auto reserved = reserveSlotLocked(config.targetId, evicted); !reserved) {
            auto err = reserved.error();
            lk.unlock();
            finishEvictions(evicted);
            spdlog::warn("[SessionManager] refusing session for {}: {}", config.targetId,
                         err.message);
            return err;
        }
        Session s;
        s.id = core::generateSessionId();
        s.config = config;
        s.status = SessionStatus::Connecting;
        s.createdAt = clock_->now();
        s.lastActivity = s.createdAt;
        id = s.id;
        auto& stored = registry_.insert(std::move(s));
        persistLocked(stored);
        created = SessionEvent{id,
                               SessionEventKind::StatusChanged,
                               "created",
                               stored.createdAt,
                               std::nullopt,
                               std::nullopt,
                               SessionStatus::Connecting};
    }
    finishEvictions(evicted);
    events_.publish(*created);

    spdlog::info("[SessionManager] starting session {} for target {} ({} -> {})", id,
                 config.targetId, config.localPort, config.remotePort);
    auto started = broker_->startSession(config);

    std::optional<SessionEvent> ev;
    Session result;
    {
        std::unique_lock<std::mutex> lk(mu_);
        auto* s = registry_.find(id);
        if (!s || s->status == SessionStatus::Terminated) {
            lk.unlock();
            if (started) {
                // Cancelled while the broker call was in flight.
                releaseHandle(started.value());
            }
            return Error{ErrorCode::OperationCancelled,
                         fmt::format("session {} was terminated during connect", id)};
        }
        if (!started) {
            auto tr = transitionLocked(*s, SessionStatus::Terminated, started.error().message);
            if (tr) {
                ev = tr.value();
            }
            registry_.erase(id);
        } else {
            s->handle = started.value();
            s->handleSince = clock_->now();
            auto tr = transitionLocked(*s, SessionStatus::Active, "broker session established");
            if (!tr) {
                return tr.error();
            }
            ev = tr.value();
            result = *s;
        }
    }
    if (ev) {
        events_.publish(*ev);
    }
    if (!started) {
        spdlog::warn("[SessionManager] broker refused session {} for {}: {}", id, config.targetId,
                     started.error().message);
        runTerminationHooks(id);
        return started.error();
    }
    return result;
}

std::vector<Session> SessionManager::findExistingSessions(
    const TargetId& target, std::optional<std::uint16_t> remotePort) const {
    std::vector<Session> out;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto* s : registry_.forTarget(target)) {
            if (s->status == SessionStatus::Terminated) {
                continue;
            }
            if (remotePort && s->config.remotePort != *remotePort) {
                continue;
            }
            out.push_back(*s);
        }
    }
    std::sort(out.begin(), out.end(), [](const Session& a, const Session& b) {
        return a.lastActivity > b.lastActivity;
    });
    return out;
}

std::optional<Session> SessionManager::suggestReuse(const std::vector<Session>& sessions) {
    const Session* best = nullptr;
    for (const auto& s : sessions) {
        if (s.status == SessionStatus::Terminated) {
            continue;
        }
        if (!best || healthRank(s.status) > healthRank(best->status) ||
            (healthRank(s.status) == healthRank(best->status) &&
             s.lastActivity > best->lastActivity)) {
            best = &s;
        }
    }
    if (!best) {
        return std::nullopt;
    }
    return *best;
}

resource::ResourceUsage SessionManager::monitorResourceUsage() const {
    resource::ResourceUsage usage;
    const resource::ResourceGovernor* gov = nullptr;
    {
        std::lock_guard<std::mutex> lk(mu_);
        gov = governor_;
        usage.activeSessions = registry_.occupied();
    }
    if (gov) {
        const auto sessions = usage.activeSessions;
        usage = gov->current();
        usage.activeSessions = sessions;
    } else {
        usage.sampledAt = clock_->now();
    }
    return usage;
}

std::size_t SessionManager::enforceLimits() {
    std::vector<Eviction> evicted;
    {
        std::lock_guard<std::mutex> lk(mu_);
        std::vector<TargetId> targets;
        for (const auto* s : registry_.all()) {
            if (std::find(targets.begin(), targets.end(), s->targetId()) == targets.end()) {
                targets.push_back(s->targetId());
            }
        }
        for (const auto& target : targets) {
            while (registry_.occupied(target) > limits_.maxSessionsPerTarget) {
                auto victim = registry_.evictionCandidate(target);
                if (!victim) {
                    break;
                }
                evicted.push_back(evictLocked(*victim, "per-target limit enforcement"));
            }
        }
        while (registry_.occupied() > limits_.maxSessionsGlobal) {
            auto victim = registry_.evictionCandidate(std::nullopt);
            if (!victim) {
                break;
            }
            evicted.push_back(evictLocked(*victim, "global limit enforcement"));
        }
        if (registry_.occupied() > limits_.maxSessionsGlobal) {
            spdlog::warn("[SessionManager] {} sessions above global cap {} with nothing evictable",
                         registry_.occupied(), limits_.maxSessionsGlobal);
        }
    }
    const auto n = evicted.size();
    finishEvictions(evicted);
    return n;
}

Result<void> SessionManager::terminateSession(const SessionId& id, std::string_view reason) {
    BrokerHandle handle;
    SessionEvent ev;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto* s = registry_.find(id);
        if (!s) {
            return Error{ErrorCode::NotFound, fmt::format("session {} not found", id)};
        }
        auto tr = transitionLocked(*s, SessionStatus::Terminated, reason);
        if (!tr) {
            return tr.error();
        }
        ev = tr.value();
        handle = s->handle;
        registry_.erase(id);
    }
    spdlog::info("[SessionManager] session {} terminated: {}", id, reason);
    runTerminationHooks(id);
    if (!handle.empty()) {
        releaseHandle(handle);
    }
    events_.publish(ev);
    return {};
}

void SessionManager::terminateAll(std::string_view reason) {
    for (const auto& s : listSessions()) {
        if (auto r = terminateSession(s.id, reason); !r && r.error().code != ErrorCode::NotFound) {
            spdlog::warn("[SessionManager] failed to terminate {}: {}", s.id, r.error().message);
        }
    }
}

std::vector<Session> SessionManager::listSessions() const {
    std::vector<Session> out;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto* s : registry_.all()) {
            out.push_back(*s);
        }
    }
    std::sort(out.begin(), out.end(),
              [](const Session& a, const Session& b) { return a.createdAt < b.createdAt; });
    return out;
}

std::optional<Session> SessionManager::getSession(const SessionId& id) const {
    std::lock_guard<std::mutex> lk(mu_);
    if (const auto* s = registry_.find(id)) {
        return *s;
    }
    return std::nullopt;
}

std::size_t SessionManager::occupiedSlots() const {
    std::lock_guard<std::mutex> lk(mu_);
    return registry_.occupied();
}

Result<void> SessionManager::transition(const SessionId& id, SessionStatus to,
                                        std::string_view reason) {
    if (to == SessionStatus::Terminated) {
        return terminateSession(id, reason);
    }
    SessionEvent ev;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto* s = registry_.find(id);
        if (!s) {
            return Error{ErrorCode::NotFound, fmt::format("session {} not found", id)};
        }
        auto tr = transitionLocked(*s, to, reason);
        if (!tr) {
            return tr.error();
        }
        ev = tr.value();
    }
    events_.publish(ev);
    return {};
}

Result<bool> SessionManager::recordProbe(const SessionId& id, std::uint32_t connectionCount,
                                         std::uint64_t bytesTransferred) {
    std::lock_guard<std::mutex> lk(mu_);
    auto* s = registry_.find(id);
    if (!s) {
        return Error{ErrorCode::NotFound, fmt::format("session {} not found", id)};
    }
    const bool grew =
        connectionCount > s->connectionCount || bytesTransferred > s->bytesTransferred;
    s->connectionCount = connectionCount;
    s->bytesTransferred = bytesTransferred;
    if (grew) {
        s->lastActivity = clock_->now();
    }
    return grew;
}

Result<BrokerHandle> SessionManager::startReplacement(const SessionId& id) {
    SessionConfig config;
    {
        std::lock_guard<std::mutex> lk(mu_);
        const auto* s = registry_.find(id);
        if (!s || s->status == SessionStatus::Terminated) {
            return Error{ErrorCode::NotFound, fmt::format("session {} not found", id)};
        }
        config = s->config;
    }
    return broker_->startSession(config);
}

Result<void> SessionManager::adoptHandle(const SessionId& id, BrokerHandle handle) {
    BrokerHandle previous;
    std::optional<SessionEvent> statusEv;
    SessionEvent swapEv;
    {
        std::unique_lock<std::mutex> lk(mu_);
        auto* s = registry_.find(id);
        const bool usable = s && (s->status == SessionStatus::Active ||
                                  s->status == SessionStatus::Reconnecting);
        if (!usable) {
            lk.unlock();
            releaseHandle(handle);
            return Error{ErrorCode::OperationCancelled,
                         fmt::format("session {} is no longer reconnectable", id)};
        }
        previous = std::exchange(s->handle, std::move(handle));
        s->handleSince = clock_->now();
        s->lastActivity = s->handleSince;
        if (s->status == SessionStatus::Reconnecting) {
            auto tr = transitionLocked(*s, SessionStatus::Active, "handle re-established");
            if (!tr) {
                return tr.error();
            }
            statusEv = tr.value();
        } else {
            persistLocked(*s);
        }
        swapEv = SessionEvent{id,
                              SessionEventKind::HandleSwapped,
                              fmt::format("{} -> {}", previous.id, s->handle.id),
                              s->handleSince,
                              std::nullopt,
                              std::nullopt,
                              std::nullopt};
    }
    if (!previous.empty()) {
        releaseHandle(previous);
    }
    if (statusEv) {
        events_.publish(*statusEv);
    }
    events_.publish(swapEv);
    return {};
}

void SessionManager::releaseHandle(const BrokerHandle& handle) {
    if (handle.empty()) {
        return;
    }
    if (auto r = broker_->terminateSession(handle); !r) {
        spdlog::debug("[SessionManager] broker terminate for handle {} failed: {}", handle.id,
                      r.error().message);
    }
}

void SessionManager::saveMetrics(const SessionMetrics& metrics) {
    if (!store_) {
        return;
    }
    if (auto r = store_->saveMetrics(metrics); !r) {
        spdlog::warn("[SessionManager] metrics for {} not persisted: {}", metrics.sessionId,
                     r.error().message);
    }
}

void SessionManager::addTerminationHook(TerminationHook hook) {
    std::lock_guard<std::mutex> lk(hooksMu_);
    terminationHooks_.push_back(std::move(hook));
}

void SessionManager::setGovernor(const resource::ResourceGovernor* governor) {
    std::lock_guard<std::mutex> lk(mu_);
    governor_ = governor;
}

SessionLimits SessionManager::limits() const {
    std::lock_guard<std::mutex> lk(mu_);
    return limits_;
}

void SessionManager::setLimits(SessionLimits limits) {
    std::lock_guard<std::mutex> lk(mu_);
    limits_ = limits;
}

Result<SessionEvent> SessionManager::transitionLocked(Session& s, SessionStatus to,
                                                      std::string_view reason) {
    const auto from = s.status;
    if (!isLegalTransition(from, to)) {
        spdlog::error("[SessionManager] illegal transition {} -> {} for session {}",
                      statusName(from), statusName(to), s.id);
        return Error{ErrorCode::InvariantViolation,
                     fmt::format("illegal transition {} -> {} for session {}", statusName(from),
                                 statusName(to), s.id)};
    }
    s.status = to;
    persistLocked(s);
    spdlog::debug("[SessionManager] {} {} -> {} ({})", s.id, statusName(from), statusName(to),
                  reason);
    return SessionEvent{s.id,          SessionEventKind::StatusChanged, std::string(reason),
                        clock_->now(), std::nullopt,                    from,
                        to};
}

Result<void> SessionManager::reserveSlotLocked(const TargetId& target,
                                               std::vector<Eviction>& evicted) {
    if (limits_.maxSessionsPerTarget == 0 || limits_.maxSessionsGlobal == 0) {
        return Error{ErrorCode::ResourceLimitExceeded, "session limits are set to zero"};
    }
    // Victims are chosen for both caps before any is evicted, so a refusal
    // leaves every session in place.
    std::vector<SessionId> targetVictims;
    if (registry_.occupied(target) >= limits_.maxSessionsPerTarget) {
        auto victim = registry_.evictionCandidate(target);
        if (!victim) {
            return Error{ErrorCode::ResourceLimitExceeded,
                         fmt::format("per-target session limit reached: {}",
                                     usageSummaryLocked(target)),
                         {"Reuse an existing session for this target",
                          "Terminate an idle session or raise session.max_per_target"}};
        }
        targetVictims.push_back(*victim);
    }
    std::vector<SessionId> globalVictims;
    auto planned = targetVictims;
    // Each victim also frees a global slot.
    while (registry_.occupied() - planned.size() >= limits_.maxSessionsGlobal) {
        auto victim = registry_.evictionCandidate(std::nullopt, planned);
        if (!victim) {
            return Error{ErrorCode::ResourceLimitExceeded,
                         fmt::format("global session limit reached: {}",
                                     usageSummaryLocked(target)),
                         {"Terminate sessions you no longer need", "Raise session.max_global"}};
        }
        planned.push_back(*victim);
        globalVictims.push_back(*victim);
    }

    for (const auto& id : targetVictims) {
        evicted.push_back(evictLocked(id, "evicted for new session on same target"));
    }
    for (const auto& id : globalVictims) {
        evicted.push_back(evictLocked(id, "evicted for new session (global cap)"));
    }
    return {};
}

SessionManager::Eviction SessionManager::evictLocked(const SessionId& id,
                                                     std::string_view reason) {
    auto& s = registry_.at(id);
    auto tr = transitionLocked(s, SessionStatus::Terminated, reason);
    if (!tr) {
        throw std::logic_error(tr.error().message);
    }
    Eviction e{id, s.handle, tr.value()};
    spdlog::info("[SessionManager] evicting inactive session {} (target {}, priority {}): {}", id,
                 s.targetId(), priorityName(s.priority()), reason);
    registry_.erase(id);
    return e;
}

void SessionManager::persistLocked(const Session& s) {
    if (!store_) {
        return;
    }
    if (auto r = store_->saveSession(s); !r) {
        spdlog::warn("[SessionManager] session {} not persisted: {}", s.id, r.error().message);
    }
}

std::string SessionManager::usageSummaryLocked(const TargetId& target) const {
    return fmt::format("target {} holds {}/{} sessions, {}/{} overall", target,
                       registry_.occupied(target), limits_.maxSessionsPerTarget,
                       registry_.occupied(), limits_.maxSessionsGlobal);
}

void SessionManager::finishEvictions(std::vector<Eviction>& evicted) {
    for (auto& e : evicted) {
        runTerminationHooks(e.id);
        releaseHandle(e.handle);
        events_.publish(e.event);
    }
    evicted.clear();
}

void SessionManager::runTerminationHooks(const SessionId& id) {
    std::vector<TerminationHook> hooks;
    {
        std::lock_guard<std::mutex> lk(hooksMu_);
        hooks = terminationHooks_;
    }
    for (const auto& hook : hooks) {
        try {
            hook(id);
        } catch (const std::exception& e) {
            spdlog::warn("[SessionManager] termination hook for {} threw: {}", id, e.what());
        }
    }
}

} // namespace nimbus::session
