#pragma once

#include <nimbus/core/clock.h>
#include <nimbus/core/event_hub.h>
#include <nimbus/core/types.h>
#include <nimbus/resource/resource_usage.h>
#include <nimbus/session/SessionRegistry.h>
#include <nimbus/session/broker.h>
#include <nimbus/session/session.h>
#include <nimbus/session/session_events.h>
#include <nimbus/session/session_store.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace nimbus::resource {
class ResourceGovernor;
}

namespace nimbus::session {

struct SessionLimits {
    std::size_t maxSessionsPerTarget{3};
    std::size_t maxSessionsGlobal{10};
};

// Owner of the session registry. Every read and write of a Session goes
// through here and is serialized by one mutex; callers get copies.
//
// Broker and store calls are made outside the mutex. Status transitions are
// checked against isLegalTransition(), persisted, and published as
// StatusChanged events on events().
class SessionManager {
public:
    using TerminationHook = std::function<void(const SessionId&)>;

    SessionManager(std::shared_ptr<ISessionBroker> broker, std::shared_ptr<ISessionStore> store,
                   std::shared_ptr<Clock> clock, SessionLimits limits = {});
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Reserves a slot (evicting an Inactive session if the target or global
    // cap is reached), starts the broker session, and returns the Active session.
    Result<Session> createSession(const SessionConfig& config);

    // Non-terminated sessions for `target`, most recently active first.
    std::vector<Session> findExistingSessions(const TargetId& target,
                                              std::optional<std::uint16_t> remotePort = {}) const;

    // Healthiest, then most recently active; never a Terminated session.
    static std::optional<Session> suggestReuse(const std::vector<Session>& sessions);

    resource::ResourceUsage monitorResourceUsage() const;

    // Evicts Inactive sessions until every cap is honoured. Returns the count.
    std::size_t enforceLimits();

    Result<void> terminateSession(const SessionId& id, std::string_view reason);
    void terminateAll(std::string_view reason);

    std::vector<Session> listSessions() const;
    std::optional<Session> getSession(const SessionId& id) const;
    std::size_t occupiedSlots() const;

    Result<void> transition(const SessionId& id, SessionStatus to, std::string_view reason = {});

    // Records probe counters. Returns true when connections or bytes grew,
    // in which case lastActivity is bumped.
    Result<bool> recordProbe(const SessionId& id, std::uint32_t connectionCount,
                             std::uint64_t bytesTransferred);

    // Starts a broker session with the stored config of `id` without touching
    // the registry. The caller adopts or releases the handle.
    Result<BrokerHandle> startReplacement(const SessionId& id);

    // Swaps the broker handle of `id` and releases the previous one. A
    // Reconnecting session becomes Active. If the session was terminated in
    // the meantime the new handle is released and OperationCancelled returned.
    Result<void> adoptHandle(const SessionId& id, BrokerHandle handle);

    void releaseHandle(const BrokerHandle& handle);
    void saveMetrics(const SessionMetrics& metrics);

    void addTerminationHook(TerminationHook hook);
    void setGovernor(const resource::ResourceGovernor* governor);

    SessionLimits limits() const;
    void setLimits(SessionLimits limits);

    EventHub<SessionEvent>& events() noexcept { return events_; }
    Clock& clock() noexcept { return *clock_; }

private:
    struct Eviction {
        SessionId id;
        BrokerHandle handle;
        SessionEvent event;
    };

    // All *Locked helpers require mu_.
    Result<SessionEvent> transitionLocked(Session& s, SessionStatus to, std::string_view reason);
    Result<void> reserveSlotLocked(const TargetId& target, std::vector<Eviction>& evicted);
    Eviction evictLocked(const SessionId& id, std::string_view reason);
    void persistLocked(const Session& s);
    std::string usageSummaryLocked(const TargetId& target) const;

    void finishEvictions(std::vector<Eviction>& evicted);
    void runTerminationHooks(const SessionId& id);

    std::shared_ptr<ISessionBroker> broker_;
    std::shared_ptr<ISessionStore> store_;
    std::shared_ptr<Clock> clock_;

    mutable std::mutex mu_;
    SessionRegistry registry_;
    SessionLimits limits_;
    const resource::ResourceGovernor* governor_{nullptr};

    std::mutex hooksMu_;
    std::vector<TerminationHook> terminationHooks_;

    EventHub<SessionEvent> events_;
};

} // namespace nimbus::session
