#pragma once

#include <nimbus/core/types.h>
#include <nimbus/session/session.h>

#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace nimbus::session {

struct SessionMetrics {
    SessionId sessionId;
    TimePoint sampledAt{};
    std::uint32_t connectionCount{0};
    std::uint64_t bytesTransferred{0};
    std::optional<Duration> probeLatency;
};

// Persistence boundary. The core calls saveSession after every status
// transition and saveMetrics periodically; failures are logged and the core
// continues in memory.
class ISessionStore {
public:
    virtual ~ISessionStore() = default;

    virtual Result<void> saveSession(const Session& session) = 0;
    virtual Result<std::optional<Session>> loadSession(const SessionId& id) = 0;
    virtual Result<void> deleteSession(const SessionId& id) = 0;
    virtual Result<void> saveMetrics(const SessionMetrics& metrics) = 0;
    virtual Result<std::vector<SessionMetrics>> loadMetrics(const SessionId& id,
                                                            std::size_t limit) = 0;
};

// Process-local store used when no external persistence is wired in.
class InMemorySessionStore final : public ISessionStore {
public:
    explicit InMemorySessionStore(std::size_t metricsPerSession = 256)
        : metricsPerSession_(metricsPerSession) {}

    Result<void> saveSession(const Session& session) override;
    Result<std::optional<Session>> loadSession(const SessionId& id) override;
    Result<void> deleteSession(const SessionId& id) override;
    Result<void> saveMetrics(const SessionMetrics& metrics) override;
    Result<std::vector<SessionMetrics>> loadMetrics(const SessionId& id,
                                                    std::size_t limit) override;

    std::size_t sessionCount() const;
    std::size_t saveCount() const;

private:
    mutable std::mutex mu_;
    std::size_t metricsPerSession_;
    std::size_t saves_{0};
    std::unordered_map<SessionId, Session> sessions_;
    std::unordered_map<SessionId, std::vector<SessionMetrics>> metrics_;
};

} // namespace nimbus::session
