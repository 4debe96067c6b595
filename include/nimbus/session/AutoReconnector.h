#pragma once

#include <nimbus/core/clock.h>
#include <nimbus/core/event_hub.h>
#include <nimbus/core/notice.h>
#include <nimbus/core/types.h>
#include <nimbus/session/SessionManager.h>
#include <nimbus/session/reconnection_policy.h>
#include <nimbus/session/session_events.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

namespace nimbus::session {

// Reacts to monitor events on the SessionManager hub:
//   ConnectionLost                        -> handleDisconnection
//   ActivityDetected on an Inactive session -> handleDisconnection
//   TimeoutPredicted below the threshold  -> preemptiveReconnect
//
// At most one reconnection (reactive or preemptive) is in flight per session
// id; overlapping requests return false immediately.
class AutoReconnector {
public:
    AutoReconnector(SessionManager& sessions, std::shared_ptr<Clock> clock,
                    boost::asio::any_io_executor executor, ReconnectionPolicy policy = {});
    ~AutoReconnector();

    AutoReconnector(const AutoReconnector&) = delete;
    AutoReconnector& operator=(const AutoReconnector&) = delete;

    // Subscribes to the session event hub. Idempotent.
    void attach();
    void detach();

    boost::asio::awaitable<bool> handleDisconnection(SessionId id, std::string reason);
    boost::asio::awaitable<bool> preemptiveReconnect(SessionId id);

    Result<void> configurePolicy(const ReconnectionPolicy& policy);
    ReconnectionPolicy policy() const;

    // Marks the in-flight attempt for `id` as cancelled; its results are discarded.
    void cancel(const SessionId& id);
    [[nodiscard]] bool isReconnecting(const SessionId& id) const;

    EventHub<TerminalNotice>& notices() noexcept { return notices_; }

private:
    // Shared with running coroutines so a frame destroyed after this object
    // can still release its slot safely.
    struct InFlightTable {
        std::mutex mu;
        std::unordered_map<SessionId, std::shared_ptr<std::atomic<bool>>> entries;
    };
    class InFlightGuard;

    std::shared_ptr<std::atomic<bool>> tryBegin(const SessionId& id);
    void onEvent(const SessionEvent& ev);
    void spawnReconnect(const SessionId& id, std::string reason);
    boost::asio::awaitable<void> reconnectTask(std::shared_ptr<std::atomic<bool>> alive,
                                               SessionId id, std::string reason);
    boost::asio::awaitable<void> preemptAfter(std::shared_ptr<std::atomic<bool>> alive,
                                              SessionId id, Duration delay,
                                              std::string expectedHandle);
    void giveUp(const SessionId& id, NoticeKind kind, ErrorCode code, std::string message,
                std::vector<std::string> recommendations);

    SessionManager& sessions_;
    std::shared_ptr<Clock> clock_;
    boost::asio::any_io_executor executor_;

    mutable std::mutex mu_;
    ReconnectionPolicy policy_;
    std::shared_ptr<InFlightTable> inFlight_;
    std::optional<EventHub<SessionEvent>::SubscriptionId> subscription_;
    std::shared_ptr<std::atomic<bool>> alive_;

    EventHub<TerminalNotice> notices_;
};

} // namespace nimbus::session
