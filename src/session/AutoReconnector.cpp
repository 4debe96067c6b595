#include <nimbus/session/AutoReconnector.h>

#include <stdexcept>

#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace nimbus::session {

namespace {

std::vector<std::string> exhaustedRecommendations() {
    return {"Check network connectivity between this host and the target",
            "Verify the target instance is running and its agent reports Online",
            "Reconnect manually once the target is reachable"};
}

std::vector<std::string> refusedRecommendations(ErrorCode code) {
    if (code == ErrorCode::AuthorizationError) {
        return {"Refresh or re-authenticate the credentials of the configured profile",
                "Confirm the caller is allowed ssm:StartSession on the target",
                "Reconnect manually after fixing the credentials"};
    }
    return {"Inspect the error above and reconnect manually"};
}

} // namespace

class AutoReconnector::InFlightGuard {
public:
    InFlightGuard(std::shared_ptr<InFlightTable> table, SessionId id,
                  std::shared_ptr<std::atomic<bool>> flag)
        : table_(std::move(table)), id_(std::move(id)), flag_(std::move(flag)) {}
    ~InFlightGuard() {
        std::lock_guard<std::mutex> lk(table_->mu);
        auto it = table_->entries.find(id_);
        if (it != table_->entries.end() && it->second == flag_) {
            table_->entries.erase(it);
        }
    }
    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    std::shared_ptr<InFlightTable> table_;
    SessionId id_;
    std::shared_ptr<std::atomic<bool>> flag_;
};

AutoReconnector::AutoReconnector(SessionManager& sessions, std::shared_ptr<Clock> clock,
                                 boost::asio::any_io_executor executor,
                                 ReconnectionPolicy policy)
    : sessions_(sessions), clock_(std::move(clock)), executor_(std::move(executor)),
      policy_(policy), inFlight_(std::make_shared<InFlightTable>()),
      alive_(std::make_shared<std::atomic<bool>>(true)) {
    if (!clock_) {
        throw std::invalid_argument("AutoReconnector requires a clock");
    }
    if (auto valid = validatePolicy(policy_); !valid) {
        throw std::invalid_argument(valid.error().message);
    }
    std::weak_ptr<std::atomic<bool>> alive = alive_;
    sessions_.addTerminationHook([this, alive](const SessionId& id) {
        if (auto a = alive.lock(); a && a->load()) {
            cancel(id);
        }
    });
}

AutoReconnector::~AutoReconnector() {
    alive_->store(false);
    detach();
    std::lock_guard<std::mutex> lk(inFlight_->mu);
    for (auto& [id, flag] : inFlight_->entries) {
        flag->store(true);
    }
}

void AutoReconnector::attach() {
    std::lock_guard<std::mutex> lk(mu_);
    if (subscription_) {
        return;
    }
    subscription_ = sessions_.events().subscribe([this](const SessionEvent& ev) { onEvent(ev); });
}

void AutoReconnector::detach() {
    std::lock_guard<std::mutex> lk(mu_);
    if (subscription_) {
        sessions_.events().unsubscribe(*subscription_);
        subscription_.reset();
    }
}

Result<void> AutoReconnector::configurePolicy(const ReconnectionPolicy& policy) {
    if (auto valid = validatePolicy(policy); !valid) {
        return valid;
    }
    std::lock_guard<std::mutex> lk(mu_);
    policy_ = policy;
    spdlog::info("[AutoReconnector] policy: enabled={} attempts={} base={}ms max={}ms "
                 "aggressive={}",
                 policy.enabled, policy.maxAttempts, policy.baseDelay.count(),
                 policy.maxDelay.count(), policy.aggressiveMode);
    return {};
}

ReconnectionPolicy AutoReconnector::policy() const {
    std::lock_guard<std::mutex> lk(mu_);
    return policy_;
}

void AutoReconnector::cancel(const SessionId& id) {
    std::lock_guard<std::mutex> lk(inFlight_->mu);
    if (auto it = inFlight_->entries.find(id); it != inFlight_->entries.end()) {
        it->second->store(true);
        spdlog::debug("[AutoReconnector] cancelled in-flight reconnection for {}", id);
    }
}

bool AutoReconnector::isReconnecting(const SessionId& id) const {
    std::lock_guard<std::mutex> lk(inFlight_->mu);
    return inFlight_->entries.count(id) != 0;
}

std::shared_ptr<std::atomic<bool>> AutoReconnector::tryBegin(const SessionId& id) {
    std::lock_guard<std::mutex> lk(inFlight_->mu);
    if (inFlight_->entries.count(id)) {
        return nullptr;
    }
    auto flag = std::make_shared<std::atomic<bool>>(false);
    inFlight_->entries.emplace(id, flag);
    return flag;
}

boost::asio::awaitable<bool> AutoReconnector::handleDisconnection(SessionId id,
                                                                  std::string reason) {
    auto cancelled = tryBegin(id);
    if (!cancelled) {
        spdlog::debug("[AutoReconnector] reconnection for {} already in flight", id);
        co_return false;
    }
    InFlightGuard guard(inFlight_, id, cancelled);

    const auto policy = this->policy();
    auto session = sessions_.getSession(id);
    if (!session || (session->status != SessionStatus::Active &&
                     session->status != SessionStatus::Inactive)) {
        co_return false;
    }
    if (!policy.enabled) {
        // The session is left as it is; the caller decides what to do with it.
        auto message =
            fmt::format("connection to {} lost ({}) and automatic reconnection is disabled",
                        session->targetId(), reason);
        spdlog::warn("[AutoReconnector] {}", message);
        notices_.publish(TerminalNotice{
            NoticeKind::ReconnectionRefused, id, ErrorCode::InvalidState, std::move(message),
            {"Reconnect manually", "Enable reconnection.enabled to recover automatically"}});
        co_return false;
    }
    if (auto r = sessions_.transition(id, SessionStatus::Reconnecting, reason); !r) {
        spdlog::warn("[AutoReconnector] cannot start reconnection for {}: {}", id,
                     r.error().message);
        co_return false;
    }
    spdlog::info("[AutoReconnector] reconnecting {} to {} ({}), up to {} attempts", id,
                 session->targetId(), reason, policy.maxAttempts);

    for (std::uint32_t attempt = 1; attempt <= policy.maxAttempts; ++attempt) {
        co_await clock_->sleepFor(reconnectDelay(policy, attempt));
        if (cancelled->load()) {
            co_return false;
        }

        auto handle = sessions_.startReplacement(id);
        if (cancelled->load()) {
            if (handle) {
                sessions_.releaseHandle(handle.value());
            }
            co_return false;
        }
        if (handle) {
            if (auto adopted = sessions_.adoptHandle(id, handle.value()); !adopted) {
                co_return false;
            }
            spdlog::info("[AutoReconnector] {} reconnected on attempt {}/{}", id, attempt,
                         policy.maxAttempts);
            co_return true;
        }

        const auto& err = handle.error();
        if (err.code == ErrorCode::NotFound) {
            co_return false;
        }
        if (!isRetryable(err.code)) {
            giveUp(id, NoticeKind::ReconnectionRefused, err.code,
                   fmt::format("reconnection of {} refused: {}", id, err.message),
                   refusedRecommendations(err.code));
            co_return false;
        }
        spdlog::warn("[AutoReconnector] attempt {}/{} for {} failed: {}", attempt,
                     policy.maxAttempts, id, err.message);
    }

    giveUp(id, NoticeKind::ReconnectionExhausted, ErrorCode::TransientNetworkError,
           fmt::format("reconnection of {} to {} failed after {} attempts; manual reconnection "
                       "required",
                       id, session->targetId(), policy.maxAttempts),
           exhaustedRecommendations());
    co_return false;
}

boost::asio::awaitable<bool> AutoReconnector::preemptiveReconnect(SessionId id) {
    auto cancelled = tryBegin(id);
    if (!cancelled) {
        spdlog::debug("[AutoReconnector] reconnection for {} already in flight", id);
        co_return false;
    }
    InFlightGuard guard(inFlight_, id, cancelled);

    auto session = sessions_.getSession(id);
    if (!session || session->status != SessionStatus::Active) {
        co_return false;
    }
    spdlog::info("[AutoReconnector] preemptive reconnect of {} before broker expiry", id);

    auto handle = sessions_.startReplacement(id);
    if (cancelled->load()) {
        if (handle) {
            sessions_.releaseHandle(handle.value());
        }
        co_return false;
    }
    if (!handle) {
        spdlog::warn("[AutoReconnector] preemptive replacement for {} failed: {}", id,
                     handle.error().message);
        co_return false;
    }
    if (auto adopted = sessions_.adoptHandle(id, handle.value()); !adopted) {
        co_return false;
    }
    co_return true;
}

void AutoReconnector::onEvent(const SessionEvent& ev) {
    switch (ev.kind) {
        case SessionEventKind::ConnectionLost:
            spawnReconnect(ev.sessionId, ev.detail.empty() ? "connection lost" : ev.detail);
            break;
        case SessionEventKind::ActivityDetected: {
            auto s = sessions_.getSession(ev.sessionId);
            if (s && s->status == SessionStatus::Inactive) {
                spawnReconnect(ev.sessionId, "activity on inactive session");
            }
            break;
        }
        case SessionEventKind::TimeoutPredicted: {
            if (!ev.remaining) {
                break;
            }
            auto s = sessions_.getSession(ev.sessionId);
            if (!s) {
                break;
            }
            const auto threshold = policy().preemptiveThreshold;
            const Duration delay =
                *ev.remaining < threshold ? Duration{0} : *ev.remaining - threshold;
            boost::asio::co_spawn(executor_,
                                  preemptAfter(alive_, ev.sessionId, delay, s->handle.id),
                                  boost::asio::detached);
            break;
        }
        default:
            break;
    }
}

void AutoReconnector::spawnReconnect(const SessionId& id, std::string reason) {
    boost::asio::co_spawn(executor_, reconnectTask(alive_, id, std::move(reason)),
                          boost::asio::detached);
}

boost::asio::awaitable<void>
AutoReconnector::reconnectTask(std::shared_ptr<std::atomic<bool>> alive, SessionId id,
                               std::string reason) {
    if (!alive->load()) {
        co_return;
    }
    co_await handleDisconnection(std::move(id), std::move(reason));
}

boost::asio::awaitable<void>
AutoReconnector::preemptAfter(std::shared_ptr<std::atomic<bool>> alive, SessionId id,
                              Duration delay, std::string expectedHandle) {
    if (!alive->load()) {
        co_return;
    }
    if (delay.count() > 0) {
        auto clock = clock_;
        co_await clock->sleepFor(delay);
        if (!alive->load()) {
            co_return;
        }
    }
    auto s = sessions_.getSession(id);
    // Skip when the handle was already replaced or the session left Active.
    if (!s || s->status != SessionStatus::Active || s->handle.id != expectedHandle) {
        co_return;
    }
    co_await preemptiveReconnect(id);
}

void AutoReconnector::giveUp(const SessionId& id, NoticeKind kind, ErrorCode code,
                             std::string message, std::vector<std::string> recommendations) {
    if (auto r = sessions_.terminateSession(id, message);
        !r && r.error().code != ErrorCode::NotFound) {
        spdlog::warn("[AutoReconnector] terminate after give-up failed for {}: {}", id,
                     r.error().message);
    }
    spdlog::warn("[AutoReconnector] {}: {}", noticeKindName(kind), message);
    notices_.publish(
        TerminalNotice{kind, id, code, std::move(message), std::move(recommendations)});
}

} // namespace nimbus::session
