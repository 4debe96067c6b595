#include <gtest/gtest.h>

#include "common/async_helpers.h"
#include "common/fakes.h"
#include "common/virtual_clock.h"

#include <nimbus/session/AutoReconnector.h>
#include <nimbus/session/SessionManager.h>
#include <nimbus/session/session_store.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <vector>

#include <utility>
#include <boost/asio/io_context.hpp>

using namespace nimbus;
using namespace nimbus::session;
using namespace std::chrono_literals;

namespace {

Error transient() {
    return Error{ErrorCode::TransientNetworkError, "broker unreachable"};
}

class AutoReconnectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        manager = std::make_unique<SessionManager>(broker, store, clock);
        manager->events().subscribe([this](const SessionEvent& ev) { events.push_back(ev); });
        build(ReconnectionPolicy{});
    }

    void TearDown() override {
        reconnector.reset();
        manager.reset();
        clock->releaseAll();
    }

    void build(ReconnectionPolicy policy) {
        reconnector.reset();
        notices.clear();
        reconnector =
            std::make_unique<AutoReconnector>(*manager, clock, io.get_executor(), policy);
        reconnector->notices().subscribe(
            [this](const TerminalNotice& n) { notices.push_back(n); });
    }

    SessionId newSession() {
        SessionConfig c;
        c.targetId = "i-1";
        auto r = manager->createSession(c);
        EXPECT_TRUE(r);
        return r.value().id;
    }

    void publish(const SessionId& id, SessionEventKind kind,
                 std::optional<Duration> remaining = std::nullopt) {
        manager->events().publish(
            SessionEvent{id, kind, "test", clock->now(), remaining, std::nullopt, std::nullopt});
        clock->drain();
    }

    SessionStatus status(const SessionId& id) const {
        auto s = manager->getSession(id);
        return s ? s->status : SessionStatus::Terminated;
    }

    boost::asio::io_context io;
    std::shared_ptr<test::VirtualClock> clock = std::make_shared<test::VirtualClock>(io);
    std::shared_ptr<test::FakeBroker> broker = std::make_shared<test::FakeBroker>();
    std::shared_ptr<InMemorySessionStore> store = std::make_shared<InMemorySessionStore>();
    std::unique_ptr<SessionManager> manager;
    std::unique_ptr<AutoReconnector> reconnector;
    std::vector<SessionEvent> events;
    std::vector<TerminalNotice> notices;
};

} // namespace

TEST_F(AutoReconnectorTest, ConnectionLostReconnectsWithExponentialBackoff) {
    auto id = newSession();
    reconnector->attach();
    broker->failNext(transient(), 2);

    publish(id, SessionEventKind::ConnectionLost);
    EXPECT_EQ(status(id), SessionStatus::Reconnecting);
    EXPECT_TRUE(reconnector->isReconnecting(id));

    clock->advance(1s); // attempt 1 fails
    clock->advance(2s); // attempt 2 fails
    clock->advance(3999ms);
    EXPECT_EQ(status(id), SessionStatus::Reconnecting);
    EXPECT_EQ(broker->startCalls(), 3);

    clock->advance(1ms); // attempt 3 succeeds
    EXPECT_EQ(status(id), SessionStatus::Active);
    EXPECT_EQ(manager->getSession(id)->handle.id, "h-2");
    EXPECT_TRUE(broker->wasReleased("h-1"));
    EXPECT_FALSE(reconnector->isReconnecting(id));
    EXPECT_TRUE(notices.empty());
}

TEST_F(AutoReconnectorTest, ExhaustedPolicyTerminatesAndNotifies) {
    ReconnectionPolicy policy;
    policy.maxAttempts = 3;
    build(policy);
    auto id = newSession();
    broker->failNext(transient(), 10);

    auto result = test::spawnCapture(io, reconnector->handleDisconnection(id, "probe failures"));
    ASSERT_TRUE(clock->runUntil([&] { return result->has_value(); }));
    EXPECT_FALSE(**result);

    EXPECT_EQ(broker->startCalls(), 1 + 3);
    EXPECT_FALSE(manager->getSession(id).has_value());
    ASSERT_EQ(notices.size(), 1u);
    EXPECT_EQ(notices[0].kind, NoticeKind::ReconnectionExhausted);
    EXPECT_EQ(notices[0].subject, id);
    EXPECT_NE(notices[0].message.find("manual"), std::string::npos);
    EXPECT_FALSE(notices[0].recommendations.empty());
}

TEST_F(AutoReconnectorTest, TotalBackoffMatchesThePolicy) {
    ReconnectionPolicy policy;
    policy.maxAttempts = 4;
    build(policy);
    auto id = newSession();
    broker->failNext(transient(), 10);
    const auto started = clock->now();

    auto result = test::spawnCapture(io, reconnector->handleDisconnection(id, "lost"));
    ASSERT_TRUE(clock->runUntil([&] { return result->has_value(); }));
    EXPECT_EQ(clock->now() - started, 1s + 2s + 4s + 8s);
}

TEST_F(AutoReconnectorTest, NonRetryableErrorIsRefusedWithoutFurtherAttempts) {
    auto id = newSession();
    broker->failNext(Error{ErrorCode::AuthorizationError, "credentials expired"});

    auto result = test::spawnCapture(io, reconnector->handleDisconnection(id, "lost"));
    ASSERT_TRUE(clock->runUntil([&] { return result->has_value(); }));
    EXPECT_FALSE(**result);

    EXPECT_EQ(broker->startCalls(), 2);
    EXPECT_FALSE(manager->getSession(id).has_value());
    ASSERT_EQ(notices.size(), 1u);
    EXPECT_EQ(notices[0].kind, NoticeKind::ReconnectionRefused);
    EXPECT_EQ(notices[0].code, ErrorCode::AuthorizationError);
}

TEST_F(AutoReconnectorTest, DisabledPolicyRefusesImmediately) {
    ReconnectionPolicy policy;
    policy.enabled = false;
    build(policy);
    auto id = newSession();

    auto result = test::spawnCapture(io, reconnector->handleDisconnection(id, "lost"));
    clock->drain();
    ASSERT_TRUE(result->has_value());
    EXPECT_FALSE(**result);
    EXPECT_EQ(broker->startCalls(), 1);
    ASSERT_EQ(notices.size(), 1u);
    EXPECT_EQ(notices[0].kind, NoticeKind::ReconnectionRefused);
    EXPECT_EQ(notices[0].subject, id);

    // Refusing to reconnect does not tear the session down.
    EXPECT_EQ(status(id), SessionStatus::Active);
    EXPECT_TRUE(broker->released().empty());
    EXPECT_FALSE(reconnector->isReconnecting(id));
}

TEST_F(AutoReconnectorTest, OverlappingRequestsRunOnce) {
    auto id = newSession();
    auto first = test::spawnCapture(io, reconnector->handleDisconnection(id, "a"));
    auto second = test::spawnCapture(io, reconnector->handleDisconnection(id, "b"));
    clock->drain();

    ASSERT_TRUE(second->has_value());
    EXPECT_FALSE(**second);
    EXPECT_FALSE(first->has_value());
    auto preemptive = test::spawnCapture(io, reconnector->preemptiveReconnect(id));
    clock->drain();
    ASSERT_TRUE(preemptive->has_value());
    EXPECT_FALSE(**preemptive);

    clock->advance(1s);
    ASSERT_TRUE(first->has_value());
    EXPECT_TRUE(**first);
    EXPECT_EQ(broker->startCalls(), 2);
}

TEST_F(AutoReconnectorTest, TerminationDuringBackoffCancelsQuietly) {
    auto id = newSession();
    auto result = test::spawnCapture(io, reconnector->handleDisconnection(id, "lost"));
    clock->drain();
    ASSERT_EQ(status(id), SessionStatus::Reconnecting);

    ASSERT_TRUE(manager->terminateSession(id, "user stop"));
    clock->advance(1s);
    ASSERT_TRUE(result->has_value());
    EXPECT_FALSE(**result);
    EXPECT_EQ(broker->startCalls(), 1);
    EXPECT_TRUE(notices.empty());
}

TEST_F(AutoReconnectorTest, ActivityOnInactiveSessionReconnects) {
    auto id = newSession();
    ASSERT_TRUE(manager->transition(id, SessionStatus::Inactive, "idle"));
    reconnector->attach();

    publish(id, SessionEventKind::ActivityDetected);
    EXPECT_EQ(status(id), SessionStatus::Reconnecting);
    clock->advance(1s);
    EXPECT_EQ(status(id), SessionStatus::Active);
    EXPECT_EQ(manager->getSession(id)->handle.id, "h-2");
}

TEST_F(AutoReconnectorTest, ActivityOnActiveSessionIsIgnored) {
    auto id = newSession();
    reconnector->attach();
    publish(id, SessionEventKind::ActivityDetected);
    clock->advance(5s);
    EXPECT_EQ(broker->startCalls(), 1);
    EXPECT_FALSE(reconnector->isReconnecting(id));
}

TEST_F(AutoReconnectorTest, AggressiveModeRetriesAtFixedInterval) {
    ReconnectionPolicy policy;
    policy.aggressiveMode = true;
    policy.aggressiveAttempts = 10;
    policy.aggressiveInterval = 500ms;
    build(policy);
    auto id = newSession();
    reconnector->attach();
    broker->failNext(transient(), 2);

    publish(id, SessionEventKind::ConnectionLost);
    clock->advance(1499ms);
    EXPECT_EQ(status(id), SessionStatus::Reconnecting);
    clock->advance(1ms);
    EXPECT_EQ(status(id), SessionStatus::Active);
}

TEST_F(AutoReconnectorTest, PredictedTimeoutSwapsHandleBeforeExpiry) {
    ReconnectionPolicy policy;
    policy.preemptiveThreshold = 60s;
    build(policy);
    auto id = newSession();
    reconnector->attach();
    events.clear();

    publish(id, SessionEventKind::TimeoutPredicted, Duration{90000});
    clock->advance(29s);
    EXPECT_EQ(manager->getSession(id)->handle.id, "h-1");

    clock->advance(1s);
    EXPECT_EQ(manager->getSession(id)->handle.id, "h-2");
    EXPECT_TRUE(broker->wasReleased("h-1"));
    EXPECT_EQ(status(id), SessionStatus::Active);
    // The user-visible session never left Active.
    EXPECT_TRUE(std::none_of(events.begin(), events.end(), [](const SessionEvent& e) {
        return e.to == SessionStatus::Reconnecting;
    }));
}

TEST_F(AutoReconnectorTest, PredictionInsideThresholdSwapsAtOnce) {
    auto id = newSession();
    reconnector->attach();
    publish(id, SessionEventKind::TimeoutPredicted, Duration{10000});
    EXPECT_EQ(manager->getSession(id)->handle.id, "h-2");
}

TEST_F(AutoReconnectorTest, StalePredictionIsSkippedAfterHandleChanged) {
    auto id = newSession();
    reconnector->attach();
    publish(id, SessionEventKind::TimeoutPredicted, Duration{90000});

    clock->advance(10s);
    auto manual = manager->startReplacement(id);
    ASSERT_TRUE(manual);
    ASSERT_TRUE(manager->adoptHandle(id, manual.value()));

    clock->advance(30s);
    EXPECT_EQ(broker->startCalls(), 2);
    EXPECT_EQ(manager->getSession(id)->handle.id, "h-2");
}

TEST_F(AutoReconnectorTest, FailedPreemptiveSwapKeepsTheSession) {
    auto id = newSession();
    broker->failNext(transient());
    auto result = test::spawnCapture(io, reconnector->preemptiveReconnect(id));
    clock->drain();
    ASSERT_TRUE(result->has_value());
    EXPECT_FALSE(**result);
    EXPECT_EQ(status(id), SessionStatus::Active);
    EXPECT_EQ(manager->getSession(id)->handle.id, "h-1");
}

TEST_F(AutoReconnectorTest, ConfigurePolicyRejectsInvalidPolicies) {
    ReconnectionPolicy bad;
    bad.baseDelay = 30s;
    bad.maxDelay = 10s;
    auto r = reconnector->configurePolicy(bad);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(reconnector->policy().maxDelay, Duration{16000});

    ReconnectionPolicy good;
    good.maxAttempts = 8;
    ASSERT_TRUE(reconnector->configurePolicy(good));
    EXPECT_EQ(reconnector->policy().maxAttempts, 8u);
}
