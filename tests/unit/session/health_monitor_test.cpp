#include <gtest/gtest.h>

#include "common/fakes.h"
#include "common/virtual_clock.h"

#include <nimbus/resource/ResourceGovernor.h>
#include <nimbus/session/AutoReconnector.h>
#include <nimbus/session/HealthMonitor.h>
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

// Probe that takes `delay` of virtual time before answering.
class SlowProbe final : public ISessionProbe {
public:
    SlowProbe(std::shared_ptr<Clock> clock, SteadyClock::duration delay, Result<ProbeSample> answer)
        : clock_(std::move(clock)), delay_(delay), answer_(std::move(answer)) {}

    boost::asio::awaitable<Result<ProbeSample>> probe(const Session&) override {
        co_await clock_->sleepFor(delay_);
        co_return answer_;
    }

private:
    std::shared_ptr<Clock> clock_;
    SteadyClock::duration delay_;
    Result<ProbeSample> answer_;
};

Error probeTimeout() {
    return Error{ErrorCode::TransientNetworkError, "probe timed out"};
}

class HealthMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        manager = std::make_unique<SessionManager>(broker, store, clock);
        manager->events().subscribe([this](const SessionEvent& ev) { events.push_back(ev); });
    }

    void TearDown() override {
        monitor.reset();
        manager.reset();
        clock->releaseAll();
    }

    void startMonitor(MonitorConfig config, std::shared_ptr<ISessionProbe> p = nullptr) {
        monitor = std::make_unique<HealthMonitor>(*manager, p ? p : probe, clock,
                                                  io.get_executor(), config);
    }

    static MonitorConfig quietConfig() {
        MonitorConfig c;
        c.connectionIdleWindow = 1h;
        c.transferIdleWindow = 1h;
        return c;
    }

    SessionId newSession() {
        SessionConfig c;
        c.targetId = "i-1";
        auto r = manager->createSession(c);
        EXPECT_TRUE(r);
        return r.value().id;
    }

    std::size_t count(SessionEventKind kind) const {
        return static_cast<std::size_t>(std::count_if(
            events.begin(), events.end(), [kind](const SessionEvent& e) { return e.kind == kind; }));
    }

    boost::asio::io_context io;
    std::shared_ptr<test::VirtualClock> clock = std::make_shared<test::VirtualClock>(io);
    std::shared_ptr<test::FakeBroker> broker = std::make_shared<test::FakeBroker>();
    std::shared_ptr<test::FakeProbe> probe = std::make_shared<test::FakeProbe>();
    std::shared_ptr<InMemorySessionStore> store = std::make_shared<InMemorySessionStore>();
    std::unique_ptr<SessionManager> manager;
    std::unique_ptr<HealthMonitor> monitor;
    std::vector<SessionEvent> events;
};

} // namespace

TEST_F(HealthMonitorTest, ThreeFailedProbesEmitExactlyOneConnectionLost) {
    startMonitor(quietConfig());
    auto id = newSession();
    ASSERT_TRUE(monitor->startMonitoring(id));
    probe->setDefault(probeTimeout());

    clock->advance(5s);
    EXPECT_EQ(count(SessionEventKind::ConnectionLost), 0u);
    EXPECT_EQ(count(SessionEventKind::HealthDegraded), 0u);
    clock->advance(5s);
    EXPECT_EQ(count(SessionEventKind::HealthDegraded), 1u);
    clock->advance(5s);
    EXPECT_EQ(count(SessionEventKind::ConnectionLost), 1u);

    clock->advance(30s);
    EXPECT_EQ(count(SessionEventKind::ConnectionLost), 1u);
    auto snap = monitor->checkHealth(id);
    ASSERT_TRUE(snap);
    EXPECT_TRUE(snap.value().connectionLost);
    EXPECT_GE(snap.value().consecutiveFailures, 3u);
    EXPECT_FALSE(snap.value().healthy);
}

TEST_F(HealthMonitorTest, RecoveryStartsANewLossEpisode) {
    startMonitor(quietConfig());
    auto id = newSession();
    ASSERT_TRUE(monitor->startMonitoring(id));

    probe->setDefault(probeTimeout());
    clock->advance(15s);
    ASSERT_EQ(count(SessionEventKind::ConnectionLost), 1u);

    probe->setDefault(ProbeSample{1, 0, Duration{20}});
    clock->advance(5s);
    EXPECT_EQ(monitor->checkHealth(id).value().consecutiveFailures, 0u);

    probe->setDefault(probeTimeout());
    clock->advance(15s);
    EXPECT_EQ(count(SessionEventKind::ConnectionLost), 2u);
}

TEST_F(HealthMonitorTest, SingleTransientFailureIsSwallowed) {
    startMonitor(quietConfig());
    auto id = newSession();
    ASSERT_TRUE(monitor->startMonitoring(id));

    probe->setDefault(probeTimeout());
    clock->advance(5s);
    probe->setDefault(ProbeSample{0, 0, Duration{20}});
    clock->advance(5s);

    EXPECT_EQ(count(SessionEventKind::HealthDegraded), 0u);
    EXPECT_EQ(count(SessionEventKind::ConnectionLost), 0u);
    auto snap = monitor->checkHealth(id).value();
    EXPECT_EQ(snap.consecutiveFailures, 0u);
    EXPECT_TRUE(snap.healthy);
}

TEST_F(HealthMonitorTest, SlowProbeReportsDegradedHealth) {
    startMonitor(quietConfig());
    auto id = newSession();
    ASSERT_TRUE(monitor->startMonitoring(id));
    probe->setDefault(ProbeSample{0, 0, Duration{2500}});

    clock->advance(5s);
    EXPECT_EQ(count(SessionEventKind::HealthDegraded), 1u);
    auto snap = monitor->checkHealth(id).value();
    EXPECT_EQ(snap.lastLatency, Duration{2500});
    EXPECT_FALSE(snap.healthy);
}

TEST_F(HealthMonitorTest, ActivityIsReportedWhenCountersGrow) {
    startMonitor(quietConfig());
    auto id = newSession();
    ASSERT_TRUE(monitor->startMonitoring(id));
    probe->set(id, ProbeSample{2, 512, Duration{20}});

    clock->advance(5s);
    EXPECT_EQ(count(SessionEventKind::ActivityDetected), 1u);
    EXPECT_EQ(manager->getSession(id)->lastActivity, clock->now());

    clock->advance(10s);
    EXPECT_EQ(count(SessionEventKind::ActivityDetected), 1u);

    probe->set(id, ProbeSample{2, 4096, Duration{20}});
    clock->advance(5s);
    EXPECT_EQ(count(SessionEventKind::ActivityDetected), 2u);
}

TEST_F(HealthMonitorTest, SessionGoesInactiveWhenAllWindowsElapse) {
    MonitorConfig c;
    c.connectionIdleWindow = 10s;
    c.transferIdleWindow = 10s;
    c.probeResponseWindow = 5s;
    c.failureThreshold = 10;
    startMonitor(c);
    auto id = newSession();
    ASSERT_TRUE(monitor->startMonitoring(id));
    probe->setDefault(probeTimeout());

    clock->advance(5s);
    EXPECT_EQ(manager->getSession(id)->status, SessionStatus::Active);
    clock->advance(5s);
    EXPECT_EQ(manager->getSession(id)->status, SessionStatus::Inactive);
    EXPECT_EQ(count(SessionEventKind::SessionIdle), 1u);
}

TEST_F(HealthMonitorTest, RespondingSessionIsNotMarkedInactive) {
    MonitorConfig c;
    c.connectionIdleWindow = 10s;
    c.transferIdleWindow = 10s;
    c.probeResponseWindow = 5s;
    startMonitor(c);
    auto id = newSession();
    ASSERT_TRUE(monitor->startMonitoring(id));
    probe->setDefault(ProbeSample{0, 0, Duration{20}});

    clock->advance(60s);
    EXPECT_EQ(manager->getSession(id)->status, SessionStatus::Active);
    EXPECT_EQ(count(SessionEventKind::SessionIdle), 0u);
}

TEST_F(HealthMonitorTest, TimeoutIsPredictedOncePerHandle) {
    MonitorConfig c = quietConfig();
    c.sessionLifetime = 60s;
    c.timeoutHorizon = 20s;
    startMonitor(c);
    auto id = newSession();
    ASSERT_TRUE(monitor->startMonitoring(id));

    clock->advance(35s);
    EXPECT_EQ(count(SessionEventKind::TimeoutPredicted), 0u);
    EXPECT_FALSE(monitor->predictTimeout(id).has_value());

    clock->advance(5s);
    ASSERT_EQ(count(SessionEventKind::TimeoutPredicted), 1u);
    auto it = std::find_if(events.begin(), events.end(), [](const SessionEvent& e) {
        return e.kind == SessionEventKind::TimeoutPredicted;
    });
    EXPECT_EQ(it->remaining, Duration{20000});

    clock->advance(5s);
    EXPECT_EQ(count(SessionEventKind::TimeoutPredicted), 1u);
    EXPECT_EQ(monitor->predictTimeout(id), Duration{15000});

    // A fresh handle re-arms the prediction.
    auto replacement = manager->startReplacement(id);
    ASSERT_TRUE(replacement);
    ASSERT_TRUE(manager->adoptHandle(id, replacement.value()));
    EXPECT_FALSE(monitor->predictTimeout(id).has_value());
    clock->advance(40s);
    EXPECT_EQ(count(SessionEventKind::TimeoutPredicted), 2u);
}

TEST_F(HealthMonitorTest, ExpiredLifetimePredictsZero) {
    MonitorConfig c = quietConfig();
    c.sessionLifetime = 10s;
    c.timeoutHorizon = 5s;
    startMonitor(c);
    auto id = newSession();
    clock->advance(11s);
    EXPECT_EQ(monitor->predictTimeout(id), Duration{0});
    EXPECT_FALSE(monitor->predictTimeout("missing").has_value());
}

TEST_F(HealthMonitorTest, TerminationStopsMonitoring) {
    startMonitor(quietConfig());
    auto id = newSession();
    ASSERT_TRUE(monitor->startMonitoring(id));
    clock->advance(5s);
    const auto calls = probe->calls();
    EXPECT_EQ(calls, 1);

    ASSERT_TRUE(manager->terminateSession(id, "done"));
    EXPECT_FALSE(monitor->isMonitoring(id));
    clock->advance(30s);
    EXPECT_EQ(probe->calls(), calls);
}

TEST_F(HealthMonitorTest, StartMonitoringValidatesTheSession) {
    startMonitor(quietConfig());
    auto missing = monitor->startMonitoring("nope");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);

    auto id = newSession();
    ASSERT_TRUE(monitor->startMonitoring(id));
    auto twice = monitor->startMonitoring(id);
    ASSERT_FALSE(twice);
    EXPECT_EQ(twice.error().code, ErrorCode::AlreadyExists);
    EXPECT_EQ(monitor->monitoredSessions(), std::vector<SessionId>{id});

    monitor->stopMonitoring(id);
    EXPECT_FALSE(monitor->isMonitoring(id));
    auto snap = monitor->checkHealth(id);
    ASSERT_TRUE(snap);
    EXPECT_FALSE(snap.value().monitored);
}

TEST_F(HealthMonitorTest, ResultOfProbeInFlightAtStopIsDiscarded) {
    auto slow = std::make_shared<SlowProbe>(clock, 2s, Result<ProbeSample>(probeTimeout()));
    MonitorConfig c = quietConfig();
    c.failureThreshold = 1;
    startMonitor(c, slow);
    auto id = newSession();
    ASSERT_TRUE(monitor->startMonitoring(id));

    clock->advance(6s); // probe started at 5s, answers at 7s
    monitor->stopMonitoring(id);
    ASSERT_TRUE(monitor->startMonitoring(id));
    clock->advance(1s);

    EXPECT_EQ(count(SessionEventKind::ConnectionLost), 0u);
    EXPECT_EQ(monitor->checkHealth(id).value().consecutiveFailures, 0u);
}

TEST_F(HealthMonitorTest, ReplacementHandleThatNeverAnswersIsLostAgain) {
    startMonitor(quietConfig());
    AutoReconnector reconnector(*manager, clock, io.get_executor());
    reconnector.attach();
    probe->setDefault(probeTimeout());

    auto id = newSession();
    ASSERT_TRUE(monitor->startMonitoring(id));

    // Lost at 15s, reconnected onto h-2 at 16s.
    for (int i = 0; i < 16; ++i) {
        clock->advance(1s);
    }
    EXPECT_EQ(count(SessionEventKind::ConnectionLost), 1u);
    EXPECT_EQ(manager->getSession(id)->handle.id, "h-2");

    // h-2 fails at 20, 25 and 30s; reconnected onto h-3 at 31s.
    for (int i = 0; i < 15; ++i) {
        clock->advance(1s);
    }
    EXPECT_EQ(count(SessionEventKind::ConnectionLost), 2u);
    EXPECT_EQ(broker->startCalls(), 3);
    auto s = manager->getSession(id);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->status, SessionStatus::Active);
    EXPECT_EQ(s->handle.id, "h-3");
    EXPECT_TRUE(broker->wasReleased("h-2"));

    monitor.reset();
}

TEST_F(HealthMonitorTest, DestroyingTheMonitorWithAProbeInFlightIsSafe) {
    auto slow = std::make_shared<SlowProbe>(clock, 2s, Result<ProbeSample>(probeTimeout()));
    MonitorConfig c = quietConfig();
    c.failureThreshold = 1;
    startMonitor(c, slow);
    auto id = newSession();
    ASSERT_TRUE(monitor->startMonitoring(id));

    clock->advance(6s); // probe started at 5s, answers at 7s
    monitor.reset();
    clock->advance(10s);

    EXPECT_EQ(count(SessionEventKind::ConnectionLost), 0u);
    EXPECT_EQ(manager->getSession(id)->status, SessionStatus::Active);
}

TEST_F(HealthMonitorTest, LowPowerModeStretchesTheHeartbeat) {
    auto sampler = std::make_shared<test::FakeSampler>();
    resource::GovernorConfig gc;
    gc.memoryLimitMb = 10.0;
    resource::ResourceGovernor governor(sampler, clock, gc);
    startMonitor(quietConfig());
    monitor->setGovernor(&governor);
    EXPECT_EQ(monitor->currentInterval(), Duration{5000});

    for (int i = 0; i < 3; ++i) {
        governor.observe({50.0, 0.1});
    }
    ASSERT_TRUE(governor.isLowPower());
    EXPECT_EQ(monitor->currentInterval(), Duration{30000});

    auto id = newSession();
    ASSERT_TRUE(monitor->startMonitoring(id));
    clock->advance(29s);
    EXPECT_EQ(probe->calls(), 0);
    clock->advance(1s);
    EXPECT_EQ(probe->calls(), 1);

    monitor->setGovernor(nullptr);
}
