#include <gtest/gtest.h>
#include <nimbus/session/SessionRegistry.h>
#include <nimbus/session/session.h>

#include <chrono>
#include <stdexcept>

using namespace nimbus;
using namespace nimbus::session;

namespace {

constexpr SessionStatus kAll[] = {SessionStatus::Connecting, SessionStatus::Active,
                                  SessionStatus::Inactive, SessionStatus::Reconnecting,
                                  SessionStatus::Terminated};

Session makeSession(const std::string& id, const std::string& target, SessionStatus status,
                    SessionPriority priority, TimePoint lastActivity) {
    Session s;
    s.id = id;
    s.config.targetId = target;
    s.config.priority = priority;
    s.status = status;
    s.lastActivity = lastActivity;
    return s;
}

} // namespace

TEST(SessionStatusMachine, LegalTransitions) {
    EXPECT_TRUE(isLegalTransition(SessionStatus::Connecting, SessionStatus::Active));
    EXPECT_TRUE(isLegalTransition(SessionStatus::Connecting, SessionStatus::Terminated));
    EXPECT_TRUE(isLegalTransition(SessionStatus::Active, SessionStatus::Inactive));
    EXPECT_TRUE(isLegalTransition(SessionStatus::Active, SessionStatus::Reconnecting));
    EXPECT_TRUE(isLegalTransition(SessionStatus::Active, SessionStatus::Terminated));
    EXPECT_TRUE(isLegalTransition(SessionStatus::Inactive, SessionStatus::Reconnecting));
    EXPECT_TRUE(isLegalTransition(SessionStatus::Inactive, SessionStatus::Terminated));
    EXPECT_TRUE(isLegalTransition(SessionStatus::Reconnecting, SessionStatus::Active));
    EXPECT_TRUE(isLegalTransition(SessionStatus::Reconnecting, SessionStatus::Terminated));
}

TEST(SessionStatusMachine, IllegalTransitions) {
    EXPECT_FALSE(isLegalTransition(SessionStatus::Connecting, SessionStatus::Inactive));
    EXPECT_FALSE(isLegalTransition(SessionStatus::Connecting, SessionStatus::Reconnecting));
    EXPECT_FALSE(isLegalTransition(SessionStatus::Inactive, SessionStatus::Active));
    EXPECT_FALSE(isLegalTransition(SessionStatus::Reconnecting, SessionStatus::Inactive));
    for (auto s : kAll) {
        EXPECT_FALSE(isLegalTransition(s, s)) << statusName(s);
    }
}

TEST(SessionStatusMachine, TerminatedIsAbsorbing) {
    for (auto to : kAll) {
        EXPECT_FALSE(isLegalTransition(SessionStatus::Terminated, to)) << statusName(to);
    }
}

TEST(SessionStatusMachine, HealthRankOrdersActiveFirst) {
    EXPECT_GT(healthRank(SessionStatus::Active), healthRank(SessionStatus::Connecting));
    EXPECT_GT(healthRank(SessionStatus::Connecting), healthRank(SessionStatus::Reconnecting));
    EXPECT_GT(healthRank(SessionStatus::Reconnecting), healthRank(SessionStatus::Inactive));
    EXPECT_GT(healthRank(SessionStatus::Inactive), healthRank(SessionStatus::Terminated));
}

TEST(SessionRegistryTest, IndexFollowsInsertAndErase) {
    SessionRegistry reg;
    const TimePoint t0{};
    reg.insert(makeSession("a", "i-1", SessionStatus::Active, SessionPriority::Normal, t0));
    reg.insert(makeSession("b", "i-1", SessionStatus::Inactive, SessionPriority::Normal, t0));
    reg.insert(makeSession("c", "i-2", SessionStatus::Active, SessionPriority::Normal, t0));

    EXPECT_EQ(reg.forTarget("i-1").size(), 2u);
    EXPECT_EQ(reg.occupied(), 3u);
    EXPECT_EQ(reg.occupied("i-2"), 1u);

    EXPECT_TRUE(reg.erase("a"));
    EXPECT_FALSE(reg.erase("a"));
    EXPECT_EQ(reg.forTarget("i-1").size(), 1u);
    EXPECT_TRUE(reg.erase("c"));
    EXPECT_TRUE(reg.forTarget("i-2").empty());
    EXPECT_EQ(reg.size(), 1u);
}

TEST(SessionRegistryTest, DuplicateIdIsALogicError) {
    SessionRegistry reg;
    reg.insert(makeSession("a", "i-1", SessionStatus::Active, SessionPriority::Normal, {}));
    EXPECT_THROW(
        reg.insert(makeSession("a", "i-1", SessionStatus::Active, SessionPriority::Normal, {})),
        std::logic_error);
    EXPECT_THROW(reg.at("missing"), std::logic_error);
}

TEST(SessionRegistryTest, EvictionPrefersLowPriorityThenLongestIdle) {
    using namespace std::chrono_literals;
    SessionRegistry reg;
    const TimePoint t0{};
    reg.insert(makeSession("high-old", "i-1", SessionStatus::Inactive, SessionPriority::High, t0));
    reg.insert(
        makeSession("low-new", "i-1", SessionStatus::Inactive, SessionPriority::Low, t0 + 10s));
    reg.insert(
        makeSession("low-old", "i-1", SessionStatus::Inactive, SessionPriority::Low, t0 + 5s));
    reg.insert(makeSession("active", "i-1", SessionStatus::Active, SessionPriority::Low, t0));

    EXPECT_EQ(reg.evictionCandidate(std::string("i-1")), "low-old");
    reg.erase("low-old");
    EXPECT_EQ(reg.evictionCandidate(std::string("i-1")), "low-new");
    reg.erase("low-new");
    EXPECT_EQ(reg.evictionCandidate(std::nullopt), "high-old");
    reg.erase("high-old");
    // Only non-Inactive sessions remain.
    EXPECT_FALSE(reg.evictionCandidate(std::nullopt).has_value());
}

TEST(SessionRegistryTest, EvictionTieBreaksOnId) {
    SessionRegistry reg;
    reg.insert(makeSession("b", "i-1", SessionStatus::Inactive, SessionPriority::Normal, {}));
    reg.insert(makeSession("a", "i-1", SessionStatus::Inactive, SessionPriority::Normal, {}));
    EXPECT_EQ(reg.evictionCandidate(std::nullopt), "a");
}
