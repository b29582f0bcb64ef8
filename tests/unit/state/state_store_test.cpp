#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <vector>

#include "ace/state/state_store.hpp"
#include "support/mock_logger.hpp"

using namespace ace::state;
using namespace std::chrono_literals;
using ace::foundation::TimePoint;

namespace {

const TimePoint kT0 = TimePoint{} + 1000s;

CoreStateUpdate combat(uint32_t job) {
    CoreStateUpdate u;
    u.job = JobId(job);
    u.level = 90;
    u.inCombat = true;
    u.canAct = true;
    return u;
}

} // anonymous namespace

class StateStoreTest : public ace::test::LoggingTest {
protected:
    StateStore store_;
};

// ---------------------------------------------------------------------------
// Core updates
// ---------------------------------------------------------------------------

TEST_F(StateStoreTest, ZeroInitialized) {
    EXPECT_FALSE(store_.isInitialized());
    EXPECT_FALSE(store_.job().isValid());
    EXPECT_EQ(store_.frameStamp(), 0u);
    EXPECT_FALSE(store_.canProcess());
    EXPECT_TRUE(store_.isStale(100ms, kT0));
}

TEST_F(StateStoreTest, UpdateOverwritesSnapshotAndAdvancesFrame) {
    auto u = combat(24);
    u.target = EntityId(0x40000001);
    u.zone = ZoneId(1187);
    u.hasTarget = true;
    u.isMoving = true;
    u.gauge1 = 3;

    store_.updateCore(u, kT0);

    EXPECT_TRUE(store_.isInitialized());
    EXPECT_EQ(store_.job(), JobId(24));
    EXPECT_EQ(store_.level(), 90u);
    EXPECT_EQ(store_.target(), EntityId(0x40000001));
    EXPECT_EQ(store_.zone(), ZoneId(1187));
    EXPECT_TRUE(store_.inCombat());
    EXPECT_TRUE(store_.hasTarget());
    EXPECT_TRUE(store_.isMoving());
    EXPECT_FALSE(store_.inRestrictedArea());
    EXPECT_EQ(store_.gauge1(), 3u);
    EXPECT_EQ(store_.frameStamp(), 1u);

    store_.updateCore(u, kT0 + 16ms);
    EXPECT_EQ(store_.frameStamp(), 2u);
}

TEST_F(StateStoreTest, CanProcessNeedsCombatAndFreedom) {
    auto u = combat(24);
    store_.updateCore(u, kT0);
    EXPECT_TRUE(store_.canProcess());

    u.canAct = false;
    store_.updateCore(u, kT0);
    EXPECT_FALSE(store_.canProcess());

    u.canAct = true;
    u.inCombat = false;
    store_.updateCore(u, kT0);
    EXPECT_FALSE(store_.canProcess());
}

TEST_F(StateStoreTest, StalenessFollowsLastUpdate) {
    store_.updateCore(combat(24), kT0);
    EXPECT_FALSE(store_.isStale(100ms, kT0 + 50ms));
    EXPECT_TRUE(store_.isStale(100ms, kT0 + 150ms));
    EXPECT_EQ(store_.timeSinceLastUpdate(kT0 + 40ms), std::chrono::duration_cast<ace::foundation::Duration>(40ms));
}

// ---------------------------------------------------------------------------
// Job change transitions
// ---------------------------------------------------------------------------

TEST_F(StateStoreTest, FirstUpdateIsNotAJobChange) {
    auto t = store_.updateCore(combat(24), kT0);
    EXPECT_FALSE(t.jobChanged());
    EXPECT_TRUE(t.sideEffects().empty());
}

TEST_F(StateStoreTest, JobChangeReportsSideEffects) {
    store_.updateCore(combat(24), kT0);
    auto t = store_.updateCore(combat(33), kT0 + 16ms);

    EXPECT_TRUE(t.jobChanged());
    EXPECT_EQ(t.previousJob, JobId(24));
    EXPECT_EQ(t.currentJob, JobId(33));
    EXPECT_EQ(t.frameStamp, 2u);
    EXPECT_TRUE(t.includes(SideEffect::ClearResolutionCache));
    EXPECT_TRUE(t.includes(SideEffect::RebuildRuleChains));
    EXPECT_TRUE(t.includes(SideEffect::ReseedEffectTracking));
    EXPECT_EQ(t.sideEffects().size(), 3u);
}

TEST_F(StateStoreTest, SameJobProducesNoSideEffects) {
    store_.updateCore(combat(24), kT0);
    auto t = store_.updateCore(combat(24), kT0 + 16ms);
    EXPECT_FALSE(t.jobChanged());
}

TEST_F(StateStoreTest, ObserverReceivesOldAndNewJob) {
    std::vector<std::pair<JobId, JobId>> calls;
    store_.setJobChangeObserver([&](JobId from, JobId to) { calls.emplace_back(from, to); });

    store_.updateCore(combat(24), kT0);
    store_.updateCore(combat(33), kT0);
    store_.updateCore(combat(33), kT0);

    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].first, JobId(24));
    EXPECT_EQ(calls[0].second, JobId(33));
}

TEST_F(StateStoreTest, ThrowingObserverIsContained) {
    store_.setJobChangeObserver([](JobId, JobId) { throw std::runtime_error("provider broke"); });

    store_.updateCore(combat(24), kT0);
    StateTransition t;
    EXPECT_NO_THROW(t = store_.updateCore(combat(33), kT0));

    EXPECT_TRUE(t.jobChanged());
    EXPECT_EQ(store_.job(), JobId(33));
    EXPECT_TRUE(mockLogger_->contains("Job change observer threw"));
    EXPECT_TRUE(mockLogger_->contains("provider broke"));
}

TEST_F(StateStoreTest, NonStandardObserverThrowIsContained) {
    store_.setJobChangeObserver([](JobId, JobId) { throw 3; });

    store_.updateCore(combat(24), kT0);
    StateTransition t;
    EXPECT_NO_THROW(t = store_.updateCore(combat(33), kT0));

    EXPECT_TRUE(t.jobChanged());
    EXPECT_EQ(store_.job(), JobId(33));
    EXPECT_TRUE(mockLogger_->contains("non-standard exception"));
}

// ---------------------------------------------------------------------------
// Scalars, gauges, resources
// ---------------------------------------------------------------------------

TEST_F(StateStoreTest, ScalarUpdateKeepsCoreFields) {
    store_.updateCore(combat(24), kT0);
    store_.updateScalars({1.7f, 6000, 10000});

    EXPECT_EQ(store_.job(), JobId(24));
    EXPECT_FLOAT_EQ(store_.timeToNextPrimary(), 1.7f);
    EXPECT_EQ(store_.resourceCurrent(), 6000u);
    EXPECT_EQ(store_.resourceMax(), 10000u);
    EXPECT_FLOAT_EQ(store_.resourceFraction(), 0.6f);
    EXPECT_FALSE(store_.isResourceLow());
    EXPECT_TRUE(store_.hasResourceFor(400));
    EXPECT_FALSE(store_.hasResourceFor(7000));
}

TEST_F(StateStoreTest, ResourceFractionWithoutPoolIsZero) {
    EXPECT_FLOAT_EQ(store_.resourceFraction(), 0.0f);
    EXPECT_TRUE(store_.isResourceLow());
}

TEST_F(StateStoreTest, GaugeAppliesOnlyToCurrentJob) {
    store_.updateCore(combat(24), kT0);

    EXPECT_FALSE(store_.updateJobGauge(JobId(33), 1, 2));
    EXPECT_EQ(store_.gauge1(), 0u);

    EXPECT_TRUE(store_.updateJobGauge(JobId(24), 1, 2));
    EXPECT_EQ(store_.gauge1(), 1u);
    EXPECT_EQ(store_.gauge2(), 2u);

    EXPECT_FALSE(store_.updateJobGauge(JobId(24), 1, 2));
}

TEST_F(StateStoreTest, WeaveWindow) {
    store_.updateCore(combat(24), kT0);

    store_.updateScalars({0.0f, 0, 0});
    EXPECT_TRUE(store_.canWeave());

    store_.updateScalars({1.7f, 0, 0});
    EXPECT_TRUE(store_.canWeave(1));
    EXPECT_TRUE(store_.canWeave(2));
    EXPECT_FALSE(store_.canWeave(3));

    store_.updateScalars({0.5f, 0, 0});
    EXPECT_FALSE(store_.canWeave(1));
    EXPECT_TRUE(store_.canWeave(1, 0.4f));
}

// ---------------------------------------------------------------------------
// Effects through the store
// ---------------------------------------------------------------------------

TEST_F(StateStoreTest, EffectAccessorsByKind) {
    store_.updateCore(combat(24), kT0);
    store_.updateEffects(EffectKind::ActorEffect, {{1200, 8.0f}}, kT0);
    store_.updateEffects(EffectKind::TargetEffect, {{1300, 2.0f}}, kT0);

    EXPECT_TRUE(store_.hasActorEffect(EffectId(1200), kT0));
    EXPECT_NEAR(store_.actorEffectRemaining(EffectId(1200), kT0 + 3s), 5.0f, 1e-3f);
    EXPECT_TRUE(store_.hasTargetEffect(EffectId(1300), kT0));
    EXPECT_FALSE(store_.hasTargetEffect(EffectId(1300), kT0 + 3s));
    EXPECT_FALSE(store_.hasActorEffect(EffectId(1300), kT0));
}

TEST_F(StateStoreTest, RecordActionUsedStartsCooldown) {
    store_.updateCore(combat(24), kT0);
    store_.recordActionUsed(ActionId(7430), 60.0f, kT0);

    EXPECT_FALSE(store_.isActionReady(ActionId(7430), kT0 + 30s));
    EXPECT_NEAR(store_.cooldownRemaining(ActionId(7430), kT0 + 30s), 30.0f, 1e-3f);
    EXPECT_TRUE(store_.isActionReady(ActionId(7430), kT0 + 60s));
    EXPECT_TRUE(store_.isAuxiliaryReady(ActionId(7430), kT0 + 60s));
}

TEST_F(StateStoreTest, RecordActionUsedIgnoresInvalidInput) {
    store_.recordActionUsed(ActionId{}, 10.0f, kT0);
    store_.recordActionUsed(ActionId(5), 0.0f, kT0);
    EXPECT_EQ(store_.effects().trackedCount(EffectKind::Cooldown), 0u);
}

TEST_F(StateStoreTest, AuxiliaryReadinessRequiresProcessing) {
    auto u = combat(24);
    u.inCombat = false;
    store_.updateCore(u, kT0);
    store_.recordActionUsed(ActionId(7430), 1.0f, kT0);

    EXPECT_TRUE(store_.isActionReady(ActionId(7430), kT0 + 2s));
    EXPECT_FALSE(store_.isAuxiliaryReady(ActionId(7430), kT0 + 2s));
}

TEST_F(StateStoreTest, ResetKeepsObserver) {
    int calls = 0;
    store_.setJobChangeObserver([&](JobId, JobId) { ++calls; });
    store_.updateCore(combat(24), kT0);
    store_.effects().trackIfAbsent(EffectKind::Cooldown, 9);

    store_.reset();
    EXPECT_FALSE(store_.isInitialized());
    EXPECT_EQ(store_.frameStamp(), 0u);
    EXPECT_EQ(store_.effects().trackedCount(EffectKind::Cooldown), 0u);

    store_.updateCore(combat(24), kT0);
    store_.updateCore(combat(33), kT0);
    EXPECT_EQ(calls, 1);
}
