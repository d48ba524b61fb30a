// VESCROW - Checkpoint Engine Tests
// Copyright (c) 2024 VESCROW Developers
// MIT License

#include <gtest/gtest.h>
#include <vescrow/escrow/checkpoint.h>
#include <vescrow/escrow/errors.h>

#include <array>

using namespace vescrow;
using namespace vescrow::escrow;

// ============================================================================
// Test Fixture
// ============================================================================

/**
 * Small numbers keep the curve arithmetic checkable by hand: buckets of
 * 100 seconds, a maximum lock of 1000 seconds, so a lock of N units
 * decays at N * POWER_SCALE / 1000 per second.
 */
class CheckpointTest : public ::testing::Test {
protected:
    CheckpointTest() : engine_(MakeParams()) {}

    static EscrowParams MakeParams() {
        EscrowParams params;
        params.lockUnit = 100;
        params.maxLockDuration = 1000;
        params.maxSweepBuckets = 11;
        return params;
    }

    void SetUp() override {
        state_.Seed(BlockContext(1000, 10));
        alice_ = CreateTestAddress(1);
        bob_ = CreateTestAddress(2);
    }

    Address CreateTestAddress(uint8_t id) {
        std::array<Byte, 20> data{};
        data[0] = id;
        data[19] = id;
        return Address(data);
    }

    /// Replace account's lock at now and apply the result
    ChangeSet SetLock(const Address& account, const LockedBalance& lock, const BlockContext& now) {
        LockedBalance old = state_.GetLock(account);
        ChangeSet changes = engine_.Checkpoint(state_, now, account, old, lock);
        changes.newLock = lock;
        ApplyChangeSet(state_, changes);
        return changes;
    }

    ChangeSet Sync(const BlockContext& now) {
        ChangeSet changes = engine_.Checkpoint(state_, now);
        ApplyChangeSet(state_, changes);
        return changes;
    }

    Power Units(int64_t n) { return POWER_SCALE * n; }

    CheckpointEngine engine_;
    LedgerState state_;
    Address alice_;
    Address bob_;
};

// ============================================================================
// Account Transitions
// ============================================================================

TEST_F(CheckpointTest, FirstLockAddsCurve) {
    ChangeSet changes = SetLock(alice_, LockedBalance(1000, 1500), BlockContext(1000, 10));

    ASSERT_EQ(changes.globalPoints.size(), 1u);
    EXPECT_EQ(changes.globalPoints[0], Point(Units(500), Units(1), 1000, 10));

    ASSERT_TRUE(changes.account.has_value());
    EXPECT_EQ(*changes.account, alice_);
    EXPECT_EQ(changes.userPoint, Point(Units(500), Units(1), 1000, 10));

    ASSERT_EQ(changes.slopeWrites.size(), 1u);
    EXPECT_EQ(changes.slopeWrites.at(1500), -Units(1));

    EXPECT_EQ(state_.Epoch(), 1u);
    EXPECT_EQ(state_.UserEpoch(alice_), 1u);
    EXPECT_EQ(state_.GetSlopeChange(1500), -Units(1));
}

TEST_F(CheckpointTest, SweepEmitsOnePointPerBucket) {
    SetLock(alice_, LockedBalance(1000, 1500), BlockContext(1000, 10));
    ChangeSet changes = Sync(BlockContext(1250, 20));

    // 1100 and 1200 are bucket boundaries, 1250 is the current time
    ASSERT_EQ(changes.globalPoints.size(), 3u);
    EXPECT_EQ(changes.globalPoints[0], Point(Units(400), Units(1), 1100, 14));
    EXPECT_EQ(changes.globalPoints[1], Point(Units(300), Units(1), 1200, 18));
    EXPECT_EQ(changes.globalPoints[2], Point(Units(250), Units(1), 1250, 20));
    EXPECT_FALSE(changes.account.has_value());
    EXPECT_TRUE(changes.slopeWrites.empty());
}

TEST_F(CheckpointTest, SweepAppliesScheduledSlopeChanges) {
    SetLock(alice_, LockedBalance(1000, 1500), BlockContext(1000, 10));
    Sync(BlockContext(1250, 20));
    ChangeSet changes = Sync(BlockContext(1600, 30));

    ASSERT_EQ(changes.globalPoints.size(), 4u);
    EXPECT_EQ(changes.globalPoints[0].bias, Units(200));
    EXPECT_EQ(changes.globalPoints[1].bias, Units(100));
    EXPECT_EQ(changes.globalPoints[2].ts, 1500);
    EXPECT_EQ(changes.globalPoints[2].bias, 0);
    EXPECT_EQ(changes.globalPoints[2].slope, 0);
    EXPECT_EQ(changes.globalPoints[3], Point(0, 0, 1600, 30));

    BlockHeight previous = 0;
    for (const auto& point : changes.globalPoints) {
        EXPECT_GE(point.marker, previous);
        previous = point.marker;
    }
}

TEST_F(CheckpointTest, IncreaseAmountRewritesSameBucket) {
    SetLock(alice_, LockedBalance(1000, 1500), BlockContext(1000, 10));
    ChangeSet changes = SetLock(alice_, LockedBalance(2000, 1500), BlockContext(1100, 12));

    ASSERT_EQ(changes.slopeWrites.size(), 1u);
    EXPECT_EQ(changes.slopeWrites.at(1500), -Units(2));
    EXPECT_EQ(changes.userPoint, Point(Units(800), Units(2), 1100, 12));
    EXPECT_EQ(state_.LatestGlobal(), Point(Units(800), Units(2), 1100, 12));
}

TEST_F(CheckpointTest, ExtendMovesScheduledDrop) {
    SetLock(alice_, LockedBalance(1000, 1500), BlockContext(1000, 10));
    ChangeSet changes = SetLock(alice_, LockedBalance(1000, 1800), BlockContext(1100, 12));

    ASSERT_EQ(changes.slopeWrites.size(), 2u);
    EXPECT_EQ(changes.slopeWrites.at(1500), 0);
    EXPECT_EQ(changes.slopeWrites.at(1800), -Units(1));
    EXPECT_EQ(state_.LatestGlobal().bias, Units(700));
    EXPECT_EQ(state_.LatestGlobal().slope, Units(1));
}

TEST_F(CheckpointTest, LocksSharingAnEndAccumulate) {
    SetLock(alice_, LockedBalance(1000, 1500), BlockContext(1000, 10));
    SetLock(bob_, LockedBalance(500, 1500), BlockContext(1000, 10));

    EXPECT_EQ(state_.GetSlopeChange(1500), -Units(1) - Units(1) / 2);
    EXPECT_EQ(state_.LatestGlobal().slope, Units(1) + Units(1) / 2);
    EXPECT_EQ(state_.LatestGlobal().bias, Units(750));
}

TEST_F(CheckpointTest, WithdrawAfterExpiryLeavesScheduleAlone) {
    SetLock(alice_, LockedBalance(1000, 1500), BlockContext(1000, 10));
    ChangeSet changes = SetLock(alice_, LockedBalance(), BlockContext(1600, 30));

    EXPECT_TRUE(changes.slopeWrites.empty());
    EXPECT_EQ(changes.userPoint, Point(0, 0, 1600, 30));
    EXPECT_EQ(state_.LatestGlobal(), Point(0, 0, 1600, 30));
    EXPECT_EQ(state_.UserEpoch(alice_), 2u);
}

TEST_F(CheckpointTest, SameTimestampOperationsAppendPoints) {
    SetLock(alice_, LockedBalance(1000, 1500), BlockContext(1000, 10));
    ChangeSet changes = SetLock(bob_, LockedBalance(1000, 1200), BlockContext(1000, 10));

    ASSERT_EQ(changes.globalPoints.size(), 1u);
    EXPECT_EQ(changes.globalPoints[0], Point(Units(700), Units(2), 1000, 10));
    EXPECT_EQ(state_.Epoch(), 2u);
}

// ============================================================================
// Global Sync
// ============================================================================

TEST_F(CheckpointTest, GlobalSyncIsIdempotent) {
    SetLock(alice_, LockedBalance(1000, 1500), BlockContext(1000, 10));
    Sync(BlockContext(1250, 20));
    LedgerState before = state_;

    ChangeSet again = engine_.Checkpoint(state_, BlockContext(1250, 20));
    EXPECT_TRUE(again.Empty());
    ApplyChangeSet(state_, again);
    EXPECT_EQ(state_, before);
    EXPECT_EQ(state_.Digest(), before.Digest());
}

TEST_F(CheckpointTest, FirstGlobalSyncStartsAtNow) {
    ChangeSet changes = Sync(BlockContext(5000, 99));
    ASSERT_EQ(changes.globalPoints.size(), 1u);
    EXPECT_EQ(changes.globalPoints[0], Point(0, 0, 5000, 99));
}

TEST_F(CheckpointTest, ClockRegressionIsRejected) {
    SetLock(alice_, LockedBalance(1000, 1500), BlockContext(1200, 20));

    try {
        engine_.Checkpoint(state_, BlockContext(1199, 20));
        FAIL() << "expected CLOCK_REGRESSION";
    } catch (const EscrowException& e) {
        EXPECT_EQ(e.code(), EscrowError::CLOCK_REGRESSION);
    }

    try {
        engine_.Checkpoint(state_, BlockContext(1300, 19));
        FAIL() << "expected CLOCK_REGRESSION";
    } catch (const EscrowException& e) {
        EXPECT_EQ(e.code(), EscrowError::CLOCK_REGRESSION);
    }
}

TEST_F(CheckpointTest, SweepCeiling) {
    Sync(BlockContext(1000, 10));

    // Eleven buckets reach exactly 2100
    LedgerState copy = state_;
    EXPECT_NO_THROW(engine_.Checkpoint(copy, BlockContext(2100, 50)));

    try {
        engine_.Checkpoint(state_, BlockContext(2101, 50));
        FAIL() << "expected SWEEP_LIMIT_EXCEEDED";
    } catch (const EscrowException& e) {
        EXPECT_EQ(e.code(), EscrowError::SWEEP_LIMIT_EXCEEDED);
    }
}

// ============================================================================
// Supply Projection
// ============================================================================

TEST_F(CheckpointTest, SupplyAtProjectsThroughSchedule) {
    SetLock(alice_, LockedBalance(1000, 1500), BlockContext(1000, 10));
    SetLock(bob_, LockedBalance(1000, 1200), BlockContext(1000, 10));
    const Point latest = state_.LatestGlobal();

    EXPECT_EQ(engine_.SupplyAt(state_, latest, 1000), Units(700));
    EXPECT_EQ(engine_.SupplyAt(state_, latest, 1100), Units(500));
    EXPECT_EQ(engine_.SupplyAt(state_, latest, 1200), Units(300));
    EXPECT_EQ(engine_.SupplyAt(state_, latest, 1300), Units(200));
    EXPECT_EQ(engine_.SupplyAt(state_, latest, 1450), Units(50));
    EXPECT_EQ(engine_.SupplyAt(state_, latest, 1500), 0);
    EXPECT_EQ(engine_.SupplyAt(state_, latest, 100000), 0);
}

TEST_F(CheckpointTest, SupplyAtBeforePointExtrapolatesBackwards) {
    SetLock(alice_, LockedBalance(1000, 1500), BlockContext(1000, 10));
    Sync(BlockContext(1250, 20));

    EXPECT_EQ(engine_.SupplyAt(state_, state_.LatestGlobal(), 1200), Units(300));
}

TEST_F(CheckpointTest, SupplyAtFlatCurveNeedsNoSweep) {
    Sync(BlockContext(1000, 10));
    // Far past the sweep ceiling, but nothing decays
    EXPECT_EQ(engine_.SupplyAt(state_, state_.LatestGlobal(), 1000000), 0);
}

// ============================================================================
// Change Set Application
// ============================================================================

TEST_F(CheckpointTest, EmptyChangeSet) {
    ChangeSet changes;
    EXPECT_TRUE(changes.Empty());
    changes.newSupply = 5;
    EXPECT_FALSE(changes.Empty());
}

TEST_F(CheckpointTest, ApplyChangeSetInitializesHistory) {
    ChangeSet changes;
    changes.account = alice_;
    changes.userPoint = Point(Units(1), 0, 1000, 10);
    changes.newLock = LockedBalance(10, 1500);
    changes.newSupply = 10;
    changes.slopeWrites[1500] = -Units(1);

    ApplyChangeSet(state_, changes);

    const std::vector<Point>* history = state_.GetUserHistory(alice_);
    ASSERT_NE(history, nullptr);
    ASSERT_EQ(history->size(), 2u);
    EXPECT_EQ((*history)[0], Point());
    EXPECT_EQ((*history)[1], changes.userPoint);
    EXPECT_EQ(state_.GetLock(alice_), LockedBalance(10, 1500));
    EXPECT_EQ(state_.supply, 10);
    EXPECT_EQ(state_.GetSlopeChange(1500), -Units(1));
    EXPECT_EQ(state_.Epoch(), 0u);
}
