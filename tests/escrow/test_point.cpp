// VESCROW - Point and Parameter Tests
// Copyright (c) 2024 VESCROW Developers
// MIT License

#include <gtest/gtest.h>
#include <vescrow/escrow/errors.h>
#include <vescrow/escrow/events.h>
#include <vescrow/escrow/params.h>
#include <vescrow/escrow/point.h>
#include <vescrow/escrow/state.h>
#include <vescrow/db/database.h>
#include <vescrow/util/config.h>

#include <limits>
#include <string>

using namespace vescrow;
using namespace vescrow::escrow;

// ============================================================================
// Curve Math
// ============================================================================

TEST(PointTest, SlopeForIsTruncatingFixedPoint) {
    EXPECT_EQ(SlopeFor(1000, 1000), POWER_SCALE);
    EXPECT_EQ(SlopeFor(1, 3), static_cast<Power>(333333333333333333LL));
    EXPECT_EQ(SlopeFor(0, 1000), 0);

    Amount amount = 1000 * COIN;
    EXPECT_EQ(SlopeFor(amount, DEFAULT_MAX_LOCK_DURATION),
              static_cast<Power>(amount) * POWER_SCALE / DEFAULT_MAX_LOCK_DURATION);
}

TEST(PointTest, SlopeForRejectsNonPositiveDuration) {
    EXPECT_THROW(SlopeFor(100, 0), ArithmeticError);
    EXPECT_THROW(SlopeFor(100, -5), ArithmeticError);
}

TEST(PointTest, CurveForActiveLock) {
    LockedBalance lock(100, 1000);
    Point curve = CurveFor(lock, 400, 1000);

    EXPECT_EQ(curve.slope, POWER_SCALE / 10);
    EXPECT_EQ(curve.bias, POWER_SCALE / 10 * 600);
    EXPECT_EQ(curve.ts, 400);
    EXPECT_EQ(curve.marker, 0u);
}

TEST(PointTest, CurveForEndedOrEmptyLock) {
    Point ended = CurveFor(LockedBalance(100, 1000), 1000, 1000);
    EXPECT_EQ(ended.bias, 0);
    EXPECT_EQ(ended.slope, 0);
    EXPECT_EQ(ended.ts, 1000);

    Point empty = CurveFor(LockedBalance(), 5, 1000);
    EXPECT_EQ(empty.bias, 0);
    EXPECT_EQ(empty.slope, 0);
}

TEST(PointTest, ValueAtExtrapolatesAndClamps) {
    Point p(100, 2, 10, 7);
    EXPECT_EQ(p.ValueAt(10), 100);
    EXPECT_EQ(p.ValueAt(20), 80);
    EXPECT_EQ(p.ValueAt(60), 0);
    EXPECT_EQ(p.ValueAt(70), 0);   // clamped, never negative
    EXPECT_EQ(p.ValueAt(5), 110);  // before ts
}

TEST(PointTest, ValueAtFarPastZeroCrossing) {
    Point p(SlopeFor(1000 * COIN, DEFAULT_MAX_LOCK_DURATION) * 86400,
            SlopeFor(1000 * COIN, DEFAULT_MAX_LOCK_DURATION), 0, 0);
    EXPECT_EQ(p.ValueAt(86400), 0);
    EXPECT_EQ(p.ValueAt(86399), p.slope);
    EXPECT_EQ(p.ValueAt(std::numeric_limits<Timestamp>::max()), 0);
}

TEST(PointTest, ValueAtOverflowThrows) {
    Point p(0, static_cast<Power>(1) << 120, 0, 0);
    EXPECT_THROW(p.ValueAt(-(static_cast<Timestamp>(1) << 40)), ArithmeticError);
}

TEST(PointTest, Equality) {
    Point a(1, 2, 3, 4);
    Point b(1, 2, 3, 4);
    Point c(1, 2, 3, 5);
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

TEST(PointTest, ToString) {
    Point p(POWER_SCALE, 3, 100, 9);
    EXPECT_EQ(p.ToString(), "Point(bias=1000000000000000000, slope=3, ts=100, marker=9)");
    EXPECT_EQ(LockedBalance(5, 60).ToString(), "LockedBalance(amount=5, end=60)");
}

TEST(PointTest, FormatPower) {
    EXPECT_EQ(FormatPower(0), "0");
    EXPECT_EQ(FormatPower(POWER_SCALE), "1");
    EXPECT_EQ(FormatPower(POWER_SCALE * 1000), "1000");
    EXPECT_EQ(FormatPower(POWER_SCALE * 3 / 2), "1.5");
    EXPECT_EQ(FormatPower(1), "0.000000000000000001");
    EXPECT_EQ(FormatPower(-POWER_SCALE / 4), "-0.25");
}

TEST(PointTest, SerializedSizes) {
    EXPECT_EQ(db::SerializeToString(Point(1, 2, 3, 4)).size(), 16u + 16u + 8u + 8u);
    EXPECT_EQ(db::SerializeToString(LockedBalance(1, 2)).size(), 16u);

    Point decoded;
    Point original(-5, POWER_SCALE * 7, 1699488000, 123456);
    ASSERT_TRUE(db::DeserializeFromString(db::SerializeToString(original), decoded));
    EXPECT_EQ(decoded, original);
}

// ============================================================================
// Locked Balance
// ============================================================================

TEST(LockedBalanceTest, EmptyAndActive) {
    EXPECT_TRUE(LockedBalance().IsEmpty());
    EXPECT_TRUE(LockedBalance(0, 100).IsEmpty());
    EXPECT_TRUE(LockedBalance(100, 0).IsEmpty());

    LockedBalance lock(100, 500);
    EXPECT_FALSE(lock.IsEmpty());
    EXPECT_TRUE(lock.IsActive(499));
    EXPECT_FALSE(lock.IsActive(500));
    EXPECT_FALSE(LockedBalance().IsActive(0));
}

TEST(LockedBalanceTest, ClassifyLock) {
    EXPECT_EQ(ClassifyLock(LockedBalance(), 10), LockState::NO_LOCK);
    EXPECT_EQ(ClassifyLock(LockedBalance(5, 20), 10), LockState::ACTIVE);
    EXPECT_EQ(ClassifyLock(LockedBalance(5, 20), 20), LockState::EXPIRED);

    EXPECT_STREQ(LockStateToString(LockState::NO_LOCK), "NoLock");
    EXPECT_STREQ(LockStateToString(LockState::ACTIVE), "Active");
    EXPECT_STREQ(LockStateToString(LockState::EXPIRED), "Expired");
}

// ============================================================================
// Errors and Events
// ============================================================================

TEST(EscrowErrorTest, ToString) {
    EXPECT_STREQ(EscrowErrorToString(EscrowError::OK), "OK");
    EXPECT_STREQ(EscrowErrorToString(EscrowError::LOCK_EXISTS), "LOCK_EXISTS");
    EXPECT_STREQ(EscrowErrorToString(EscrowError::SWEEP_LIMIT_EXCEEDED), "SWEEP_LIMIT_EXCEEDED");
    EXPECT_STREQ(EscrowErrorToString(EscrowError::STORAGE_FAILURE), "STORAGE_FAILURE");
}

TEST(EscrowErrorTest, Result) {
    EscrowResult ok = EscrowResult::Ok();
    EXPECT_TRUE(ok.ok());
    EXPECT_EQ(ok.ToString(), "OK");

    EscrowResult fail = EscrowResult::Fail(EscrowError::ZERO_AMOUNT, "amount must be positive");
    EXPECT_FALSE(fail.ok());
    EXPECT_EQ(fail.error, EscrowError::ZERO_AMOUNT);
    EXPECT_EQ(fail.ToString(), "ZERO_AMOUNT: amount must be positive");

    EXPECT_EQ(EscrowResult::Fail(EscrowError::REENTRANT_CALL).ToString(), "REENTRANT_CALL");
}

TEST(EscrowErrorTest, ExceptionCarriesCode) {
    try {
        throw EscrowException(EscrowError::CLOCK_REGRESSION, "clock went back");
    } catch (const EscrowException& e) {
        EXPECT_EQ(e.code(), EscrowError::CLOCK_REGRESSION);
        EXPECT_STREQ(e.what(), "clock went back");
    }
}

TEST(EscrowEventTest, DepositTypeNames) {
    EXPECT_STREQ(DepositTypeToString(DepositType::DEPOSIT_FOR), "DepositFor");
    EXPECT_STREQ(DepositTypeToString(DepositType::CREATE_LOCK), "CreateLock");
    EXPECT_STREQ(DepositTypeToString(DepositType::INCREASE_LOCK_AMOUNT), "IncreaseLockAmount");
    EXPECT_STREQ(DepositTypeToString(DepositType::INCREASE_UNLOCK_TIME), "IncreaseUnlockTime");
    EXPECT_EQ(static_cast<int>(DepositType::INCREASE_UNLOCK_TIME), 3);
}

TEST(EscrowEventTest, SupplyEventToString) {
    SupplyEvent event{100, 250};
    EXPECT_EQ(event.ToString(), "Supply(100 -> 250)");
}

// ============================================================================
// Parameters
// ============================================================================

class EscrowParamsTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.Clear();
    }

    util::ConfigManager config_;
};

TEST_F(EscrowParamsTest, DefaultsAreValid) {
    EscrowParams params = EscrowParams::Default();
    std::string error;
    EXPECT_TRUE(params.IsValid(&error)) << error;
    EXPECT_EQ(params.lockUnit, 604800);
    EXPECT_EQ(params.maxLockDuration, 126144000);
    EXPECT_EQ(params.maxSweepBuckets, DEFAULT_MAX_SWEEP_BUCKETS);
}

TEST_F(EscrowParamsTest, FloorToUnit) {
    EscrowParams params;
    EXPECT_EQ(params.FloorToUnit(0), 0);
    EXPECT_EQ(params.FloorToUnit(604799), 0);
    EXPECT_EQ(params.FloorToUnit(604800 * 3 + 5), 604800 * 3);
}

TEST_F(EscrowParamsTest, InvalidParams) {
    std::string error;

    EscrowParams zeroUnit;
    zeroUnit.lockUnit = 0;
    EXPECT_FALSE(zeroUnit.IsValid(&error));
    EXPECT_NE(error.find("lockunit"), std::string::npos);

    EscrowParams shortLock;
    shortLock.maxLockDuration = shortLock.lockUnit - 1;
    EXPECT_FALSE(shortLock.IsValid(&error));

    EscrowParams noBuckets;
    noBuckets.maxSweepBuckets = 0;
    EXPECT_FALSE(noBuckets.IsValid(&error));

    // 208 whole weeks in four years, plus one
    EscrowParams fewBuckets;
    fewBuckets.maxSweepBuckets = 208;
    EXPECT_FALSE(fewBuckets.IsValid(&error));
    EXPECT_NE(error.find("209"), std::string::npos);
    fewBuckets.maxSweepBuckets = 209;
    EXPECT_TRUE(fewBuckets.IsValid());
}

TEST_F(EscrowParamsTest, EqualityAndToString) {
    EscrowParams a;
    EscrowParams b;
    EXPECT_EQ(a, b);
    b.symbol = "veOTHER";
    EXPECT_NE(a, b);

    EXPECT_EQ(a.ToString(),
              "EscrowParams(Vote-escrowed Token [veTOKEN], unit=604800, "
              "maxlock=126144000, maxbuckets=5218)");
}

TEST_F(EscrowParamsTest, SerializationPreservesAllFields) {
    EscrowParams params;
    params.lockUnit = 3600;
    params.maxLockDuration = 86400;
    params.maxSweepBuckets = 100;
    params.name = "Hourly";
    params.symbol = "veH";

    EscrowParams decoded;
    ASSERT_TRUE(db::DeserializeFromString(db::SerializeToString(params), decoded));
    EXPECT_EQ(decoded, params);
}

TEST_F(EscrowParamsTest, FromConfigDefaults) {
    auto params = EscrowParams::FromConfig(config_);
    ASSERT_TRUE(params.has_value());
    EXPECT_EQ(*params, EscrowParams::Default());
}

TEST_F(EscrowParamsTest, FromConfigOverrides) {
    ASSERT_TRUE(config_.ParseString(R"(
[escrow]
lockunit=86400
maxlockduration=31536000
maxsweepbuckets=400
name="Daily Escrow"
symbol=veDAY
)").success);

    std::string error;
    auto params = EscrowParams::FromConfig(config_, &error);
    ASSERT_TRUE(params.has_value()) << error;
    EXPECT_EQ(params->lockUnit, 86400);
    EXPECT_EQ(params->maxLockDuration, 31536000);
    EXPECT_EQ(params->maxSweepBuckets, 400u);
    EXPECT_EQ(params->name, "Daily Escrow");
    EXPECT_EQ(params->symbol, "veDAY");
}

TEST_F(EscrowParamsTest, FromConfigMalformedInteger) {
    config_.Set(util::ConfigKeys::LOCKUNIT, "week", util::ConfigKeys::ESCROW_SECTION);

    std::string error;
    EXPECT_FALSE(EscrowParams::FromConfig(config_, &error).has_value());
    EXPECT_EQ(error, "invalid integer for escrow.lockunit");
}

TEST_F(EscrowParamsTest, FromConfigRejectsInvalidCombination) {
    config_.Set(util::ConfigKeys::LOCKUNIT, "86400", util::ConfigKeys::ESCROW_SECTION);

    // 1460 daily buckets in four years; the default ceiling covers them,
    // an explicit low ceiling does not
    std::string error;
    EXPECT_TRUE(EscrowParams::FromConfig(config_, &error).has_value()) << error;

    config_.Set(util::ConfigKeys::MAXSWEEPBUCKETS, "1000", util::ConfigKeys::ESCROW_SECTION);
    EXPECT_FALSE(EscrowParams::FromConfig(config_, &error).has_value());
    EXPECT_NE(error.find("maxsweepbuckets"), std::string::npos);

    config_.Set(util::ConfigKeys::MAXSWEEPBUCKETS, "-1", util::ConfigKeys::ESCROW_SECTION);
    EXPECT_FALSE(EscrowParams::FromConfig(config_, &error).has_value());
}
