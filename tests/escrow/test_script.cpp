// VESCROW - Ledger Script Tests
// Copyright (c) 2024 VESCROW Developers
// MIT License

#include <gtest/gtest.h>
#include <vescrow/db/memory.h>
#include <vescrow/escrow/ledger_store.h>
#include <vescrow/escrow/script.h>

#include <sstream>
#include <string>

using namespace vescrow;
using namespace vescrow::escrow;

namespace {

constexpr Timestamp WEEK = 7 * 86400;
constexpr Timestamp T0 = 2810 * WEEK;
constexpr BlockHeight H0 = 1000;

// ============================================================================
// Token Parsing
// ============================================================================

TEST(ScriptParseTest, Durations) {
    EXPECT_EQ(ParseScriptDuration("90"), 90);
    EXPECT_EQ(ParseScriptDuration("90s"), 90);
    EXPECT_EQ(ParseScriptDuration("15m"), 900);
    EXPECT_EQ(ParseScriptDuration("2h"), 7200);
    EXPECT_EQ(ParseScriptDuration("3d"), 3 * 86400);
    EXPECT_EQ(ParseScriptDuration("4w"), 4 * WEEK);
    EXPECT_EQ(ParseScriptDuration("1y"), 365 * 86400);

    EXPECT_FALSE(ParseScriptDuration("").has_value());
    EXPECT_FALSE(ParseScriptDuration("w").has_value());
    EXPECT_FALSE(ParseScriptDuration("-1d").has_value());
    EXPECT_FALSE(ParseScriptDuration("3q").has_value());
    EXPECT_FALSE(ParseScriptDuration("9999999999999999999y").has_value());
}

TEST(ScriptParseTest, Times) {
    EXPECT_EQ(ParseScriptTime("1700000000", T0), 1700000000);
    EXPECT_EQ(ParseScriptTime("+2w", T0), T0 + 2 * WEEK);
    EXPECT_EQ(ParseScriptTime("2023-11-16", 0), T0 + WEEK);
    EXPECT_FALSE(ParseScriptTime("+", T0).has_value());
    EXPECT_FALSE(ParseScriptTime("soon", T0).has_value());
}

TEST(ScriptParseTest, Accounts) {
    auto byName = ParseScriptAccount("alice");
    ASSERT_TRUE(byName.has_value());
    EXPECT_EQ(ParseScriptAccount("alice"), byName);
    EXPECT_EQ(ParseScriptAccount("contract:alice"), byName);
    EXPECT_NE(ParseScriptAccount("bob"), byName);

    EXPECT_EQ(ParseScriptAccount(byName->ToHex()), byName);
    EXPECT_EQ(ParseScriptAccount("0x" + byName->ToHex()), byName);

    EXPECT_FALSE(ParseScriptAccount("").has_value());
    EXPECT_FALSE(ParseScriptAccount("contract:").has_value());

    EXPECT_TRUE(ParseScriptCaller("contract:vault", *byName).isContract);
    EXPECT_FALSE(ParseScriptCaller("vault", *byName).isContract);
}

// ============================================================================
// Replay
// ============================================================================

class ScriptRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualChainClock>(BlockContext(T0, H0));
        mover_ = std::make_shared<InMemoryAssetMover>();
        checker_ = std::make_shared<StaticContractChecker>();
        store_ = std::make_shared<LedgerStore>(std::make_shared<db::MemoryDatabase>());

        auto opened = VotingEscrow::Open(EscrowParams(), clock_, mover_, store_);
        ASSERT_TRUE(opened.first.ok()) << opened.first.ToString();
        escrow_ = std::move(opened.second);
        escrow_->SetContractChecker(checker_);

        runner_ = std::make_unique<ScriptRunner>(*escrow_, clock_, mover_, checker_, out_);
    }

    int Replay(const std::string& script) {
        std::istringstream in(script);
        return runner_->Run(in);
    }

    bool Contains(const std::string& text) const {
        return out_.str().find(text) != std::string::npos;
    }

    std::shared_ptr<ManualChainClock> clock_;
    std::shared_ptr<InMemoryAssetMover> mover_;
    std::shared_ptr<StaticContractChecker> checker_;
    std::shared_ptr<LedgerStore> store_;
    std::unique_ptr<VotingEscrow> escrow_;
    std::ostringstream out_;
    std::unique_ptr<ScriptRunner> runner_;
};

TEST_F(ScriptRunnerTest, ReplaysLockLifecycle) {
    const int failures = Replay(
        "# setup\n"
        "fund alice 100000000000\n"
        "fund vault 500000000\n"
        "lock alice 100000000000 +208w\n"
        "withdraw alice\n"
        "lock contract:vault 100000000 +1w\n"
        "allow vault\n"
        "lock contract:vault 100000000 +1w   # allowed now\n"
        "frobnicate\n"
        "increase alice\n"
        "power alice\n"
        "totalat 999999\n"
        "\n"
        "advance 208w\n"
        "withdraw alice\n"
        "state alice\n"
        "state\n");

    EXPECT_EQ(failures, 5);
    EXPECT_TRUE(Contains("line 5: withdraw failed: LOCK_NOT_EXPIRED"));
    EXPECT_TRUE(Contains("line 6: lock failed: CONTRACT_NOT_ALLOWED"));
    EXPECT_TRUE(Contains("line 9: frobnicate failed: unknown command"));
    EXPECT_TRUE(Contains("line 10: increase failed: wrong number of arguments"));
    EXPECT_TRUE(Contains("line 12: totalat failed: marker 999999 is in the future"));
    EXPECT_TRUE(Contains("withdraw ok"));

    const Address alice = *ParseScriptAccount("alice");
    const Address vault = *ParseScriptAccount("vault");
    EXPECT_EQ(clock_->Now().time, T0 + 208 * WEEK);
    EXPECT_EQ(clock_->Now().height, H0 + static_cast<BlockHeight>(208 * WEEK / SCRIPT_BLOCK_INTERVAL));
    EXPECT_EQ(escrow_->GetLockState(alice), LockState::NO_LOCK);
    EXPECT_EQ(mover_->BalanceOf(alice), 1000 * COIN);
    EXPECT_EQ(escrow_->GetLock(vault), LockedBalance(COIN, T0 + WEEK));
    EXPECT_EQ(escrow_->Supply(), COIN);
}

TEST_F(ScriptRunnerTest, QueriesPrintPower) {
    ASSERT_EQ(Replay("fund alice 100000000000\n"
                     "lock alice 100000000000 +208w\n"), 0);
    const Address alice = *ParseScriptAccount("alice");
    const Power atLock = escrow_->PowerOf(alice);
    ASSERT_GT(atLock, 0);

    ASSERT_EQ(Replay("advance 1w 100\n"
                     "power alice\n"
                     "power alice +300w\n"
                     "total\n"
                     "powerat alice 1000\n"
                     "totalat 1100\n"), 0);

    EXPECT_TRUE(Contains("power alice @" + std::to_string(T0 + WEEK) + " = " +
                         FormatPower(escrow_->PowerOf(alice))));
    EXPECT_TRUE(Contains(" = 0\n"));
    EXPECT_TRUE(Contains("total @" + std::to_string(T0 + WEEK) + " = " +
                         FormatPower(escrow_->TotalPower())));
    EXPECT_TRUE(Contains("powerat alice #1000 = " + FormatPower(atLock)));
    EXPECT_EQ(clock_->Now().height, H0 + 100);
}

TEST_F(ScriptRunnerTest, ReplayIsPersisted) {
    ASSERT_EQ(Replay("fund alice 100000000000\n"
                     "lock alice 50000000000 +52w\n"
                     "advance 3w\n"
                     "increase alice 25000000000\n"
                     "checkpoint\n"), 0);

    LedgerState reloaded;
    ASSERT_TRUE(store_->Load(EscrowParams(), reloaded).ok());
    EXPECT_EQ(reloaded.Digest(), escrow_->GetStateDigest());
    EXPECT_EQ(reloaded.supply, 750 * COIN);
}

TEST_F(ScriptRunnerTest, ExecuteRejectsBadTokens) {
    std::string error;
    EXPECT_FALSE(runner_->Execute({"lock", "alice", "ten", "+1w"}, error));
    EXPECT_EQ(error, "bad amount ten");
    EXPECT_FALSE(runner_->Execute({"lock", "alice", "10", "later"}, error));
    EXPECT_EQ(error, "bad time later");
    EXPECT_FALSE(runner_->Execute({"advance", "1w", "-3"}, error));
    EXPECT_EQ(error, "bad block count -3");
    EXPECT_FALSE(runner_->Execute({"powerat", "alice", "-1"}, error));
    EXPECT_EQ(error, "bad marker -1");
    EXPECT_FALSE(runner_->Execute({}, error));
    EXPECT_EQ(escrow_->Epoch(), 0u);
}

} // namespace
