// VESCROW - Voting Escrow
// Copyright (c) 2024 VESCROW Developers
// MIT License

#include "vescrow/escrow/voting_escrow.h"
#include "vescrow/core/arith.h"
#include "vescrow/util/logging.h"

#include <stdexcept>

namespace vescrow {
namespace escrow {

namespace {

EscrowResult CheckAmount(Amount amount) {
    if (amount == 0) {
        return EscrowResult::Fail(EscrowError::ZERO_AMOUNT, "amount must be positive");
    }
    if (!MoneyRange(amount)) {
        return EscrowResult::Fail(EscrowError::AMOUNT_OUT_OF_RANGE,
                                  "amount " + std::to_string(amount) + " out of range");
    }
    return EscrowResult::Ok();
}

/// Run a subscriber; the operation has already committed, so a throw is only logged
template<typename Callback, typename Event>
void Deliver(const Callback& callback, const Event& event, const char* name) {
    if (!callback) {
        return;
    }
    try {
        callback(event);
    } catch (const std::exception& e) {
        LOG_WARN(util::LogCategory::ESCROW) << name << " callback threw: " << e.what();
    }
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

VotingEscrow::VotingEscrow(const EscrowParams& params,
                           std::shared_ptr<IChainClock> clock,
                           std::shared_ptr<IAssetMover> mover)
    : VotingEscrow(params, std::move(clock), std::move(mover), nullptr, LedgerState()) {
    state_.Seed(clock_->Now());
    LOG_INFO(util::LogCategory::ESCROW) << "Started in-memory ledger " << params_.ToString()
                                        << " at " << state_.LatestGlobal().ts;
}

VotingEscrow::VotingEscrow(const EscrowParams& params,
                           std::shared_ptr<IChainClock> clock,
                           std::shared_ptr<IAssetMover> mover,
                           std::shared_ptr<LedgerStore> store,
                           LedgerState state)
    : params_(params),
      engine_(params),
      queries_(params),
      clock_(std::move(clock)),
      mover_(std::move(mover)),
      store_(std::move(store)),
      state_(std::move(state)) {
    std::string error;
    if (!params_.IsValid(&error)) {
        throw std::invalid_argument("invalid escrow parameters: " + error);
    }
    if (!clock_ || !mover_) {
        throw std::invalid_argument("VotingEscrow requires a clock and an asset mover");
    }
}

VotingEscrow::~VotingEscrow() = default;

std::pair<EscrowResult, std::unique_ptr<VotingEscrow>> VotingEscrow::Open(
    const EscrowParams& params,
    std::shared_ptr<IChainClock> clock,
    std::shared_ptr<IAssetMover> mover,
    std::shared_ptr<LedgerStore> store) {
    if (!clock || !store) {
        throw std::invalid_argument("VotingEscrow::Open requires a clock and a store");
    }

    LedgerState state;
    db::Status status;
    if (store->IsEmpty()) {
        state.Seed(clock->Now());
        status = store->Initialize(params, state);
    } else {
        status = store->Load(params, state);
    }

    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::ESCROW) << "Failed to open ledger: " << status.ToString();
        return {EscrowResult::Fail(EscrowError::STORAGE_FAILURE, status.ToString()), nullptr};
    }

    std::unique_ptr<VotingEscrow> escrow(
        new VotingEscrow(params, std::move(clock), std::move(mover), std::move(store),
                         std::move(state)));
    LOG_INFO(util::LogCategory::ESCROW) << "Opened ledger " << escrow->params_.ToString()
                                        << " at epoch " << escrow->state_.Epoch();
    return {EscrowResult::Ok(), std::move(escrow)};
}

// ============================================================================
// Write Path
// ============================================================================

template<typename Func>
EscrowResult VotingEscrow::RunWrite(const char* operation, Func&& body) {
    if (writer_.load() == std::this_thread::get_id()) {
        LOG_WARN(util::LogCategory::ESCROW) << operation << " rejected: re-entrant call";
        return EscrowResult::Fail(EscrowError::REENTRANT_CALL,
                                  std::string(operation) + " called during another operation");
    }

    std::lock_guard<std::mutex> lock(writeMutex_);
    writer_.store(std::this_thread::get_id());
    struct WriterReset {
        std::atomic<std::thread::id>& writer;
        ~WriterReset() { writer.store(std::thread::id()); }
    } reset{writer_};

    EscrowResult result;
    try {
        result = body(clock_->Now());
    } catch (const EscrowException& e) {
        result = EscrowResult::Fail(e.code(), e.what());
    } catch (const ArithmeticError& e) {
        result = EscrowResult::Fail(EscrowError::ARITHMETIC_OVERFLOW, e.what());
    }

    if (!result.ok()) {
        LOG_DEBUG(util::LogCategory::ESCROW) << operation << " rejected: " << result.ToString();
    }
    return result;
}

EscrowResult VotingEscrow::CheckOrigin(const Caller& caller) const {
    if (!caller.isContract) {
        return EscrowResult::Ok();
    }

    std::shared_ptr<IContractChecker> checker;
    {
        std::lock_guard<std::mutex> lock(checkerMutex_);
        checker = checker_;
    }
    if (checker && checker->IsAllowed(caller.account)) {
        return EscrowResult::Ok();
    }
    return EscrowResult::Fail(EscrowError::CONTRACT_NOT_ALLOWED,
                              "contract " + caller.account.ToHex() + " is not allowed to lock");
}

EscrowResult VotingEscrow::CheckUnlockTime(Timestamp rounded, Timestamp lowerBound,
                                           const BlockContext& now, EscrowError tooEarly) const {
    if (rounded <= lowerBound) {
        return EscrowResult::Fail(tooEarly, "unlock time " + std::to_string(rounded) +
                                            " must be after " + std::to_string(lowerBound));
    }
    Timestamp latest = CheckedAdd(now.time, params_.maxLockDuration);
    if (rounded > latest) {
        return EscrowResult::Fail(EscrowError::UNLOCK_TIME_TOO_FAR,
                                  "unlock time " + std::to_string(rounded) +
                                  " is past the maximum " + std::to_string(latest));
    }
    return EscrowResult::Ok();
}

EscrowResult VotingEscrow::Commit(const BlockContext& now, const Transition& transition) {
    ChangeSet changes = engine_.Checkpoint(state_, now, transition.account,
                                           transition.oldLock, transition.newLock);

    const Amount previousSupply = state_.supply;
    Amount newSupply = previousSupply;
    if (transition.account) {
        newSupply = CheckedAdd(previousSupply, transition.supplyDelta);
        if (!MoneyRange(newSupply)) {
            return EscrowResult::Fail(EscrowError::AMOUNT_OUT_OF_RANGE,
                                      "locked supply would reach " + std::to_string(newSupply));
        }
        changes.newLock = transition.newLock;
        changes.newSupply = newSupply;
    }

    if (changes.Empty()) {
        LOG_DEBUG(util::LogCategory::CHECKPOINT) << "Ledger already at " << now.time;
        return EscrowResult::Ok();
    }

    if (store_) {
        db::Status status = store_->Write(changes, state_);
        if (!status.ok()) {
            return EscrowResult::Fail(EscrowError::STORAGE_FAILURE, status.ToString());
        }
    }

    if (transition.direction != TransferDirection::NONE && transition.transferAmount > 0) {
        bool moved = false;
        std::string reason = "asset mover refused";
        try {
            moved = transition.direction == TransferDirection::IN
                ? mover_->MoveIn(transition.party, transition.transferAmount)
                : mover_->MoveOut(transition.party, transition.transferAmount);
        } catch (const std::exception& e) {
            reason = std::string("asset mover threw: ") + e.what();
        }

        if (!moved) {
            LOG_WARN(util::LogCategory::ESCROW)
                << "Transfer of " << transition.transferAmount << " for "
                << transition.party.ToHex() << " failed: " << reason;
            if (store_) {
                db::Status status = store_->Revert(changes, state_);
                if (!status.ok()) {
                    return EscrowResult::Fail(EscrowError::STORAGE_FAILURE,
                                              reason + "; revert failed: " + status.ToString());
                }
            }
            return EscrowResult::Fail(EscrowError::ASSET_TRANSFER_FAILED, reason);
        }
    }

    {
        std::unique_lock<std::shared_mutex> lock(stateMutex_);
        ApplyChangeSet(state_, changes);
    }

    Notify(transition, previousSupply, newSupply);
    return EscrowResult::Ok();
}

void VotingEscrow::Notify(const Transition& transition, Amount previousSupply, Amount newSupply) {
    DepositCallback onDeposit;
    WithdrawCallback onWithdraw;
    SupplyCallback onSupply;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        onDeposit = depositCallback_;
        onWithdraw = withdrawCallback_;
        onSupply = supplyCallback_;
    }

    if (transition.deposit) {
        LOG_INFO(util::LogCategory::ESCROW) << transition.deposit->ToString();
        Deliver(onDeposit, *transition.deposit, "Deposit");
    }
    if (transition.withdraw) {
        LOG_INFO(util::LogCategory::ESCROW) << transition.withdraw->ToString();
        Deliver(onWithdraw, *transition.withdraw, "Withdraw");
    }
    if (transition.deposit || transition.withdraw) {
        Deliver(onSupply, SupplyEvent{previousSupply, newSupply}, "Supply");
    }
}

// ============================================================================
// Lifecycle Operations
// ============================================================================

EscrowResult VotingEscrow::CreateLock(const Caller& caller, Amount amount, Timestamp unlockTime) {
    return RunWrite("CreateLock", [&](const BlockContext& now) {
        EscrowResult check = CheckOrigin(caller);
        if (!check.ok()) return check;
        check = CheckAmount(amount);
        if (!check.ok()) return check;

        LockedBalance oldLock = state_.GetLock(caller.account);
        if (oldLock.amount != 0) {
            return EscrowResult::Fail(EscrowError::LOCK_EXISTS,
                                      "withdraw the existing lock first");
        }

        Timestamp rounded = params_.FloorToUnit(unlockTime);
        check = CheckUnlockTime(rounded, now.time, now, EscrowError::UNLOCK_TIME_NOT_FUTURE);
        if (!check.ok()) return check;

        Transition t;
        t.account = caller.account;
        t.oldLock = oldLock;
        t.newLock = LockedBalance(amount, rounded);
        t.supplyDelta = amount;
        t.direction = TransferDirection::IN;
        t.party = caller.account;
        t.transferAmount = amount;
        t.deposit = DepositEvent{caller.account, caller.account, amount, rounded,
                                 DepositType::CREATE_LOCK, now.time};
        return Commit(now, t);
    });
}

EscrowResult VotingEscrow::IncreaseAmount(const Caller& caller, Amount amount) {
    return RunWrite("IncreaseAmount", [&](const BlockContext& now) {
        EscrowResult check = CheckOrigin(caller);
        if (!check.ok()) return check;
        check = CheckAmount(amount);
        if (!check.ok()) return check;

        LockedBalance oldLock = state_.GetLock(caller.account);
        if (oldLock.amount == 0) {
            return EscrowResult::Fail(EscrowError::NO_EXISTING_LOCK, "no lock to increase");
        }
        if (oldLock.end <= now.time) {
            return EscrowResult::Fail(EscrowError::LOCK_EXPIRED,
                                      "cannot add to an expired lock; withdraw first");
        }

        Amount total = CheckedAdd(oldLock.amount, amount);
        if (!MoneyRange(total)) {
            return EscrowResult::Fail(EscrowError::AMOUNT_OUT_OF_RANGE,
                                      "locked amount would reach " + std::to_string(total));
        }

        Transition t;
        t.account = caller.account;
        t.oldLock = oldLock;
        t.newLock = LockedBalance(total, oldLock.end);
        t.supplyDelta = amount;
        t.direction = TransferDirection::IN;
        t.party = caller.account;
        t.transferAmount = amount;
        t.deposit = DepositEvent{caller.account, caller.account, amount, oldLock.end,
                                 DepositType::INCREASE_LOCK_AMOUNT, now.time};
        return Commit(now, t);
    });
}

EscrowResult VotingEscrow::IncreaseUnlockTime(const Caller& caller, Timestamp unlockTime) {
    return RunWrite("IncreaseUnlockTime", [&](const BlockContext& now) {
        EscrowResult check = CheckOrigin(caller);
        if (!check.ok()) return check;

        LockedBalance oldLock = state_.GetLock(caller.account);
        if (oldLock.amount == 0) {
            return EscrowResult::Fail(EscrowError::NO_EXISTING_LOCK, "nothing is locked");
        }
        if (oldLock.end <= now.time) {
            return EscrowResult::Fail(EscrowError::LOCK_EXPIRED, "lock has expired");
        }

        Timestamp rounded = params_.FloorToUnit(unlockTime);
        check = CheckUnlockTime(rounded, oldLock.end, now, EscrowError::UNLOCK_TIME_NOT_EXTENDED);
        if (!check.ok()) return check;

        Transition t;
        t.account = caller.account;
        t.oldLock = oldLock;
        t.newLock = LockedBalance(oldLock.amount, rounded);
        t.deposit = DepositEvent{caller.account, caller.account, 0, rounded,
                                 DepositType::INCREASE_UNLOCK_TIME, now.time};
        return Commit(now, t);
    });
}

EscrowResult VotingEscrow::DepositFor(const Caller& caller, const Address& account, Amount amount) {
    return RunWrite("DepositFor", [&](const BlockContext& now) {
        EscrowResult check = CheckAmount(amount);
        if (!check.ok()) return check;

        LockedBalance oldLock = state_.GetLock(account);
        if (oldLock.amount == 0) {
            return EscrowResult::Fail(EscrowError::NO_EXISTING_LOCK,
                                      "no lock found for " + account.ToHex());
        }
        if (oldLock.end <= now.time) {
            return EscrowResult::Fail(EscrowError::LOCK_EXPIRED,
                                      "cannot add to an expired lock");
        }

        Amount total = CheckedAdd(oldLock.amount, amount);
        if (!MoneyRange(total)) {
            return EscrowResult::Fail(EscrowError::AMOUNT_OUT_OF_RANGE,
                                      "locked amount would reach " + std::to_string(total));
        }

        Transition t;
        t.account = account;
        t.oldLock = oldLock;
        t.newLock = LockedBalance(total, oldLock.end);
        t.supplyDelta = amount;
        t.direction = TransferDirection::IN;
        t.party = caller.account;
        t.transferAmount = amount;
        t.deposit = DepositEvent{account, caller.account, amount, oldLock.end,
                                 DepositType::DEPOSIT_FOR, now.time};
        return Commit(now, t);
    });
}

EscrowResult VotingEscrow::Withdraw(const Caller& caller) {
    return RunWrite("Withdraw", [&](const BlockContext& now) {
        LockedBalance oldLock = state_.GetLock(caller.account);
        if (oldLock.amount == 0) {
            return EscrowResult::Fail(EscrowError::NO_EXISTING_LOCK, "nothing to withdraw");
        }
        if (oldLock.end > now.time) {
            return EscrowResult::Fail(EscrowError::LOCK_NOT_EXPIRED,
                                      "lock ends at " + std::to_string(oldLock.end));
        }

        Transition t;
        t.account = caller.account;
        t.oldLock = oldLock;
        t.newLock = LockedBalance();
        t.supplyDelta = -oldLock.amount;
        t.direction = TransferDirection::OUT;
        t.party = caller.account;
        t.transferAmount = oldLock.amount;
        t.withdraw = WithdrawEvent{caller.account, oldLock.amount, now.time};
        return Commit(now, t);
    });
}

EscrowResult VotingEscrow::Checkpoint() {
    return RunWrite("Checkpoint", [&](const BlockContext& now) {
        return Commit(now, Transition());
    });
}

// ============================================================================
// Queries
// ============================================================================

Power VotingEscrow::PowerOf(const Address& account) const {
    return PowerOf(account, clock_->Now().time);
}

Power VotingEscrow::PowerOf(const Address& account, Timestamp t) const {
    std::shared_lock<std::shared_mutex> lock(stateMutex_);
    return queries_.PowerOf(state_, account, t);
}

std::optional<Power> VotingEscrow::PowerOfAt(const Address& account, BlockHeight marker) const {
    BlockContext now = clock_->Now();
    std::shared_lock<std::shared_mutex> lock(stateMutex_);
    return queries_.PowerOfAt(state_, account, marker, now);
}

Power VotingEscrow::TotalPower() const {
    return TotalPower(clock_->Now().time);
}

Power VotingEscrow::TotalPower(Timestamp t) const {
    std::shared_lock<std::shared_mutex> lock(stateMutex_);
    return queries_.TotalPower(state_, t);
}

std::optional<Power> VotingEscrow::TotalPowerAt(BlockHeight marker) const {
    BlockContext now = clock_->Now();
    std::shared_lock<std::shared_mutex> lock(stateMutex_);
    return queries_.TotalPowerAt(state_, marker, now);
}

// ============================================================================
// Observable State
// ============================================================================

LockedBalance VotingEscrow::GetLock(const Address& account) const {
    std::shared_lock<std::shared_mutex> lock(stateMutex_);
    return state_.GetLock(account);
}

Timestamp VotingEscrow::LockedEnd(const Address& account) const {
    return GetLock(account).end;
}

LockState VotingEscrow::GetLockState(const Address& account) const {
    return ClassifyLock(GetLock(account), clock_->Now().time);
}

uint64_t VotingEscrow::Epoch() const {
    std::shared_lock<std::shared_mutex> lock(stateMutex_);
    return state_.Epoch();
}

uint64_t VotingEscrow::UserEpoch(const Address& account) const {
    std::shared_lock<std::shared_mutex> lock(stateMutex_);
    return state_.UserEpoch(account);
}

std::optional<Point> VotingEscrow::GetGlobalPoint(uint64_t epoch) const {
    std::shared_lock<std::shared_mutex> lock(stateMutex_);
    if (epoch >= state_.globalHistory.size()) {
        return std::nullopt;
    }
    return state_.globalHistory[epoch];
}

std::optional<Point> VotingEscrow::GetUserPoint(const Address& account, uint64_t epoch) const {
    std::shared_lock<std::shared_mutex> lock(stateMutex_);
    const std::vector<Point>* history = state_.GetUserHistory(account);
    if (!history || epoch >= history->size()) {
        return std::nullopt;
    }
    return (*history)[epoch];
}

Power VotingEscrow::GetLastUserSlope(const Address& account) const {
    std::shared_lock<std::shared_mutex> lock(stateMutex_);
    auto point = state_.LatestUserPoint(account);
    return point ? point->slope : 0;
}

Timestamp VotingEscrow::GetUserPointTimestamp(const Address& account, uint64_t epoch) const {
    auto point = GetUserPoint(account, epoch);
    return point ? point->ts : 0;
}

Power VotingEscrow::GetSlopeChange(Timestamp ts) const {
    std::shared_lock<std::shared_mutex> lock(stateMutex_);
    return state_.GetSlopeChange(ts);
}

Amount VotingEscrow::Supply() const {
    std::shared_lock<std::shared_mutex> lock(stateMutex_);
    return state_.supply;
}

Hash256 VotingEscrow::GetStateDigest() const {
    std::shared_lock<std::shared_mutex> lock(stateMutex_);
    return state_.Digest();
}

LedgerState VotingEscrow::Snapshot() const {
    std::shared_lock<std::shared_mutex> lock(stateMutex_);
    return state_;
}

// ============================================================================
// Collaborators and Callbacks
// ============================================================================

void VotingEscrow::SetContractChecker(std::shared_ptr<IContractChecker> checker) {
    std::lock_guard<std::mutex> lock(checkerMutex_);
    checker_ = std::move(checker);
}

void VotingEscrow::SetDepositCallback(DepositCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    depositCallback_ = std::move(callback);
}

void VotingEscrow::SetWithdrawCallback(WithdrawCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    withdrawCallback_ = std::move(callback);
}

void VotingEscrow::SetSupplyCallback(SupplyCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    supplyCallback_ = std::move(callback);
}

} // namespace escrow
} // namespace vescrow
