// VESCROW - Voting Escrow
// Copyright (c) 2024 VESCROW Developers
// MIT License
//
// The vote-escrow ledger. Accounts lock the asset until a future,
// unit-rounded time and receive voting power that decays linearly to zero
// at the unlock time. Mutations are serialized by a single writer; queries
// run concurrently against a consistent snapshot.

#ifndef VESCROW_ESCROW_VOTING_ESCROW_H
#define VESCROW_ESCROW_VOTING_ESCROW_H

#include "vescrow/core/types.h"
#include "vescrow/escrow/checkpoint.h"
#include "vescrow/escrow/errors.h"
#include "vescrow/escrow/events.h"
#include "vescrow/escrow/interfaces.h"
#include "vescrow/escrow/ledger_store.h"
#include "vescrow/escrow/params.h"
#include "vescrow/escrow/point.h"
#include "vescrow/escrow/query.h"
#include "vescrow/escrow/state.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace vescrow {
namespace escrow {

class VotingEscrow {
public:
    /**
     * In-memory ledger seeded at the clock's current (time, marker).
     * @throws std::invalid_argument on invalid params or missing collaborators
     */
    VotingEscrow(const EscrowParams& params,
                 std::shared_ptr<IChainClock> clock,
                 std::shared_ptr<IAssetMover> mover);

    /**
     * Ledger backed by a store. A fresh store is seeded at the clock's
     * current (time, marker); an existing one is loaded and must have been
     * written with the same params.
     */
    static std::pair<EscrowResult, std::unique_ptr<VotingEscrow>> Open(
        const EscrowParams& params,
        std::shared_ptr<IChainClock> clock,
        std::shared_ptr<IAssetMover> mover,
        std::shared_ptr<LedgerStore> store);

    ~VotingEscrow();

    VotingEscrow(const VotingEscrow&) = delete;
    VotingEscrow& operator=(const VotingEscrow&) = delete;

    // ========================================================================
    // Lifecycle Operations
    // ========================================================================

    /// Lock amount until unlockTime (rounded down to the lock unit)
    EscrowResult CreateLock(const Caller& caller, Amount amount, Timestamp unlockTime);

    /// Add amount to the caller's active lock without changing its end
    EscrowResult IncreaseAmount(const Caller& caller, Amount amount);

    /// Move the caller's unlock time later (rounded down to the lock unit)
    EscrowResult IncreaseUnlockTime(const Caller& caller, Timestamp unlockTime);

    /// Add amount, paid by caller, to account's active lock
    EscrowResult DepositFor(const Caller& caller, const Address& account, Amount amount);

    /// Release the caller's expired lock
    EscrowResult Withdraw(const Caller& caller);

    /// Bring the global curve up to the current time
    EscrowResult Checkpoint();

    // ========================================================================
    // Queries
    // ========================================================================

    Power PowerOf(const Address& account) const;
    Power PowerOf(const Address& account, Timestamp t) const;

    /// nullopt when marker is in the future
    std::optional<Power> PowerOfAt(const Address& account, BlockHeight marker) const;

    Power TotalPower() const;
    Power TotalPower(Timestamp t) const;

    /// nullopt when marker is in the future
    std::optional<Power> TotalPowerAt(BlockHeight marker) const;

    // ========================================================================
    // Observable State
    // ========================================================================

    LockedBalance GetLock(const Address& account) const;
    Timestamp LockedEnd(const Address& account) const;
    LockState GetLockState(const Address& account) const;

    uint64_t Epoch() const;
    uint64_t UserEpoch(const Address& account) const;

    std::optional<Point> GetGlobalPoint(uint64_t epoch) const;
    std::optional<Point> GetUserPoint(const Address& account, uint64_t epoch) const;

    /// Slope of the account's latest point (0 if none)
    Power GetLastUserSlope(const Address& account) const;

    /// Timestamp of the account's point at epoch (0 if none)
    Timestamp GetUserPointTimestamp(const Address& account, uint64_t epoch) const;

    /// Scheduled slope delta at ts
    Power GetSlopeChange(Timestamp ts) const;

    /// Total locked amount
    Amount Supply() const;

    /// SHA-256 of the canonical state serialization
    Hash256 GetStateDigest() const;

    /// Copy of the full state
    LedgerState Snapshot() const;

    const EscrowParams& GetParams() const { return params_; }

    // ========================================================================
    // Collaborators and Callbacks
    // ========================================================================

    /// Replace the allow-list for contract callers; nullptr refuses all contracts
    void SetContractChecker(std::shared_ptr<IContractChecker> checker);

    void SetDepositCallback(DepositCallback callback);
    void SetWithdrawCallback(WithdrawCallback callback);
    void SetSupplyCallback(SupplyCallback callback);

private:
    VotingEscrow(const EscrowParams& params,
                 std::shared_ptr<IChainClock> clock,
                 std::shared_ptr<IAssetMover> mover,
                 std::shared_ptr<LedgerStore> store,
                 LedgerState state);

    enum class TransferDirection { NONE, IN, OUT };

    /// A finished transition waiting to be committed
    struct Transition {
        std::optional<Address> account;
        LockedBalance oldLock;
        LockedBalance newLock;
        Amount supplyDelta{0};

        TransferDirection direction{TransferDirection::NONE};
        Address party;
        Amount transferAmount{0};

        std::optional<DepositEvent> deposit;
        std::optional<WithdrawEvent> withdraw;
    };

    /// Single-writer wrapper: re-entrancy guard, write lock, exception mapping
    template<typename Func>
    EscrowResult RunWrite(const char* operation, Func&& body);

    /// Checkpoint, persist, move tokens, apply, notify
    EscrowResult Commit(const BlockContext& now, const Transition& transition);

    EscrowResult CheckOrigin(const Caller& caller) const;

    /// Shared validation of a requested unlock time (already rounded)
    EscrowResult CheckUnlockTime(Timestamp rounded, Timestamp lowerBound,
                                 const BlockContext& now, EscrowError tooEarly) const;

    void Notify(const Transition& transition, Amount previousSupply, Amount newSupply);

    EscrowParams params_;
    CheckpointEngine engine_;
    QueryEngine queries_;

    std::shared_ptr<IChainClock> clock_;
    std::shared_ptr<IAssetMover> mover_;
    std::shared_ptr<LedgerStore> store_;

    mutable std::mutex checkerMutex_;
    std::shared_ptr<IContractChecker> checker_;

    mutable std::mutex callbackMutex_;
    DepositCallback depositCallback_;
    WithdrawCallback withdrawCallback_;
    SupplyCallback supplyCallback_;

    /// Serializes mutating operations
    std::mutex writeMutex_;
    /// Thread currently inside a mutating operation
    std::atomic<std::thread::id> writer_{};

    /// Guards state_ against readers while a change set is applied
    mutable std::shared_mutex stateMutex_;
    LedgerState state_;
};

} // namespace escrow
} // namespace vescrow

#endif // VESCROW_ESCROW_VOTING_ESCROW_H
