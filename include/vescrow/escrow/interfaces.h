// VESCROW - Escrow Collaborators
// Copyright (c) 2024 VESCROW Developers
// MIT License
//
// Interfaces the ledger depends on but does not implement: moving the
// locked asset, deciding whether a contract may lock, and reading the
// external clock.

#ifndef VESCROW_ESCROW_INTERFACES_H
#define VESCROW_ESCROW_INTERFACES_H

#include "vescrow/core/types.h"

#include <map>
#include <mutex>
#include <set>
#include <utility>

namespace vescrow {
namespace escrow {

// ============================================================================
// Context Types
// ============================================================================

/// External (time, sequence marker) pair observed at the start of an operation
struct BlockContext {
    Timestamp time{0};
    BlockHeight height{0};

    BlockContext() = default;
    BlockContext(Timestamp timeIn, BlockHeight heightIn) : time(timeIn), height(heightIn) {}
};

/// Who invoked an operation
struct Caller {
    Address account;
    /// Set when the call originates from a contract rather than a key holder
    bool isContract{false};

    static Caller External(const Address& account) { return Caller{account, false}; }
    static Caller Contract(const Address& account) { return Caller{account, true}; }
};

// ============================================================================
// Collaborator Interfaces
// ============================================================================

/// Moves the locked asset between accounts and the escrow
class IAssetMover {
public:
    virtual ~IAssetMover() = default;

    /// Pull amount from an account into the escrow; false on failure
    virtual bool MoveIn(const Address& from, Amount amount) = 0;

    /// Release amount from the escrow to an account; false on failure
    virtual bool MoveOut(const Address& to, Amount amount) = 0;
};

/// Allow-list for contract callers
class IContractChecker {
public:
    virtual ~IContractChecker() = default;
    virtual bool IsAllowed(const Address& account) const = 0;
};

/// Source of the current (time, marker)
class IChainClock {
public:
    virtual ~IChainClock() = default;
    virtual BlockContext Now() const = 0;
};

// ============================================================================
// Stock Implementations
// ============================================================================

/// Clock driven by hand, for tests and script replay
class ManualChainClock : public IChainClock {
public:
    explicit ManualChainClock(BlockContext start = BlockContext());

    BlockContext Now() const override;

    void Set(const BlockContext& now);

    /// Move forward by seconds and blocks
    void Advance(Timestamp seconds, BlockHeight blocks);

private:
    mutable std::mutex mutex_;
    BlockContext now_;
};

/**
 * Wall-clock time (util::GetTime, so mock time applies) with the marker
 * derived as (time - genesisTime) / blockInterval.
 */
class SystemChainClock : public IChainClock {
public:
    SystemChainClock(Timestamp genesisTime, Timestamp blockInterval);

    BlockContext Now() const override;

private:
    Timestamp genesisTime_;
    Timestamp blockInterval_;
};

/// Fixed allow-list of contract accounts
class StaticContractChecker : public IContractChecker {
public:
    StaticContractChecker() = default;
    explicit StaticContractChecker(std::set<Address> allowed);

    bool IsAllowed(const Address& account) const override;

    void Allow(const Address& account);
    void Revoke(const Address& account);

private:
    mutable std::mutex mutex_;
    std::set<Address> allowed_;
};

/**
 * In-process balance book. MoveIn fails when the account holds less than
 * the amount; MoveOut fails when the escrow holds less.
 */
class InMemoryAssetMover : public IAssetMover {
public:
    bool MoveIn(const Address& from, Amount amount) override;
    bool MoveOut(const Address& to, Amount amount) override;

    /// Give an account spendable balance
    bool Credit(const Address& account, Amount amount);

    Amount BalanceOf(const Address& account) const;

    /// Total currently held by the escrow
    Amount Escrowed() const;

private:
    mutable std::mutex mutex_;
    std::map<Address, Amount> balances_;
    Amount escrowed_{0};
};

} // namespace escrow
} // namespace vescrow

#endif // VESCROW_ESCROW_INTERFACES_H
