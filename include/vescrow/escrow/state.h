// VESCROW - Ledger State
// Copyright (c) 2024 VESCROW Developers
// MIT License
//
// Everything the ledger remembers: the lock of every account, the global
// and per-account point histories, the slope-change schedule and the
// locked supply. Histories are append-only; locks are zeroed, never erased.

#ifndef VESCROW_ESCROW_STATE_H
#define VESCROW_ESCROW_STATE_H

#include "vescrow/core/types.h"
#include "vescrow/escrow/interfaces.h"
#include "vescrow/escrow/point.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace vescrow {
namespace escrow {

// ============================================================================
// Lock State
// ============================================================================

enum class LockState {
    NO_LOCK,    // Nothing locked (never locked, or withdrawn)
    ACTIVE,     // Locked and end is in the future
    EXPIRED,    // Locked but end has passed; withdrawable
};

const char* LockStateToString(LockState state);

/// Classify a lock at time now
LockState ClassifyLock(const LockedBalance& lock, Timestamp now);

// ============================================================================
// Ledger State
// ============================================================================

struct LedgerState {
    /// Index is the global epoch; entry 0 is the genesis point
    std::vector<Point> globalHistory;

    /// Per-account histories; index 0 is an unused zero point
    std::map<Address, std::vector<Point>> userHistory;

    std::map<Address, LockedBalance> locks;

    /// Rounded expiry -> signed slope delta applied when the sweep crosses it
    std::map<Timestamp, Power> slopeChanges;

    /// Sum of all locked amounts
    Amount supply{0};

    /// Start a fresh ledger with a zero point at genesis
    void Seed(const BlockContext& genesis);

    bool IsSeeded() const { return !globalHistory.empty(); }

    /// Latest global epoch (0 for a fresh ledger)
    uint64_t Epoch() const;

    /// Latest per-account epoch (0 if the account never locked)
    uint64_t UserEpoch(const Address& account) const;

    /// Latest global point; requires a seeded ledger
    const Point& LatestGlobal() const;

    /// Latest real point of an account, if any
    std::optional<Point> LatestUserPoint(const Address& account) const;

    LockedBalance GetLock(const Address& account) const;

    /// Scheduled delta at ts (0 when nothing is scheduled)
    Power GetSlopeChange(Timestamp ts) const;

    /// History of an account or nullptr
    const std::vector<Point>* GetUserHistory(const Address& account) const;

    void Clear();

    /// SHA-256 over the canonical serialization
    Hash256 Digest() const;

    std::string ToString() const;

    bool operator==(const LedgerState& other) const;
    bool operator!=(const LedgerState& other) const { return !(*this == other); }

    template<typename Stream>
    void Serialize(Stream& s) const {
        WriteCompactSize(s, globalHistory.size());
        for (const auto& point : globalHistory) {
            point.Serialize(s);
        }

        WriteCompactSize(s, userHistory.size());
        for (const auto& entry : userHistory) {
            ::vescrow::Serialize(s, entry.first);
            WriteCompactSize(s, entry.second.size());
            for (const auto& point : entry.second) {
                point.Serialize(s);
            }
        }

        WriteCompactSize(s, locks.size());
        for (const auto& entry : locks) {
            ::vescrow::Serialize(s, entry.first);
            entry.second.Serialize(s);
        }

        WriteCompactSize(s, slopeChanges.size());
        for (const auto& entry : slopeChanges) {
            ::vescrow::Serialize(s, entry.first);
            ::vescrow::Serialize(s, entry.second);
        }

        ::vescrow::Serialize(s, supply);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        Clear();

        uint64_t count = ReadCompactSize(s);
        globalHistory.resize(count);
        for (auto& point : globalHistory) {
            point.Unserialize(s);
        }

        count = ReadCompactSize(s);
        for (uint64_t i = 0; i < count; ++i) {
            Address account;
            ::vescrow::Unserialize(s, account);
            auto& history = userHistory[account];
            history.resize(ReadCompactSize(s));
            for (auto& point : history) {
                point.Unserialize(s);
            }
        }

        count = ReadCompactSize(s);
        for (uint64_t i = 0; i < count; ++i) {
            Address account;
            ::vescrow::Unserialize(s, account);
            locks[account].Unserialize(s);
        }

        count = ReadCompactSize(s);
        for (uint64_t i = 0; i < count; ++i) {
            Timestamp ts;
            Power delta;
            ::vescrow::Unserialize(s, ts);
            ::vescrow::Unserialize(s, delta);
            slopeChanges[ts] = delta;
        }

        ::vescrow::Unserialize(s, supply);
    }
};

} // namespace escrow
} // namespace vescrow

#endif // VESCROW_ESCROW_STATE_H
