// VESCROW - Checkpoint Engine
// Copyright (c) 2024 VESCROW Developers
// MIT License
//
// Brings the global curve forward to the current time one lock-unit bucket
// at a time, applying scheduled slope changes, then folds in the change of
// a single account's lock. The result is a ChangeSet; nothing is written
// until the caller applies it.

#ifndef VESCROW_ESCROW_CHECKPOINT_H
#define VESCROW_ESCROW_CHECKPOINT_H

#include "vescrow/core/types.h"
#include "vescrow/escrow/interfaces.h"
#include "vescrow/escrow/params.h"
#include "vescrow/escrow/point.h"
#include "vescrow/escrow/state.h"

#include <map>
#include <optional>
#include <vector>

namespace vescrow {
namespace escrow {

// ============================================================================
// Change Set
// ============================================================================

/// Everything one ledger transition writes
struct ChangeSet {
    /// Global points appended after the current epoch, in order
    std::vector<Point> globalPoints;

    /// Account touched by the transition, if any
    std::optional<Address> account;

    /// Next point of account
    Point userPoint;

    /// New absolute values of schedule entries
    std::map<Timestamp, Power> slopeWrites;

    /// New lock of account
    std::optional<LockedBalance> newLock;

    /// New locked supply
    std::optional<Amount> newSupply;

    bool Empty() const {
        return globalPoints.empty() && !account && slopeWrites.empty() &&
               !newLock && !newSupply;
    }
};

// ============================================================================
// Checkpoint Engine
// ============================================================================

class CheckpointEngine {
public:
    explicit CheckpointEngine(const EscrowParams& params);

    /**
     * Compute the change set for moving the ledger to now, optionally
     * replacing account's lock oldLock with newLock.
     *
     * Without an account this is a global sync; it returns an empty change
     * set when the latest global point already carries now.time.
     *
     * @throws EscrowException CLOCK_REGRESSION if now precedes the latest
     *         global point, SWEEP_LIMIT_EXCEEDED if more than
     *         maxSweepBuckets buckets would be crossed
     * @throws ArithmeticError on overflow
     */
    ChangeSet Checkpoint(const LedgerState& state,
                         const BlockContext& now,
                         const std::optional<Address>& account,
                         const LockedBalance& oldLock,
                         const LockedBalance& newLock) const;

    /// Global sync only
    ChangeSet Checkpoint(const LedgerState& state, const BlockContext& now) const {
        return Checkpoint(state, now, std::nullopt, LockedBalance(), LockedBalance());
    }

    /**
     * Total power at t, swept forward from point through the schedule.
     * For t before point.ts the point is extrapolated backwards.
     */
    Power SupplyAt(const LedgerState& state, const Point& point, Timestamp t) const;

    const EscrowParams& GetParams() const { return params_; }

private:
    EscrowParams params_;
};

/// Apply a finished change set
void ApplyChangeSet(LedgerState& state, const ChangeSet& changes);

} // namespace escrow
} // namespace vescrow

#endif // VESCROW_ESCROW_CHECKPOINT_H
