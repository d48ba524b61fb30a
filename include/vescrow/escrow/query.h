// VESCROW - Voting Power Queries
// Copyright (c) 2024 VESCROW Developers
// MIT License

#ifndef VESCROW_ESCROW_QUERY_H
#define VESCROW_ESCROW_QUERY_H

#include "vescrow/core/types.h"
#include "vescrow/escrow/checkpoint.h"
#include "vescrow/escrow/interfaces.h"
#include "vescrow/escrow/params.h"
#include "vescrow/escrow/point.h"
#include "vescrow/escrow/state.h"

#include <cstdint>
#include <optional>
#include <vector>

namespace vescrow {
namespace escrow {

/// Upper bound on binary search halvings; history indices are u64
constexpr int MAX_SEARCH_ITERATIONS = 64;

/**
 * Read-only voting power lookups over a LedgerState.
 *
 * Point-in-time queries extrapolate the latest point; historical queries
 * binary-search the histories by timestamp or by marker. Marker queries
 * translate the marker into an estimated time using the marker/time ratio
 * of the global curve around the bounding epoch.
 */
class QueryEngine {
public:
    explicit QueryEngine(const EscrowParams& params);

    /// Power of account at time t
    Power PowerOf(const LedgerState& state, const Address& account, Timestamp t) const;

    /// Power of account at a past marker; nullopt if marker > now.height
    std::optional<Power> PowerOfAt(const LedgerState& state, const Address& account,
                                   BlockHeight marker, const BlockContext& now) const;

    /// Total power at time t
    Power TotalPower(const LedgerState& state, Timestamp t) const;

    /// Total power at a past marker; nullopt if marker > now.height
    std::optional<Power> TotalPowerAt(const LedgerState& state, BlockHeight marker,
                                      const BlockContext& now) const;

    /// Largest index in [lo, hi] whose point has marker <= marker (lo if none)
    static uint64_t FindByMarker(const std::vector<Point>& history, BlockHeight marker,
                                 uint64_t lo, uint64_t hi);

    /// Largest index in [lo, hi] whose point has ts <= t (lo if none)
    static uint64_t FindByTime(const std::vector<Point>& history, Timestamp t,
                               uint64_t lo, uint64_t hi);

private:
    /// Estimated time of marker within the global epoch that bounds it
    Timestamp EstimateTime(const LedgerState& state, uint64_t epoch,
                           BlockHeight marker, const BlockContext& now) const;

    CheckpointEngine engine_;
};

} // namespace escrow
} // namespace vescrow

#endif // VESCROW_ESCROW_QUERY_H
