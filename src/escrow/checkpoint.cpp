// VESCROW - Checkpoint Engine
// Copyright (c) 2024 VESCROW Developers
// MIT License

#include "vescrow/escrow/checkpoint.h"
#include "vescrow/escrow/errors.h"
#include "vescrow/core/arith.h"
#include "vescrow/util/logging.h"

namespace vescrow {
namespace escrow {

namespace {

Power Elapsed(Timestamp from, Timestamp to) {
    return static_cast<Power>(to) - static_cast<Power>(from);
}

} // namespace

CheckpointEngine::CheckpointEngine(const EscrowParams& params) : params_(params) {}

ChangeSet CheckpointEngine::Checkpoint(const LedgerState& state,
                                       const BlockContext& now,
                                       const std::optional<Address>& account,
                                       const LockedBalance& oldLock,
                                       const LockedBalance& newLock) const {
    ChangeSet changes;
    const uint64_t epoch = state.Epoch();

    if (state.IsSeeded()) {
        const Point& latest = state.LatestGlobal();
        if (now.time < latest.ts || now.height < latest.marker) {
            throw EscrowException(EscrowError::CLOCK_REGRESSION,
                "clock at (" + std::to_string(now.time) + ", " + std::to_string(now.height) +
                ") precedes latest point (" + std::to_string(latest.ts) + ", " +
                std::to_string(latest.marker) + ")");
        }
        if (!account && epoch > 0 && latest.ts == now.time) {
            return changes;
        }
    }

    const Timestamp maxLock = params_.maxLockDuration;

    Point uOld;
    Point uNew;
    Power oldDSlope = 0;
    Power newDSlope = 0;

    if (account) {
        uOld = CurveFor(oldLock, now.time, maxLock);
        uNew = CurveFor(newLock, now.time, maxLock);

        oldDSlope = state.GetSlopeChange(oldLock.end);
        if (newLock.end != 0) {
            newDSlope = newLock.end == oldLock.end ? oldDSlope
                                                   : state.GetSlopeChange(newLock.end);
        }
    }

    Point last(0, 0, now.time, now.height);
    if (epoch > 0) {
        last = state.globalHistory[epoch];
    }
    const Point initial = last;
    Timestamp lastCheckpoint = last.ts;

    // Marker advance per second, so intermediate points get estimated markers
    Power blockSlope = 0;
    if (now.time > last.ts) {
        Power markers = static_cast<Power>(now.height) - static_cast<Power>(last.marker);
        blockSlope = CheckedMul(MARKER_SCALE, markers) / Elapsed(last.ts, now.time);
    }

    Timestamp ti = params_.FloorToUnit(lastCheckpoint);
    for (uint64_t i = 0;; ++i) {
        if (i >= params_.maxSweepBuckets) {
            throw EscrowException(EscrowError::SWEEP_LIMIT_EXCEEDED,
                "checkpoint would cross more than " + std::to_string(params_.maxSweepBuckets) +
                " buckets (last point at " + std::to_string(initial.ts) + ")");
        }

        ti = CheckedAdd(ti, params_.lockUnit);
        Power dSlope = 0;
        if (ti > now.time) {
            ti = now.time;
        } else {
            dSlope = state.GetSlopeChange(ti);
        }

        last.bias = CheckedSub(last.bias, CheckedMul(last.slope, Elapsed(lastCheckpoint, ti)));
        last.slope = CheckedAdd(last.slope, dSlope);
        last.bias = ClampNonNegative(last.bias);
        last.slope = ClampNonNegative(last.slope);

        lastCheckpoint = ti;
        last.ts = ti;
        Power markerDelta = CheckedMul(blockSlope, Elapsed(initial.ts, ti)) / MARKER_SCALE;
        last.marker = initial.marker + static_cast<BlockHeight>(markerDelta);

        if (ti == now.time) {
            last.marker = now.height;
            break;
        }
        changes.globalPoints.push_back(last);
    }

    if (account) {
        last.slope = CheckedAdd(last.slope, CheckedSub(uNew.slope, uOld.slope));
        last.bias = CheckedAdd(last.bias, CheckedSub(uNew.bias, uOld.bias));
        last.slope = ClampNonNegative(last.slope);
        last.bias = ClampNonNegative(last.bias);
    }

    changes.globalPoints.push_back(last);

    if (account) {
        // Slope drops are scheduled at each lock's end: undo the old lock's
        // drop and register the new one
        if (oldLock.end > now.time) {
            oldDSlope = CheckedAdd(oldDSlope, uOld.slope);
            if (newLock.end == oldLock.end) {
                oldDSlope = CheckedSub(oldDSlope, uNew.slope);
            }
            changes.slopeWrites[oldLock.end] = oldDSlope;
        }

        if (newLock.end > now.time && newLock.end != oldLock.end) {
            newDSlope = CheckedSub(newDSlope, uNew.slope);
            changes.slopeWrites[newLock.end] = newDSlope;
        }

        changes.account = *account;
        changes.userPoint = uNew;
        changes.userPoint.ts = now.time;
        changes.userPoint.marker = now.height;
    }

    LOG_TRACE(util::LogCategory::CHECKPOINT)
        << "Checkpoint at " << now.time << ": " << changes.globalPoints.size()
        << " global point(s) from epoch " << epoch
        << ", bias=" << Int128ToString(last.bias)
        << ", slope=" << Int128ToString(last.slope);

    return changes;
}

Power CheckpointEngine::SupplyAt(const LedgerState& state, const Point& point, Timestamp t) const {
    if (t <= point.ts) {
        return point.ValueAt(t);
    }

    Point last = point;
    Timestamp ti = params_.FloorToUnit(last.ts);
    for (uint64_t i = 0;; ++i) {
        // Scheduled deltas only lower the slope; a flat curve stays flat
        if (last.slope == 0) {
            break;
        }
        if (i >= params_.maxSweepBuckets) {
            throw EscrowException(EscrowError::SWEEP_LIMIT_EXCEEDED,
                "supply query would cross more than " +
                std::to_string(params_.maxSweepBuckets) + " buckets");
        }

        ti = CheckedAdd(ti, params_.lockUnit);
        Power dSlope = 0;
        if (ti > t) {
            ti = t;
        } else {
            dSlope = state.GetSlopeChange(ti);
        }

        last.bias = CheckedSub(last.bias, CheckedMul(last.slope, Elapsed(last.ts, ti)));
        if (ti == t) {
            break;
        }
        last.slope = ClampNonNegative(CheckedAdd(last.slope, dSlope));
        last.ts = ti;
    }

    return ClampNonNegative(last.bias);
}

void ApplyChangeSet(LedgerState& state, const ChangeSet& changes) {
    state.globalHistory.insert(state.globalHistory.end(),
                               changes.globalPoints.begin(), changes.globalPoints.end());

    if (changes.account) {
        auto& history = state.userHistory[*changes.account];
        if (history.empty()) {
            history.emplace_back();
        }
        history.push_back(changes.userPoint);

        if (changes.newLock) {
            state.locks[*changes.account] = *changes.newLock;
        }
    }

    for (const auto& write : changes.slopeWrites) {
        state.slopeChanges[write.first] = write.second;
    }

    if (changes.newSupply) {
        state.supply = *changes.newSupply;
    }
}

} // namespace escrow
} // namespace vescrow
