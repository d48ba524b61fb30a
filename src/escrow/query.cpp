// VESCROW - Voting Power Queries
// Copyright (c) 2024 VESCROW Developers
// MIT License

#include "vescrow/escrow/query.h"
#include "vescrow/core/arith.h"
#include "vescrow/util/logging.h"

#include <algorithm>

namespace vescrow {
namespace escrow {

namespace {

template<typename KeyFn, typename Key>
uint64_t FindLast(const std::vector<Point>& history, uint64_t lo, uint64_t hi,
                  KeyFn key, Key target) {
    for (int i = 0; i < MAX_SEARCH_ITERATIONS && lo < hi; ++i) {
        // Round up so lo always advances
        uint64_t mid = lo + (hi - lo + 1) / 2;
        if (key(history[mid]) <= target) {
            lo = mid;
        } else {
            hi = mid - 1;
        }
    }
    return lo;
}

} // namespace

QueryEngine::QueryEngine(const EscrowParams& params) : engine_(params) {}

uint64_t QueryEngine::FindByMarker(const std::vector<Point>& history, BlockHeight marker,
                                   uint64_t lo, uint64_t hi) {
    if (history.empty()) {
        return 0;
    }
    hi = std::min<uint64_t>(hi, history.size() - 1);
    return FindLast(history, lo, hi, [](const Point& p) { return p.marker; }, marker);
}

uint64_t QueryEngine::FindByTime(const std::vector<Point>& history, Timestamp t,
                                 uint64_t lo, uint64_t hi) {
    if (history.empty()) {
        return 0;
    }
    hi = std::min<uint64_t>(hi, history.size() - 1);
    return FindLast(history, lo, hi, [](const Point& p) { return p.ts; }, t);
}

Power QueryEngine::PowerOf(const LedgerState& state, const Address& account, Timestamp t) const {
    const std::vector<Point>* history = state.GetUserHistory(account);
    if (!history || history->size() < 2) {
        return 0;
    }

    const Point& latest = history->back();
    if (t >= latest.ts) {
        return latest.ValueAt(t);
    }

    uint64_t idx = FindByTime(*history, t, 0, history->size() - 1);
    if (idx == 0) {
        return 0;
    }
    return (*history)[idx].ValueAt(t);
}

std::optional<Power> QueryEngine::PowerOfAt(const LedgerState& state, const Address& account,
                                            BlockHeight marker, const BlockContext& now) const {
    if (marker > now.height) {
        return std::nullopt;
    }

    const std::vector<Point>* history = state.GetUserHistory(account);
    if (!history || history->size() < 2 || !state.IsSeeded()) {
        return Power(0);
    }
    if (marker < state.globalHistory.front().marker) {
        return Power(0);
    }

    uint64_t userIdx = FindByMarker(*history, marker, 0, history->size() - 1);
    if (userIdx == 0) {
        return Power(0);
    }
    const Point& upoint = (*history)[userIdx];

    uint64_t epoch = FindByMarker(state.globalHistory, marker, 0, state.Epoch());
    Timestamp blockTime = EstimateTime(state, epoch, marker, now);

    // Interpolation can land before the account point itself; never grow
    // power backwards from it
    blockTime = std::max(blockTime, upoint.ts);

    Power power = upoint.ValueAt(blockTime);
    LOG_TRACE(util::LogCategory::QUERY)
        << "PowerOfAt " << account.ToHex() << " marker=" << marker
        << " epoch=" << epoch << " time=" << blockTime
        << " power=" << Int128ToString(power);
    return power;
}

Power QueryEngine::TotalPower(const LedgerState& state, Timestamp t) const {
    if (!state.IsSeeded()) {
        return 0;
    }

    const Point& latest = state.LatestGlobal();
    if (t >= latest.ts) {
        return engine_.SupplyAt(state, latest, t);
    }

    if (t < state.globalHistory.front().ts) {
        return 0;
    }
    uint64_t epoch = FindByTime(state.globalHistory, t, 0, state.Epoch());
    return engine_.SupplyAt(state, state.globalHistory[epoch], t);
}

std::optional<Power> QueryEngine::TotalPowerAt(const LedgerState& state, BlockHeight marker,
                                               const BlockContext& now) const {
    if (marker > now.height) {
        return std::nullopt;
    }
    if (!state.IsSeeded() || marker < state.globalHistory.front().marker) {
        return Power(0);
    }

    uint64_t epoch = FindByMarker(state.globalHistory, marker, 0, state.Epoch());
    const Point& point = state.globalHistory[epoch];
    Timestamp t = EstimateTime(state, epoch, marker, now);

    return engine_.SupplyAt(state, point, t);
}

Timestamp QueryEngine::EstimateTime(const LedgerState& state, uint64_t epoch,
                                    BlockHeight marker, const BlockContext& now) const {
    const Point& point = state.globalHistory[epoch];

    BlockHeight nextMarker = now.height;
    Timestamp nextTime = now.time;
    if (epoch < state.Epoch()) {
        const Point& next = state.globalHistory[epoch + 1];
        nextMarker = next.marker;
        nextTime = next.ts;
    }

    if (nextMarker <= point.marker || marker <= point.marker) {
        return point.ts;
    }

    Power dMarker = static_cast<Power>(nextMarker) - static_cast<Power>(point.marker);
    Power dTime = static_cast<Power>(nextTime) - static_cast<Power>(point.ts);
    Power offset = static_cast<Power>(marker) - static_cast<Power>(point.marker);

    return point.ts + NarrowToInt64(CheckedMul(dTime, offset) / dMarker);
}

} // namespace escrow
} // namespace vescrow
