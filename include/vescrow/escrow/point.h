// VESCROW - Voting Power Points
// Copyright (c) 2024 VESCROW Developers
// MIT License
//
// A Point captures a linear voting-power curve: bias at timestamp ts,
// decaying by slope per second. Bias and slope are fixed-point values
// scaled by POWER_SCALE.

#ifndef VESCROW_ESCROW_POINT_H
#define VESCROW_ESCROW_POINT_H

#include "vescrow/core/types.h"
#include "vescrow/core/arith.h"
#include "vescrow/core/serialize.h"

#include <string>

namespace vescrow {
namespace escrow {

// ============================================================================
// Fixed-Point Scaling
// ============================================================================

/// Voting power in raw fixed-point units
using Power = int128;

/// Raw units per base unit of voting power
constexpr Power POWER_SCALE = static_cast<Power>(1000000000000000000LL);

/// Scale of the marker-per-second rate used for marker interpolation
constexpr Power MARKER_SCALE = static_cast<Power>(1000000000000000000LL);

// ============================================================================
// Point
// ============================================================================

struct Point {
    Power bias{0};
    Power slope{0};
    Timestamp ts{0};
    BlockHeight marker{0};

    Point() = default;
    Point(Power biasIn, Power slopeIn, Timestamp tsIn, BlockHeight markerIn)
        : bias(biasIn), slope(slopeIn), ts(tsIn), marker(markerIn) {}

    /// Extrapolated power at t, clamped at zero. t may precede ts.
    Power ValueAt(Timestamp t) const;

    bool operator==(const Point& other) const {
        return bias == other.bias && slope == other.slope &&
               ts == other.ts && marker == other.marker;
    }
    bool operator!=(const Point& other) const { return !(*this == other); }

    std::string ToString() const;

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::vescrow::Serialize(s, bias);
        ::vescrow::Serialize(s, slope);
        ::vescrow::Serialize(s, ts);
        ::vescrow::Serialize(s, marker);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::vescrow::Unserialize(s, bias);
        ::vescrow::Unserialize(s, slope);
        ::vescrow::Unserialize(s, ts);
        ::vescrow::Unserialize(s, marker);
    }
};

// ============================================================================
// Locked Balance
// ============================================================================

/// An account's lock; amount == 0 or end == 0 means no lock
struct LockedBalance {
    Amount amount{0};
    Timestamp end{0};

    LockedBalance() = default;
    LockedBalance(Amount amountIn, Timestamp endIn) : amount(amountIn), end(endIn) {}

    bool IsEmpty() const { return amount == 0 || end == 0; }

    /// Holds tokens and has not reached its end
    bool IsActive(Timestamp now) const { return !IsEmpty() && end > now; }

    bool operator==(const LockedBalance& other) const {
        return amount == other.amount && end == other.end;
    }
    bool operator!=(const LockedBalance& other) const { return !(*this == other); }

    std::string ToString() const;

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::vescrow::Serialize(s, amount);
        ::vescrow::Serialize(s, end);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::vescrow::Unserialize(s, amount);
        ::vescrow::Unserialize(s, end);
    }
};

// ============================================================================
// Curve Math
// ============================================================================

/// Decay rate of a lock: amount * POWER_SCALE / maxLockDuration (truncating)
Power SlopeFor(Amount amount, Timestamp maxLockDuration);

/**
 * Curve of a lock as seen at time now. Zero when the lock is empty or has
 * ended; otherwise slope from SlopeFor and bias = slope * (end - now).
 * The returned point carries ts = now and marker 0.
 */
Point CurveFor(const LockedBalance& lock, Timestamp now, Timestamp maxLockDuration);

/// Whole base units of a raw power value ("1000" or "999.999999999999999999")
std::string FormatPower(Power raw);

} // namespace escrow

template<typename Stream>
inline void Serialize(Stream& s, const escrow::Point& p) { p.Serialize(s); }

template<typename Stream>
inline void Unserialize(Stream& s, escrow::Point& p) { p.Unserialize(s); }

template<typename Stream>
inline void Serialize(Stream& s, const escrow::LockedBalance& l) { l.Serialize(s); }

template<typename Stream>
inline void Unserialize(Stream& s, escrow::LockedBalance& l) { l.Unserialize(s); }

} // namespace vescrow

#endif // VESCROW_ESCROW_POINT_H
