// VESCROW - Voting Power Points
// Copyright (c) 2024 VESCROW Developers
// MIT License

#include "vescrow/escrow/point.h"

#include <sstream>

namespace vescrow {
namespace escrow {

Power Point::ValueAt(Timestamp t) const {
    Power elapsed = static_cast<Power>(t) - static_cast<Power>(ts);
    // Past the zero crossing the product may not fit, but the answer is 0
    if (slope > 0 && elapsed > 0 && elapsed > bias / slope) {
        return 0;
    }
    Power value = CheckedSub(bias, CheckedMul(slope, elapsed));
    return ClampNonNegative(value);
}

std::string Point::ToString() const {
    std::ostringstream ss;
    ss << "Point(bias=" << Int128ToString(bias)
       << ", slope=" << Int128ToString(slope)
       << ", ts=" << ts
       << ", marker=" << marker << ")";
    return ss.str();
}

std::string LockedBalance::ToString() const {
    std::ostringstream ss;
    ss << "LockedBalance(amount=" << amount << ", end=" << end << ")";
    return ss.str();
}

Power SlopeFor(Amount amount, Timestamp maxLockDuration) {
    if (maxLockDuration <= 0) {
        throw ArithmeticError("non-positive lock duration");
    }
    return CheckedMul(static_cast<Power>(amount), POWER_SCALE) /
           static_cast<Power>(maxLockDuration);
}

Point CurveFor(const LockedBalance& lock, Timestamp now, Timestamp maxLockDuration) {
    Point curve;
    curve.ts = now;
    if (lock.amount > 0 && lock.end > now) {
        curve.slope = SlopeFor(lock.amount, maxLockDuration);
        Power remaining = static_cast<Power>(lock.end) - static_cast<Power>(now);
        curve.bias = CheckedMul(curve.slope, remaining);
    }
    return curve;
}

std::string FormatPower(Power raw) {
    bool negative = raw < 0;
    Power magnitude = negative ? CheckedSub(static_cast<Power>(0), raw) : raw;
    Power whole = magnitude / POWER_SCALE;
    Power frac = magnitude % POWER_SCALE;

    std::string result = negative ? "-" : "";
    result += Int128ToString(whole);
    if (frac != 0) {
        std::string digits = Int128ToString(frac);
        // Left-pad to 18 digits, then drop trailing zeros
        digits.insert(0, 18 - digits.size(), '0');
        while (!digits.empty() && digits.back() == '0') {
            digits.pop_back();
        }
        result += "." + digits;
    }
    return result;
}

} // namespace escrow
} // namespace vescrow
