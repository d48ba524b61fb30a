// VESCROW - Checked Arithmetic
// Copyright (c) 2024 VESCROW Developers
// MIT License
//
// Overflow-checked integer arithmetic for amounts, timestamps and the
// 128-bit fixed-point values used by the escrow curve math.
// Operations never wrap: an overflow throws ArithmeticError.

#ifndef VESCROW_CORE_ARITH_H
#define VESCROW_CORE_ARITH_H

#include <cstdint>
#include <stdexcept>
#include <string>

namespace vescrow {

/// Signed 128-bit integer used for fixed-point values
using int128 = __int128;

/// Thrown when a checked operation would overflow or divide by zero
class ArithmeticError : public std::overflow_error {
public:
    explicit ArithmeticError(const std::string& what) : std::overflow_error(what) {}
};

template<typename T>
inline T CheckedAdd(T a, T b) {
    T result;
    if (__builtin_add_overflow(a, b, &result)) {
        throw ArithmeticError("addition overflow");
    }
    return result;
}

template<typename T>
inline T CheckedSub(T a, T b) {
    T result;
    if (__builtin_sub_overflow(a, b, &result)) {
        throw ArithmeticError("subtraction overflow");
    }
    return result;
}

template<typename T>
inline T CheckedMul(T a, T b) {
    T result;
    if (__builtin_mul_overflow(a, b, &result)) {
        throw ArithmeticError("multiplication overflow");
    }
    return result;
}

template<typename T>
inline T CheckedDiv(T a, T b) {
    if (b == 0) {
        throw ArithmeticError("division by zero");
    }
    // MIN / -1 is the only signed division that overflows
    if (b == static_cast<T>(-1)) {
        return CheckedSub(static_cast<T>(0), a);
    }
    return a / b;
}

/// Clamp a value at zero from below
template<typename T>
inline T ClampNonNegative(T value) {
    return value < 0 ? static_cast<T>(0) : value;
}

/// Overflow-safe amount addition; returns false instead of throwing
bool AddNoOverflow(int64_t a, int64_t b, int64_t& result);

/// Narrow a 128-bit value to int64, throwing when out of range
int64_t NarrowToInt64(int128 value);

/// Decimal representation of a 128-bit value
std::string Int128ToString(int128 value);

/// Parse a decimal 128-bit value; returns false on malformed input
bool ParseInt128(const std::string& str, int128& out);

} // namespace vescrow

#endif // VESCROW_CORE_ARITH_H
