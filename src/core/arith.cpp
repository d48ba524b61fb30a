// VESCROW - Checked Arithmetic Implementation
// Copyright (c) 2024 VESCROW Developers
// MIT License

#include "vescrow/core/arith.h"

#include <algorithm>
#include <limits>

namespace vescrow {

bool AddNoOverflow(int64_t a, int64_t b, int64_t& result) {
    // Widen to 128 bits so the sum itself cannot overflow
    int128 sum = static_cast<int128>(a) + static_cast<int128>(b);

    if (sum < std::numeric_limits<int64_t>::min() ||
        sum > std::numeric_limits<int64_t>::max()) {
        return false;
    }

    result = static_cast<int64_t>(sum);
    return true;
}

int64_t NarrowToInt64(int128 value) {
    if (value < std::numeric_limits<int64_t>::min() ||
        value > std::numeric_limits<int64_t>::max()) {
        throw ArithmeticError("value out of int64 range: " + Int128ToString(value));
    }
    return static_cast<int64_t>(value);
}

std::string Int128ToString(int128 value) {
    if (value == 0) {
        return "0";
    }

    bool negative = value < 0;
    // Work on the unsigned magnitude so MIN does not overflow on negation
    unsigned __int128 magnitude = negative
        ? static_cast<unsigned __int128>(-(value + 1)) + 1
        : static_cast<unsigned __int128>(value);

    std::string digits;
    while (magnitude > 0) {
        digits.push_back(static_cast<char>('0' + static_cast<int>(magnitude % 10)));
        magnitude /= 10;
    }
    if (negative) {
        digits.push_back('-');
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

bool ParseInt128(const std::string& str, int128& out) {
    if (str.empty()) {
        return false;
    }

    size_t pos = 0;
    bool negative = false;
    if (str[0] == '-' || str[0] == '+') {
        negative = str[0] == '-';
        pos = 1;
    }
    if (pos >= str.size()) {
        return false;
    }

    int128 value = 0;
    for (; pos < str.size(); ++pos) {
        char c = str[pos];
        if (c < '0' || c > '9') {
            return false;
        }
        int128 digit = c - '0';
        if (__builtin_mul_overflow(value, static_cast<int128>(10), &value) ||
            __builtin_add_overflow(value, negative ? -digit : digit, &value)) {
            return false;
        }
    }

    out = value;
    return true;
}

} // namespace vescrow
