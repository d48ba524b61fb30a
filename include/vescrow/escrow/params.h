// VESCROW - Escrow Parameters
// Copyright (c) 2024 VESCROW Developers
// MIT License
//
// Tunables of the vote-escrow ledger: the rounding unit for unlock times,
// the maximum lock duration and the sweep ceiling.

#ifndef VESCROW_ESCROW_PARAMS_H
#define VESCROW_ESCROW_PARAMS_H

#include "vescrow/core/types.h"
#include "vescrow/core/serialize.h"

#include <cstdint>
#include <optional>
#include <string>

namespace vescrow {

namespace util {
class ConfigManager;
}

namespace escrow {

// ============================================================================
// Constants
// ============================================================================

/// Unlock times are rounded down to whole weeks
constexpr Timestamp DEFAULT_LOCK_UNIT = 7 * 86400;

/// Four years (365-day years)
constexpr Timestamp DEFAULT_MAX_LOCK_DURATION = 4 * 365 * 86400;

/// About a century of weekly buckets
constexpr uint64_t DEFAULT_MAX_SWEEP_BUCKETS = 5218;

constexpr const char* DEFAULT_NAME = "Vote-escrowed Token";
constexpr const char* DEFAULT_SYMBOL = "veTOKEN";

// ============================================================================
// Parameters
// ============================================================================

struct EscrowParams {
    /// Rounding unit for unlock times and slope-change buckets (seconds)
    Timestamp lockUnit{DEFAULT_LOCK_UNIT};

    /// Longest permitted lock (seconds)
    Timestamp maxLockDuration{DEFAULT_MAX_LOCK_DURATION};

    /// Most buckets a single sweep may cross
    uint64_t maxSweepBuckets{DEFAULT_MAX_SWEEP_BUCKETS};

    /// Descriptive metadata, no effect on the ledger
    std::string name{DEFAULT_NAME};
    std::string symbol{DEFAULT_SYMBOL};

    /// Round a timestamp down to a whole lock unit
    Timestamp FloorToUnit(Timestamp t) const {
        return (t / lockUnit) * lockUnit;
    }

    /**
     * Check the parameters are usable. The sweep ceiling has to cover at
     * least one full lock duration so that queries over any live lock stay
     * under it.
     */
    bool IsValid(std::string* error = nullptr) const;

    bool operator==(const EscrowParams& other) const;
    bool operator!=(const EscrowParams& other) const { return !(*this == other); }

    std::string ToString() const;

    static EscrowParams Default() { return EscrowParams(); }

    /// Read [escrow] keys over the defaults; nullopt (with error) if invalid
    static std::optional<EscrowParams> FromConfig(const util::ConfigManager& config,
                                                  std::string* error = nullptr);

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::vescrow::Serialize(s, lockUnit);
        ::vescrow::Serialize(s, maxLockDuration);
        ::vescrow::Serialize(s, maxSweepBuckets);
        ::vescrow::Serialize(s, name);
        ::vescrow::Serialize(s, symbol);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::vescrow::Unserialize(s, lockUnit);
        ::vescrow::Unserialize(s, maxLockDuration);
        ::vescrow::Unserialize(s, maxSweepBuckets);
        ::vescrow::Unserialize(s, name);
        ::vescrow::Unserialize(s, symbol);
    }
};

} // namespace escrow

// Stream hooks so DataStream's << and >> find member serializers
template<typename Stream>
inline void Serialize(Stream& s, const escrow::EscrowParams& params) { params.Serialize(s); }

template<typename Stream>
inline void Unserialize(Stream& s, escrow::EscrowParams& params) { params.Unserialize(s); }

} // namespace vescrow

#endif // VESCROW_ESCROW_PARAMS_H
