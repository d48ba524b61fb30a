// VESCROW - Escrow Parameters
// Copyright (c) 2024 VESCROW Developers
// MIT License

#include "vescrow/escrow/params.h"
#include "vescrow/util/config.h"
#include "vescrow/util/logging.h"

#include <sstream>

namespace vescrow {
namespace escrow {

bool EscrowParams::IsValid(std::string* error) const {
    auto fail = [error](const std::string& msg) {
        if (error) {
            *error = msg;
        }
        return false;
    };

    if (lockUnit <= 0) {
        return fail("lockunit must be positive");
    }
    if (maxLockDuration < lockUnit) {
        return fail("maxlockduration must be at least one lockunit");
    }
    if (maxSweepBuckets == 0) {
        return fail("maxsweepbuckets must be positive");
    }
    // +1: a lock created mid-bucket can reach into one extra boundary
    uint64_t bucketsPerLock = static_cast<uint64_t>(maxLockDuration / lockUnit) + 1;
    if (maxSweepBuckets < bucketsPerLock) {
        return fail("maxsweepbuckets must cover maxlockduration (need at least " +
                    std::to_string(bucketsPerLock) + ")");
    }
    return true;
}

bool EscrowParams::operator==(const EscrowParams& other) const {
    return lockUnit == other.lockUnit &&
           maxLockDuration == other.maxLockDuration &&
           maxSweepBuckets == other.maxSweepBuckets &&
           name == other.name &&
           symbol == other.symbol;
}

std::string EscrowParams::ToString() const {
    std::ostringstream ss;
    ss << "EscrowParams(" << name << " [" << symbol << "]"
       << ", unit=" << lockUnit
       << ", maxlock=" << maxLockDuration
       << ", maxbuckets=" << maxSweepBuckets << ")";
    return ss.str();
}

std::optional<EscrowParams> EscrowParams::FromConfig(const util::ConfigManager& config,
                                                     std::string* error) {
    namespace keys = util::ConfigKeys;
    const std::string section = keys::ESCROW_SECTION;

    EscrowParams params;

    // Present-but-malformed integers are errors, not silent defaults
    auto readInt = [&](const char* key, int64_t& out) -> bool {
        if (!config.HasKey(key, section)) {
            return true;
        }
        auto value = config.TryGetInt(key, section);
        if (!value) {
            if (error) {
                *error = std::string("invalid integer for ") + section + "." + key;
            }
            return false;
        }
        out = *value;
        return true;
    };

    int64_t unit = params.lockUnit;
    int64_t maxLock = params.maxLockDuration;
    int64_t buckets = static_cast<int64_t>(params.maxSweepBuckets);

    if (!readInt(keys::LOCKUNIT, unit) ||
        !readInt(keys::MAXLOCKDURATION, maxLock) ||
        !readInt(keys::MAXSWEEPBUCKETS, buckets)) {
        return std::nullopt;
    }

    if (buckets <= 0) {
        if (error) {
            *error = "maxsweepbuckets must be positive";
        }
        return std::nullopt;
    }

    params.lockUnit = unit;
    params.maxLockDuration = maxLock;
    params.maxSweepBuckets = static_cast<uint64_t>(buckets);
    params.name = config.GetString(keys::NAME, params.name, section);
    params.symbol = config.GetString(keys::SYMBOL, params.symbol, section);

    if (!params.IsValid(error)) {
        return std::nullopt;
    }

    LOG_DEBUG(util::LogCategory::CONFIG) << "Loaded " << params.ToString();
    return params;
}

} // namespace escrow
} // namespace vescrow
