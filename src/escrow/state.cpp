// VESCROW - Ledger State
// Copyright (c) 2024 VESCROW Developers
// MIT License

#include "vescrow/escrow/state.h"
#include "vescrow/core/serialize.h"
#include "vescrow/crypto/sha256.h"

#include <sstream>
#include <stdexcept>

namespace vescrow {
namespace escrow {

const char* LockStateToString(LockState state) {
    switch (state) {
        case LockState::NO_LOCK: return "NoLock";
        case LockState::ACTIVE:  return "Active";
        case LockState::EXPIRED: return "Expired";
        default:                 return "Unknown";
    }
}

LockState ClassifyLock(const LockedBalance& lock, Timestamp now) {
    if (lock.IsEmpty()) {
        return LockState::NO_LOCK;
    }
    return lock.end > now ? LockState::ACTIVE : LockState::EXPIRED;
}

void LedgerState::Seed(const BlockContext& genesis) {
    Clear();
    globalHistory.emplace_back(0, 0, genesis.time, genesis.height);
}

uint64_t LedgerState::Epoch() const {
    return globalHistory.empty() ? 0 : globalHistory.size() - 1;
}

uint64_t LedgerState::UserEpoch(const Address& account) const {
    auto it = userHistory.find(account);
    if (it == userHistory.end() || it->second.empty()) {
        return 0;
    }
    return it->second.size() - 1;
}

const Point& LedgerState::LatestGlobal() const {
    if (globalHistory.empty()) {
        throw std::logic_error("ledger state has no genesis point");
    }
    return globalHistory.back();
}

std::optional<Point> LedgerState::LatestUserPoint(const Address& account) const {
    auto it = userHistory.find(account);
    if (it == userHistory.end() || it->second.size() < 2) {
        return std::nullopt;
    }
    return it->second.back();
}

LockedBalance LedgerState::GetLock(const Address& account) const {
    auto it = locks.find(account);
    return it == locks.end() ? LockedBalance() : it->second;
}

Power LedgerState::GetSlopeChange(Timestamp ts) const {
    auto it = slopeChanges.find(ts);
    return it == slopeChanges.end() ? 0 : it->second;
}

const std::vector<Point>* LedgerState::GetUserHistory(const Address& account) const {
    auto it = userHistory.find(account);
    return it == userHistory.end() ? nullptr : &it->second;
}

void LedgerState::Clear() {
    globalHistory.clear();
    userHistory.clear();
    locks.clear();
    slopeChanges.clear();
    supply = 0;
}

Hash256 LedgerState::Digest() const {
    DataStream ss;
    Serialize(ss);
    return SHA256Hash(ss.data(), ss.size());
}

std::string LedgerState::ToString() const {
    std::ostringstream ss;
    ss << "LedgerState(epoch=" << Epoch()
       << ", accounts=" << locks.size()
       << ", schedule=" << slopeChanges.size()
       << ", supply=" << supply << ")";
    return ss.str();
}

bool LedgerState::operator==(const LedgerState& other) const {
    return globalHistory == other.globalHistory &&
           userHistory == other.userHistory &&
           locks == other.locks &&
           slopeChanges == other.slopeChanges &&
           supply == other.supply;
}

} // namespace escrow
} // namespace vescrow
