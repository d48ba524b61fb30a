// VESCROW - Escrow Collaborators
// Copyright (c) 2024 VESCROW Developers
// MIT License

#include "vescrow/escrow/interfaces.h"
#include "vescrow/core/arith.h"
#include "vescrow/util/time.h"

#include <stdexcept>

namespace vescrow {
namespace escrow {

// ============================================================================
// ManualChainClock
// ============================================================================

ManualChainClock::ManualChainClock(BlockContext start) : now_(start) {}

BlockContext ManualChainClock::Now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
}

void ManualChainClock::Set(const BlockContext& now) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ = now;
}

void ManualChainClock::Advance(Timestamp seconds, BlockHeight blocks) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_.time = CheckedAdd(now_.time, seconds);
    now_.height = CheckedAdd(now_.height, blocks);
}

// ============================================================================
// SystemChainClock
// ============================================================================

SystemChainClock::SystemChainClock(Timestamp genesisTime, Timestamp blockInterval)
    : genesisTime_(genesisTime), blockInterval_(blockInterval) {
    if (blockInterval_ <= 0) {
        throw std::invalid_argument("block interval must be positive");
    }
}

BlockContext SystemChainClock::Now() const {
    Timestamp now = util::GetTime();
    BlockHeight height = 0;
    if (now > genesisTime_) {
        height = static_cast<BlockHeight>((now - genesisTime_) / blockInterval_);
    }
    return BlockContext(now, height);
}

// ============================================================================
// StaticContractChecker
// ============================================================================

StaticContractChecker::StaticContractChecker(std::set<Address> allowed)
    : allowed_(std::move(allowed)) {}

bool StaticContractChecker::IsAllowed(const Address& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return allowed_.count(account) > 0;
}

void StaticContractChecker::Allow(const Address& account) {
    std::lock_guard<std::mutex> lock(mutex_);
    allowed_.insert(account);
}

void StaticContractChecker::Revoke(const Address& account) {
    std::lock_guard<std::mutex> lock(mutex_);
    allowed_.erase(account);
}

// ============================================================================
// InMemoryAssetMover
// ============================================================================

bool InMemoryAssetMover::MoveIn(const Address& from, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (amount < 0) {
        return false;
    }
    auto it = balances_.find(from);
    if (it == balances_.end() || it->second < amount) {
        return false;
    }
    Amount escrowed;
    if (!AddNoOverflow(escrowed_, amount, escrowed)) {
        return false;
    }
    it->second -= amount;
    escrowed_ = escrowed;
    return true;
}

bool InMemoryAssetMover::MoveOut(const Address& to, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (amount < 0 || escrowed_ < amount) {
        return false;
    }
    Amount balance;
    if (!AddNoOverflow(balances_[to], amount, balance)) {
        return false;
    }
    balances_[to] = balance;
    escrowed_ -= amount;
    return true;
}

bool InMemoryAssetMover::Credit(const Address& account, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (amount < 0) {
        return false;
    }
    Amount balance;
    if (!AddNoOverflow(balances_[account], amount, balance)) {
        return false;
    }
    balances_[account] = balance;
    return true;
}

Amount InMemoryAssetMover::BalanceOf(const Address& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(account);
    return it == balances_.end() ? 0 : it->second;
}

Amount InMemoryAssetMover::Escrowed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return escrowed_;
}

} // namespace escrow
} // namespace vescrow
